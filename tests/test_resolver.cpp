/*
 * hPerms - A permission resolution engine.
 * Copyright (C) 2012-2013	Jacob Zhitomirsky (BizarreCake)
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <catch2/catch.hpp>
#include "test.hpp"
#include "resolver/resolver.hpp"
#include "registry/aliases.hpp"
#include "registry/permission_registry.hpp"
#include <stdexcept>

using namespace hPerms;


static const uuid_t TEST_UUID = uuid_t::parse ("00000000-0000-0000-0000-0000000000aa");


SCENARIO ("Group weight decides between conflicting groups", "[resolver]") {
	test_groups groups;
	permission_resolver resolver {groups.loader ()};
	
	GIVEN ("a user in a low and a high weight group that disagree") {
		groups.add ("default", 0).add_node (node ("build.place", false));
		groups.add ("builder", 10).add_node (node ("build.place", true));
		
		user usr {TEST_UUID, "Alex"};
		usr.add_group ("builder");
		
		THEN ("the heavier group wins") {
			REQUIRE (resolver.check (usr, "build.place", context_set::empty ()) == TS_TRUE);
			
			resolved_permissions res = resolver.resolve (usr, context_set::empty ());
			std::string source;
			REQUIRE (res.find_source ("build.place", source));
			REQUIRE (source == "builder");
		}
		
		WHEN ("the user sets the permission directly") {
			usr.add_node (node ("build.place", false));
			
			THEN ("the user's own node overrides every group") {
				REQUIRE (resolver.check (usr, "build.place", context_set::empty ()) == TS_FALSE);
				
				permission_trace trace = resolver.check_with_trace (usr, "build.place",
					context_set::empty ());
				REQUIRE (trace.is_from_user ());
				REQUIRE (trace.get_source_description () == "user");
			}
		}
		
		THEN ("a group-sourced trace names the group") {
			permission_trace trace = resolver.check_with_trace (usr, "build.place",
				context_set::empty ());
			REQUIRE_FALSE (trace.is_from_user ());
			REQUIRE (trace.get_source_group () == "builder");
			REQUIRE (trace.get_match_type () == MT_EXACT);
		}
	}
	
	GIVEN ("a negation in a light group and a grant in a heavier one") {
		groups.add ("default");
		groups.add ("a", 1).add_node (node ("-x"));
		groups.add ("b", 5).add_node (node ("x"));
		
		user usr {TEST_UUID};
		usr.add_group ("b");
		usr.add_group ("a");
		
		THEN ("the heavier group's grant overwrites the negation") {
			resolved_permissions res = resolver.resolve (usr, context_set::empty ());
			REQUIRE (res.get_permissions ().at ("x") == true);
			REQUIRE (res.check ("x") == TS_TRUE);
		}
	}
	
	GIVEN ("a negated node in a heavier group") {
		groups.add ("default", 0).add_node (node ("chat.color"));
		groups.add ("muted", 20).add_node (node ("-chat.color"));
		
		user usr {TEST_UUID};
		usr.add_group ("muted");
		
		THEN ("it is stored as the base permission with the opposite value") {
			resolved_permissions res = resolver.resolve (usr, context_set::empty ());
			REQUIRE (res.get_permissions ().at ("chat.color") == false);
			REQUIRE (res.get_permissions ().count ("-chat.color") == 0);
			REQUIRE (res.get_denied_permissions () == std::set<std::string> {"chat.color"});
			REQUIRE_FALSE (res.has_permission ("chat.color"));
		}
	}
}


SCENARIO ("A negated universal wildcard does not override exact nodes", "[resolver]") {
	test_groups groups;
	permission_resolver resolver {groups.loader ()};
	groups.add ("default").add_node (node ("-*"));
	
	GIVEN ("a user with a direct grant") {
		user usr {TEST_UUID};
		usr.add_node (node ("chat.send"));
		
		THEN ("the direct grant applies") {
			resolved_permissions res = resolver.resolve (usr, context_set::empty ());
			REQUIRE (res.get_permissions ().at ("*") == false);
			REQUIRE (res.check ("chat.send") == TS_TRUE);
			REQUIRE (res.check ("chat.color") == TS_UNDEFINED);
		}
	}
}


SCENARIO ("Context-restricted nodes", "[resolver]") {
	test_groups groups;
	permission_resolver resolver {groups.loader ()};
	groups.add ("default");
	
	GIVEN ("a user with fly granted only in the nether") {
		user usr {TEST_UUID};
		usr.add_node (node ("fly").with_contexts (context_set::of ("world", "nether")));
		
		THEN ("fly is granted in the nether") {
			REQUIRE (resolver.check (usr, "fly", context_set::of ("world", "nether")) == TS_TRUE);
			REQUIRE (resolver.check (usr, "fly",
				context_set::of ({{"world", "nether"}, {"gamemode", "survival"}})) == TS_TRUE);
		}
		
		THEN ("fly is undefined elsewhere") {
			REQUIRE (resolver.check (usr, "fly", context_set::of ("world", "overworld")) == TS_UNDEFINED);
			REQUIRE (resolver.check (usr, "fly", context_set::empty ()) == TS_UNDEFINED);
			REQUIRE_FALSE (resolver.has_permission (usr, "fly", context_set::empty ()));
		}
	}
	
	GIVEN ("expired nodes") {
		user usr {TEST_UUID};
		usr.add_node (node ("old", true, context_set (), 1));
		
		THEN ("they are ignored") {
			REQUIRE (resolver.check (usr, "old", context_set::empty ()) == TS_UNDEFINED);
		}
	}
}


SCENARIO ("Resolution is deterministic", "[resolver]") {
	test_groups groups;
	permission_resolver resolver {groups.loader ()};
	
	GIVEN ("groups of equal weight that disagree") {
		groups.add ("default");
		groups.add ("alpha").add_node (node ("shared", true));
		groups.add ("beta").add_node (node ("shared", false));
		
		user usr {TEST_UUID};
		usr.add_group ("beta");
		usr.add_group ("alpha");
		
		THEN ("repeated resolutions yield identical results") {
			resolved_permissions first = resolver.resolve (usr, context_set::empty ());
			for (int i = 0; i < 10; ++i)
				REQUIRE (resolver.resolve (usr, context_set::empty ()) == first);
			
			// groups start out in name order: beta is applied last.
			REQUIRE (first.check ("shared") == TS_FALSE);
		}
	}
}


SCENARIO ("Group-only resolution", "[resolver]") {
	test_groups groups;
	permission_resolver resolver {groups.loader ()};
	
	groups.add ("default").add_node (node ("chat"));
	group& mod = groups.add ("moderator", 10);
	mod.add_parent ("default");
	mod.add_node (node ("kick"));
	
	THEN ("a group resolves with its ancestry") {
		resolved_permissions res = resolver.resolve_group (mod, context_set::empty ());
		REQUIRE (res.size () == 2);
		REQUIRE (res.has_permission ("chat"));
		REQUIRE (res.has_permission ("kick"));
		REQUIRE (res.get_granted_permissions () == std::set<std::string> {"chat", "kick"});
	}
	
	THEN ("empty permissions are undefined") {
		resolved_permissions res = resolver.resolve_group (mod, context_set::empty ());
		REQUIRE (res.check ("") == TS_UNDEFINED);
		REQUIRE_FALSE (res.check_with_trace ("").is_matched ());
	}
	
	THEN ("an empty loader is rejected") {
		REQUIRE_THROWS_AS (permission_resolver (group_loader ()), std::invalid_argument);
	}
}


SCENARIO ("Aliases and wildcard expansion", "[resolver]") {
	test_groups groups;
	permission_aliases aliases;
	aliases.add ("fly", "essentials.fly");
	aliases.add ("build", std::vector<std::string> {"build.place", "build.break"});
	
	permission_resolver resolver {groups.loader (), &aliases};
	groups.add ("default");
	
	GIVEN ("a user granted the simplified name") {
		user usr {TEST_UUID};
		usr.add_node (node ("fly"));
		
		THEN ("the actual permission is granted too") {
			resolved_permissions res = resolver.resolve (usr, context_set::empty ());
			REQUIRE (res.check ("essentials.fly") == TS_TRUE);
			REQUIRE (res.check_with_trace ("essentials.fly").get_matched_node () == "fly");
		}
	}
	
	GIVEN ("a user granted an actual permission") {
		user usr {TEST_UUID};
		usr.add_node (node ("build.break"));
		
		THEN ("the simplified name resolves through it") {
			REQUIRE (resolver.check (usr, "build", context_set::empty ()) == TS_TRUE);
			REQUIRE (resolver.check (usr, "build.place", context_set::empty ()) == TS_UNDEFINED);
		}
	}
	
	GIVEN ("a registry of known permissions") {
		permission_registry registry;
		registry.add ("build.place", "Place blocks", "build");
		registry.add ("build.break", "Break blocks", "build");
		registry.add ("chat.color", "Colored chat", "chat");
		
		user usr {TEST_UUID};
		usr.add_node (node ("build.*"));
		usr.add_node (node ("fly"));
		usr.add_node (node ("chat.color", false));
		
		THEN ("granted wildcards and aliases are expanded") {
			std::set<std::string> expanded = resolver.resolve (usr, context_set::empty ())
				.get_expanded_permissions (registry);
			REQUIRE (expanded == std::set<std::string> {
				"build.*", "build.place", "build.break", "fly", "essentials.fly"});
		}
	}
}
