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
#include "permissions/group.hpp"
#include "permissions/user.hpp"
#include <stdexcept>

using namespace hPerms;


SCENARIO ("Permission holders manage their node lists", "[holder]") {
	GIVEN ("an empty group") {
		group grp {"Builders", 10};
		
		THEN ("its name is lowercased and display name defaults to it") {
			REQUIRE (grp.get_name () == "builders");
			REQUIRE (grp.get_display_name () == "builders");
			grp.set_display_name ("Builders");
			REQUIRE (grp.get_friendly_name () == "Builders");
			grp.set_display_name ("");
			REQUIRE (grp.get_display_name () == "builders");
		}
		
		WHEN ("the same node is added twice") {
			REQUIRE (grp.add_node (node ("build.place")) == MUTATE_SUCCESS);
			REQUIRE (grp.add_node (node ("build.place")) == MUTATE_ALREADY_EXISTS);
			
			THEN ("it is stored once") {
				REQUIRE (grp.get_nodes ().size () == 1);
				REQUIRE (grp.has_node (node ("build.place")));
			}
		}
		
		WHEN ("set_node replaces a node that differs only in expiry") {
			grp.add_node (node ("fly", true, context_set (), 1000));
			grp.add_node (node ("walk"));
			REQUIRE (grp.set_node (node ("fly")) == MUTATE_SUCCESS);
			
			THEN ("the old node is gone and the new one is last") {
				REQUIRE (grp.get_nodes ().size () == 2);
				REQUIRE (grp.get_nodes ().back () == node ("fly"));
			}
		}
		
		WHEN ("nodes are removed by permission") {
			grp.add_node (node ("chat", true));
			grp.add_node (node ("chat", false));
			grp.add_node (node ("other"));
			
			THEN ("every node with that permission goes") {
				REQUIRE (grp.remove_node ("CHAT") == MUTATE_SUCCESS);
				REQUIRE (grp.get_nodes ().size () == 1);
				REQUIRE (grp.remove_node ("chat") == MUTATE_DOES_NOT_EXIST);
				REQUIRE (grp.remove_node (node ("missing")) == MUTATE_DOES_NOT_EXIST);
			}
		}
		
		WHEN ("nodes are cleared by context") {
			context_set nether = context_set::of ("world", "nether");
			grp.add_node (node ("a").with_contexts (nether));
			grp.add_node (node ("b"));
			grp.clear_nodes (nether);
			
			THEN ("only nodes with exactly those contexts are removed") {
				REQUIRE (grp.get_nodes ().size () == 1);
				REQUIRE (grp.get_nodes (nether).size () == 1);
				grp.clear_nodes ();
				REQUIRE (grp.get_nodes ().empty ());
			}
		}
		
		WHEN ("expired nodes are cleaned up") {
			grp.add_node (node ("old", true, context_set (), 100));
			grp.add_node (node ("new", true, context_set (), 5000));
			grp.add_node (node ("forever"));
			
			THEN ("only the expired ones are removed") {
				REQUIRE (grp.cleanup_expired (1000) == 1);
				REQUIRE (grp.get_nodes ().size () == 2);
			}
		}
		
		WHEN ("parents are added") {
			grp.add_parent ("Default");
			grp.add_parent ("member");
			grp.add_node (node::group_node ("temp", context_set (), 100));
			grp.add_node (node::group_node ("nether", context_set::of ("world", "nether")));
			
			THEN ("they are listed in declaration order, skipping expired ones") {
				std::vector<std::string> parents = grp.get_parents ();
				REQUIRE (parents.size () == 3);
				REQUIRE (parents[0] == "default");
				REQUIRE (parents[1] == "member");
				REQUIRE (parents[2] == "nether");
			}
			
			THEN ("context-restricted parents are filtered") {
				REQUIRE (grp.get_parents (context_set::empty ()).size () == 2);
				REQUIRE (grp.get_parents (context_set::of ("world", "nether")).size () == 3);
			}
			
			THEN ("remove_parent drops the link") {
				REQUIRE (grp.remove_parent ("DEFAULT") == MUTATE_SUCCESS);
				REQUIRE (grp.get_parents ().size () == 2);
			}
		}
	}
	
	WHEN ("a group is created with an empty name") {
		THEN ("std::invalid_argument is thrown") {
			REQUIRE_THROWS_AS (group (""), std::invalid_argument);
		}
	}
}


SCENARIO ("Users always inherit their primary group", "[holder]") {
	GIVEN ("a new user") {
		user usr {uuid_t::parse ("00000000-0000-0000-0000-000000000001"), "Steve"};
		
		THEN ("the primary group is the default group") {
			REQUIRE (usr.get_primary_group () == "default");
			REQUIRE (usr.get_inherited_groups () == std::vector<std::string> {"default"});
			REQUIRE_FALSE (usr.has_data ());
			REQUIRE (usr.get_friendly_name () == "Steve");
		}
		
		WHEN ("the user joins a group and changes primary group") {
			usr.add_group ("vip");
			usr.set_primary_group ("Member");
			
			THEN ("both groups are inherited, the primary one last") {
				std::vector<std::string> groups = usr.get_inherited_groups (context_set::empty ());
				REQUIRE (groups.size () == 2);
				REQUIRE (groups[0] == "vip");
				REQUIRE (groups[1] == "member");
				REQUIRE (usr.has_data ());
			}
			
			THEN ("remove_group leaves the primary group in place") {
				REQUIRE (usr.remove_group ("vip") == MUTATE_SUCCESS);
				REQUIRE (usr.get_inherited_groups () == std::vector<std::string> {"member"});
			}
		}
		
		THEN ("an empty primary group is rejected") {
			REQUIRE_THROWS_AS (usr.set_primary_group (""), std::invalid_argument);
		}
	}
}
