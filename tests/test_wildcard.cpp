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
#include "resolver/wildcard.hpp"

using namespace hPerms;


SCENARIO ("Universal wildcards", "[wildcard]") {
	GIVEN ("a map granting everything but explicitly denying x.y") {
		permission_map perms {{"*", true}, {"-x.y", true}};
		
		THEN ("the universal grant wins") {
			match_result res = wildcard::check_with_trace ("x.y", perms);
			REQUIRE (res.result == TS_TRUE);
			REQUIRE (res.matched_node == "*");
			REQUIRE (res.type == MT_UNIVERSAL);
		}
	}
	
	GIVEN ("a map with a universal negation") {
		permission_map perms {{"-*", true}, {"a.b", true}};
		
		THEN ("everything is denied") {
			match_result res = wildcard::check_with_trace ("a.b", perms);
			REQUIRE (res.result == TS_FALSE);
			REQUIRE (res.matched_node == "-*");
			REQUIRE (res.type == MT_UNIVERSAL_NEGATION);
		}
	}
	
	GIVEN ("a map setting the universal wildcard to false") {
		permission_map perms {{"*", false}, {"a.b", true}};
		
		THEN ("exact grants still apply") {
			match_result res = wildcard::check_with_trace ("a.b", perms);
			REQUIRE (res.result == TS_TRUE);
			REQUIRE (res.matched_node == "a.b");
			REQUIRE (res.type == MT_EXACT);
		}
		
		THEN ("permissions without a node of their own stay undefined") {
			REQUIRE (wildcard::check ("c.d", perms) == TS_UNDEFINED);
		}
	}
}


SCENARIO ("Exact and prefix wildcard matching", "[wildcard]") {
	GIVEN ("a shorter wildcard granted and a longer one denied") {
		permission_map perms {{"a.*", true}, {"a.b.*", false}};
		
		THEN ("the shorter prefix decides") {
			match_result res = wildcard::check_with_trace ("a.b.c", perms);
			REQUIRE (res.result == TS_TRUE);
			REQUIRE (res.matched_node == "a.*");
			REQUIRE (res.type == MT_WILDCARD);
		}
	}
	
	GIVEN ("an exact node alongside a denying wildcard") {
		permission_map perms {{"a.b.c", true}, {"a.*", false}};
		
		THEN ("the exact node decides") {
			match_result res = wildcard::check_with_trace ("a.b.c", perms);
			REQUIRE (res.result == TS_TRUE);
			REQUIRE (res.type == MT_EXACT);
			REQUIRE (wildcard::check ("a.b.d", perms) == TS_FALSE);
		}
	}
	
	GIVEN ("an exact grant under a negated wildcard") {
		permission_map perms {{"-a.*", true}, {"a.b", true}};
		
		THEN ("the exact grant decides") {
			REQUIRE (wildcard::check ("a.b", perms) == TS_TRUE);
			REQUIRE (wildcard::check ("a.c", perms) == TS_FALSE);
		}
	}
	
	GIVEN ("an exact negation") {
		permission_map perms {{"-fly", true}};
		
		THEN ("the permission is denied") {
			match_result res = wildcard::check_with_trace ("fly", perms);
			REQUIRE (res.result == TS_FALSE);
			REQUIRE (res.matched_node == "-fly");
			REQUIRE (res.type == MT_EXACT_NEGATION);
		}
	}
	
	GIVEN ("a negated wildcard") {
		permission_map perms {{"-build.*", true}};
		
		THEN ("everything under it is denied") {
			match_result res = wildcard::check_with_trace ("build.place.stone", perms);
			REQUIRE (res.result == TS_FALSE);
			REQUIRE (res.type == MT_WILDCARD_NEGATION);
			REQUIRE (res.is_wildcard ());
			REQUIRE (wildcard::check ("build", perms) == TS_UNDEFINED);
		}
	}
	
	THEN ("checks are case-insensitive") {
		permission_map perms {{"essentials.home", true}};
		REQUIRE (wildcard::check ("Essentials.HOME", perms) == TS_TRUE);
	}
	
	THEN ("empty permissions and unmatched permissions are undefined") {
		permission_map perms {{"a.b", true}};
		REQUIRE (wildcard::check ("", perms) == TS_UNDEFINED);
		REQUIRE (wildcard::check ("c.d", perms) == TS_UNDEFINED);
		REQUIRE_FALSE (wildcard::check_with_trace ("c.d", perms).is_matched ());
		REQUIRE (as_boolean (TS_UNDEFINED, true));
		REQUIRE_FALSE (as_boolean (TS_UNDEFINED));
	}
}


SCENARIO ("Namespace prefixes are stripped as a fallback", "[wildcard]") {
	GIVEN ("a map granting an unqualified permission") {
		permission_map perms {{"example.fly", true}, {"tool.*", true}};
		
		THEN ("qualified forms resolve to it") {
			REQUIRE (wildcard::check ("com.example.fly", perms) == TS_TRUE);
			REQUIRE (wildcard::check ("io.tool.use", perms) == TS_TRUE);
			REQUIRE (wildcard::check ("uk.example.fly", perms) == TS_UNDEFINED);
		}
	}
	
	GIVEN ("a namespace wildcard and a denial of the stripped form") {
		permission_map perms {{"com.*", true}, {"example.fly", false}};
		
		THEN ("the unqualified form is fully checked first, wildcards included") {
			match_result res = wildcard::check_with_trace ("com.example.fly", perms);
			REQUIRE (res.result == TS_TRUE);
			REQUIRE (res.matched_node == "com.*");
			REQUIRE (res.type == MT_WILDCARD);
			REQUIRE (wildcard::check ("example.fly", perms) == TS_FALSE);
		}
	}
	
	GIVEN ("a map holding both the qualified and the stripped form") {
		permission_map perms {{"org.example.fly", false}, {"example.fly", true}};
		
		THEN ("the qualified form is consulted first") {
			REQUIRE (wildcard::check ("org.example.fly", perms) == TS_FALSE);
		}
	}
}


TEST_CASE ("Pattern generation and matching", "[wildcard]") {
	SECTION ("generate_patterns lists the most specific pattern first") {
		std::vector<std::string> patterns = wildcard::generate_patterns ("a.b.c");
		REQUIRE (patterns == std::vector<std::string> {"a.b.c", "a.b.*", "a.*", "*"});
		
		patterns = wildcard::generate_patterns ("fly");
		REQUIRE (patterns == std::vector<std::string> {"fly", "*"});
	}
	
	SECTION ("matches") {
		REQUIRE (wildcard::matches ("a.b.c", "*"));
		REQUIRE (wildcard::matches ("a.b.c", "a.*"));
		REQUIRE (wildcard::matches ("a.b.c", "a.b.*"));
		REQUIRE (wildcard::matches ("a.b.c", "a.b.c"));
		REQUIRE_FALSE (wildcard::matches ("a.b.c", "a.c.*"));
		REQUIRE_FALSE (wildcard::matches ("ab.c", "a.*"));
		REQUIRE_FALSE (wildcard::matches ("a.b", "a.b.c"));
		REQUIRE_FALSE (wildcard::matches ("", "*"));
	}
	
	SECTION ("names") {
		REQUIRE (std::string (tristate_name (TS_UNDEFINED)) == "undefined");
		REQUIRE (std::string (match_type_name (MT_WILDCARD_NEGATION)) == "wildcard negation");
	}
}
