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
#include "permissions/node.hpp"
#include <stdexcept>

using namespace hPerms;


SCENARIO ("Nodes describe a single permission assertion", "[node]") {
	GIVEN ("a plain node") {
		node n {"Essentials.Home"};
		
		THEN ("the permission is lowercased and the node grants it permanently") {
			REQUIRE (n.get_permission () == "essentials.home");
			REQUIRE (n.get_value ());
			REQUIRE (n.is_permanent ());
			REQUIRE_FALSE (n.is_temporary ());
			REQUIRE_FALSE (n.is_expired ());
			REQUIRE_FALSE (n.is_negated ());
			REQUIRE_FALSE (n.is_wildcard ());
			REQUIRE_FALSE (n.is_group_node ());
			REQUIRE (n.get_group_name () == "");
		}
		
		THEN ("it applies in every context") {
			REQUIRE (n.applies_in (context_set::empty ()));
			REQUIRE (n.applies_in (context_set::of ("world", "nether")));
		}
	}
	
	GIVEN ("a negated wildcard node") {
		node n {"-build.*"};
		
		THEN ("it is recognized as both") {
			REQUIRE (n.is_negated ());
			REQUIRE (n.is_wildcard ());
			REQUIRE (n.get_base_permission () == "build.*");
		}
	}
	
	GIVEN ("a group node") {
		node n = node::group_node ("Admin");
		
		THEN ("the group name is extracted") {
			REQUIRE (n.is_group_node ());
			REQUIRE (n.get_permission () == "group.admin");
			REQUIRE (n.get_group_name () == "admin");
		}
	}
	
	GIVEN ("a temporary node") {
		node n {"fly", true, context_set (), 1000};
		
		THEN ("it expires once its expiry time has passed") {
			REQUIRE (n.is_temporary ());
			REQUIRE_FALSE (n.is_expired (999));
			REQUIRE_FALSE (n.is_expired (1000));
			REQUIRE (n.is_expired (1001));
			REQUIRE (n.is_expired ());
		}
		
		THEN ("with_expiry and equals_ignoring_expiry relate copies") {
			node permanent = n.with_expiry (0);
			REQUIRE (permanent.is_permanent ());
			REQUIRE (permanent != n);
			REQUIRE (permanent.equals_ignoring_expiry (n));
		}
	}
	
	GIVEN ("a node restricted to the nether") {
		node n = node ("fly").with_contexts (context_set::of ("world", "nether"));
		
		THEN ("it only applies where its contexts are satisfied") {
			REQUIRE_FALSE (n.applies_in (context_set::empty ()));
			REQUIRE_FALSE (n.applies_in (context_set::of ("world", "overworld")));
			REQUIRE (n.applies_in (context_set::of ("world", "nether")));
			REQUIRE (n.to_string () == "node{fly, contexts={world=nether}}");
		}
	}
	
	WHEN ("a node is created with an empty permission") {
		THEN ("std::invalid_argument is thrown") {
			REQUIRE_THROWS_AS (node (""), std::invalid_argument);
			REQUIRE_THROWS_AS (node::group_node (""), std::invalid_argument);
		}
	}
}
