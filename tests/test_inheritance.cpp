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
#include "resolver/inheritance.hpp"
#include "permissions/user.hpp"
#include <stdexcept>

using namespace hPerms;


static std::vector<std::string>
_names (const std::vector<const group *>& groups)
{
	std::vector<std::string> names;
	for (const group *grp : groups)
		names.push_back (grp->get_name ());
	return names;
}


SCENARIO ("Inheritance is flattened and ordered by weight", "[inheritance]") {
	test_groups groups;
	inheritance_graph graph {groups.loader ()};
	
	GIVEN ("a chain admin -> moderator -> default") {
		groups.add ("default", 0);
		groups.add ("moderator", 50).add_parent ("default");
		groups.add ("admin", 100).add_parent ("moderator");
		
		THEN ("resolving admin yields all three, lowest weight first") {
			std::vector<std::string> chain = graph.get_inheritance_chain ("admin");
			REQUIRE (chain == std::vector<std::string> {"default", "moderator", "admin"});
		}
		
		THEN ("a cycle would be created by making default inherit admin") {
			REQUIRE (graph.would_create_cycle (*groups.loader () ("default"), "admin"));
			REQUIRE_FALSE (graph.would_create_cycle (*groups.loader () ("admin"), "default"));
		}
	}
	
	GIVEN ("two groups inheriting each other") {
		groups.add ("a").add_parent ("b");
		groups.add ("b").add_parent ("a");
		
		THEN ("resolution terminates with each group once") {
			std::vector<const group *> res = graph.resolve_inheritance ({"a"},
				context_set::empty ());
			REQUIRE (_names (res) == std::vector<std::string> {"a", "b"});
		}
	}
	
	GIVEN ("groups of equal weight in a diamond") {
		groups.add ("top");
		groups.add ("left").add_parent ("top");
		groups.add ("right").add_parent ("top");
		group& bottom = groups.add ("bottom");
		bottom.add_parent ("left");
		bottom.add_parent ("right");
		
		THEN ("they keep breadth-first discovery order") {
			std::vector<std::string> chain = graph.get_inheritance_chain ("bottom");
			REQUIRE (chain == std::vector<std::string> {"bottom", "left", "right", "top"});
		}
	}
	
	GIVEN ("a group whose parent does not exist") {
		groups.add ("orphan").add_parent ("ghost");
		
		THEN ("the missing parent is skipped") {
			REQUIRE (graph.get_inheritance_chain ("orphan") == std::vector<std::string> {"orphan"});
			REQUIRE (graph.get_inheritance_chain ("ghost").empty ());
		}
	}
	
	GIVEN ("a parent that only applies in the nether") {
		groups.add ("netherfolk", 5);
		groups.add ("player").add_node (node::group_node ("netherfolk",
			context_set::of ("world", "nether")));
		
		THEN ("it is only inherited there") {
			context_set nether = context_set::of ("world", "nether");
			REQUIRE (graph.resolve_inheritance ({"player"}, nether).size () == 2);
			REQUIRE (graph.resolve_inheritance ({"player"}, context_set::empty ()).size () == 1);
		}
		
		THEN ("collect_nodes skips group nodes") {
			group& player = groups.add ("player");
			player.add_node (node ("chat"));
			player.add_node (node::group_node ("netherfolk"));
			std::vector<node> nodes = graph.collect_nodes (
				graph.resolve_inheritance ({"player"}, context_set::empty ()),
				context_set::empty ());
			REQUIRE (nodes.size () == 1);
			REQUIRE (nodes[0].get_permission () == "chat");
		}
	}
	
	GIVEN ("a user with a mix of nodes") {
		user usr {uuid_t::nil ()};
		usr.add_node (node ("chat"));
		usr.add_node (node ("old", true, context_set (), 1));
		usr.add_node (node::group_node ("vip"));
		usr.add_node (node ("fly").with_contexts (context_set::of ("world", "nether")));
		usr.add_node (node ("build"));
		
		THEN ("only the applicable nodes are kept, in order") {
			std::vector<node> nodes = inheritance_graph::applicable_nodes (usr,
				context_set::empty ());
			REQUIRE (nodes.size () == 2);
			REQUIRE (nodes[0].get_permission () == "chat");
			REQUIRE (nodes[1].get_permission () == "build");
			
			nodes = inheritance_graph::applicable_nodes (usr,
				context_set::of ("world", "nether"));
			REQUIRE (nodes.size () == 3);
			REQUIRE (nodes[1].get_permission () == "fly");
		}
	}
	
	WHEN ("the graph is given an empty loader") {
		THEN ("std::invalid_argument is thrown") {
			REQUIRE_THROWS_AS (inheritance_graph (group_loader ()), std::invalid_argument);
		}
	}
}
