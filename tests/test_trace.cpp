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
#include "resolver/trace.hpp"

using namespace hPerms;


TEST_CASE ("Traces describe where a result came from", "[trace]") {
	context_set nether = context_set::of ("world", "nether");
	
	SECTION ("not found") {
		permission_trace trace = permission_trace::not_found ("fly", nether);
		REQUIRE (trace.get_result () == TS_UNDEFINED);
		REQUIRE_FALSE (trace.is_matched ());
		REQUIRE (trace.get_source_description () == "unknown");
		REQUIRE (trace.to_string () ==
			"trace{permission=fly, result=undefined, match-type=none, source=unknown, "
			"contexts={world=nether}}");
	}
	
	SECTION ("from a user") {
		permission_trace trace = permission_trace::for_user ("fly",
			match_result (TS_TRUE, "fly", MT_EXACT), context_set::empty ());
		REQUIRE (trace.is_matched ());
		REQUIRE (trace.is_from_user ());
		REQUIRE_FALSE (trace.is_from_wildcard ());
		REQUIRE (trace.to_string () ==
			"trace{permission=fly, result=true, matched-node=fly, match-type=exact, "
			"source=user}");
	}
	
	SECTION ("from a group") {
		permission_trace trace = permission_trace::for_group ("build.place",
			match_result (TS_FALSE, "-build.*", MT_WILDCARD_NEGATION), "guest", nether);
		REQUIRE (trace.get_source_group () == "guest");
		REQUIRE (trace.get_source_description () == "group:guest");
		REQUIRE (trace.is_from_wildcard ());
		REQUIRE (trace.is_from_negation ());
		REQUIRE (trace.get_contexts () == nether);
		
		std::string verbose = trace.to_verbose_string ();
		REQUIRE (verbose.find ("Permission check trace\n") == 0);
		REQUIRE (verbose.find ("  Permission: build.place\n") != std::string::npos);
		REQUIRE (verbose.find ("  Result: false\n") != std::string::npos);
		REQUIRE (verbose.find ("  Matched node: -build.*\n") != std::string::npos);
		REQUIRE (verbose.find ("  Source: group:guest\n") != std::string::npos);
		REQUIRE (verbose.find ("  Active contexts: {world=nether}\n") != std::string::npos);
	}
}
