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
#include "util/uuid.hpp"
#include <stdexcept>
#include <unordered_set>

using namespace hPerms;


TEST_CASE ("UUIDs", "[uuid]") {
	SECTION ("parsing accepts the canonical form in either case") {
		uuid_t a = uuid_t::parse ("069A79F4-44E9-4726-A5BE-FCA90E38AAF5");
		REQUIRE (a.to_str () == "069a79f4-44e9-4726-a5be-fca90e38aaf5");
		REQUIRE (a == uuid_t::parse (a.to_str ()));
	}
	
	SECTION ("malformed strings are rejected") {
		REQUIRE_THROWS_AS (uuid_t::parse (""), std::invalid_argument);
		REQUIRE_THROWS_AS (uuid_t::parse ("069a79f444e94726a5befca90e38aaf5"), std::invalid_argument);
		REQUIRE_THROWS_AS (uuid_t::parse ("069a79f4-44e9-4726-a5be-fca90e38aaxz"), std::invalid_argument);
	}
	
	SECTION ("nil") {
		REQUIRE (uuid_t::nil ().to_str () == "00000000-0000-0000-0000-000000000000");
		REQUIRE (uuid_t::nil () < uuid_t::parse ("00000000-0000-0000-0000-000000000001"));
	}
	
	SECTION ("generated uuids are version 4 and distinct") {
		std::unordered_set<uuid_t> seen;
		for (int i = 0; i < 100; ++i)
			{
				uuid_t id = generate_uuid ();
				std::string str = id.to_str ();
				REQUIRE (str[14] == '4');
				REQUIRE (std::string ("89ab").find (str[19]) != std::string::npos);
				seen.insert (id);
			}
		REQUIRE (seen.size () == 100);
	}
}
