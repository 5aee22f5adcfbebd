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
#include "util/logger.hpp"

using namespace hPerms;


TEST_CASE ("Logger level filtering", "[logger]") {
	std::ostringstream out;
	logger log {out};
	
	SECTION ("messages below the minimum level are dropped") {
		log.set_level (LT_WARNING);
		log (LT_INFO) << "hidden" << std::endl;
		log (LT_ERROR) << "shown" << std::endl;
		
		REQUIRE (out.str ().find ("hidden") == std::string::npos);
		REQUIRE (out.str ().find ("shown") != std::string::npos);
		REQUIRE (out.str ().find ("error") == 0);
	}
	
	SECTION ("the default level is info") {
		REQUIRE (log.get_level () == LT_INFO);
		log (LT_DEBUG) << "trace" << std::endl;
		log () << "system message" << std::endl;
		REQUIRE (out.str ().find ("trace") == std::string::npos);
		REQUIRE (out.str ().find ("system message") != std::string::npos);
	}
	
	SECTION ("level names") {
		logtype lt;
		REQUIRE (parse_logtype ("Warning", lt));
		REQUIRE (lt == LT_WARNING);
		REQUIRE (parse_logtype (" debug ", lt));
		REQUIRE (lt == LT_DEBUG);
		REQUIRE_FALSE (parse_logtype ("verbose", lt));
	}
}
