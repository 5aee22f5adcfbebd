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

#ifndef _hPerms__STRINGUTILS_H_
#define _hPerms__STRINGUTILS_H_

#include <string>
#include <vector>


namespace hPerms {

	/*
	 * String-related utility and helper functions.
	 */
	namespace sutils {

		/*
		 * Removes leading whitespace from the given string.
		 */
		std::string& ltrim (std::string& s);

		/*
		 * Removes trailing whitespace from the given string.
		 */
		std::string& rtrim (std::string& s);

		/*
		 * Removes whitespace from both ends of the given string.
		 */
		std::string& trim (std::string& s);


		/*
		 * Returns a lowercase copy of the given string (ASCII only).
		 */
		std::string to_lower (const std::string& s);

		/*
		 * Case-insensitive string equality check.
		 */
		bool iequals (const std::string& a, const char *b);
		bool iequals (const std::string& a, const std::string& b);

		/*
		 * Case-insensitive substring search.
		 */
		bool icontains (const std::string& haystack, const std::string& needle);


		bool starts_with (const std::string& s, const std::string& prefix);
		bool ends_with (const std::string& s, const std::string& suffix);


		/*
		 * Splits the specified string at every occurrence of @{sep}.
		 * Trailing empty components are dropped, so "a.b." yields {"a", "b"}.
		 */
		std::vector<std::string> split (const std::string& s, char sep);
	}
}

#endif

