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

#include "util/stringutils.hpp"
#include <cctype>


namespace hPerms {
	namespace sutils {

		/*
		 * Removes leading whitespace from the given string.
		 */
		std::string&
		ltrim (std::string& s)
		{
			int j = s.size (), i = 0;
			for (; i < j; ++i)
				if (!std::isspace ((unsigned char)s[i]))
					break;
			s.erase (0, i);
			return s;
		}

		/*
		 * Removes trailing whitespace from the given string.
		 */
		std::string&
		rtrim (std::string& s)
		{
			int i;
			for (i = (int)s.size () - 1; i >= 0; --i)
				if (!std::isspace ((unsigned char)s[i]))
					break;
			s.erase (i + 1);
			return s;
		}

		/*
		 * Removes whitespace from both ends of the given string.
		 */
		std::string&
		trim (std::string& s)
			{ return ltrim (rtrim (s)); }



		/*
		 * Returns a lowercase copy of the given string (ASCII only).
		 */
		std::string
		to_lower (const std::string& s)
		{
			std::string out (s);
			for (size_t i = 0; i < out.size (); ++i)
				out[i] = std::tolower ((unsigned char)out[i]);
			return out;
		}


		/*
		 * Case-insensitive string equality check.
		 */
		bool
		iequals (const std::string& a, const char *b)
		{
			int len = a.length (), i = 0;
			for (; i < len; ++i)
				{
					char ca = a[i];
					char cb = b[i];
					if (cb == 0)
						return false;

					if (std::tolower ((unsigned char)ca) != std::tolower ((unsigned char)cb))
						return false;
				}

			if (b[i] != 0)
				return false;
			return true;
		}

		bool
		iequals (const std::string& a, const std::string& b)
		{
			if (a.size () != b.size ())
				return false;
			return iequals (a, b.c_str ());
		}


		/*
		 * Case-insensitive substring search.
		 */
		bool
		icontains (const std::string& haystack, const std::string& needle)
		{
			return to_lower (haystack).find (to_lower (needle)) != std::string::npos;
		}



		bool
		starts_with (const std::string& s, const std::string& prefix)
		{
			return s.size () >= prefix.size ()
				&& s.compare (0, prefix.size (), prefix) == 0;
		}

		bool
		ends_with (const std::string& s, const std::string& suffix)
		{
			return s.size () >= suffix.size ()
				&& s.compare (s.size () - suffix.size (), suffix.size (), suffix) == 0;
		}



		/*
		 * Splits the specified string at every occurrence of @{sep}.
		 */
		std::vector<std::string>
		split (const std::string& s, char sep)
		{
			std::vector<std::string> parts;

			std::string::size_type start = 0, pos;
			while ((pos = s.find (sep, start)) != std::string::npos)
				{
					parts.push_back (s.substr (start, pos - start));
					start = pos + 1;
				}
			parts.push_back (s.substr (start));

			while (!parts.empty () && parts.back ().empty ())
				parts.pop_back ();
			return parts;
		}
	}
}

