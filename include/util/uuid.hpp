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

#ifndef _hPerms__UUID_H_
#define _hPerms__UUID_H_

#include <string>
#include <cstddef>
#include <functional>


namespace hPerms {

	/*
	 * Universally unique identifier.
	 */
	struct uuid_t
	{
		unsigned int data[4];

	//---
		std::string to_str () const;

		/*
		 * Parses the canonical 8-4-4-4-12 hex form (case-insensitive).
		 * Throws `std::invalid_argument' if the string is malformed.
		 */
		static uuid_t parse (const std::string& str);

		/*
		 * Returns the all-zero UUID.
		 */
		static uuid_t nil ();

	//---
		bool operator== (const uuid_t& other) const;
		bool operator!= (const uuid_t& other) const;
		bool operator< (const uuid_t& other) const;
	};



	/*
	 * Generates and returns a new (version 4) UUID.
	 */
	uuid_t generate_uuid ();
}


namespace std {

	template<>
	struct hash<hPerms::uuid_t>
	{
		size_t
		operator() (const hPerms::uuid_t& uuid) const
		{
			size_t s = 17;
			for (int i = 0; i < 4; ++i)
				s = (s * 31) + uuid.data[i];
			return s;
		}
	};
}

#endif

