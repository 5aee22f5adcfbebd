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

#include "util/uuid.hpp"
#include <mutex>
#include <random>
#include <chrono>
#include <stdexcept>
#include <cctype>


namespace hPerms {

	/*
	 * Generates and returns a new UUID.
	 */
	uuid_t
	generate_uuid ()
	{
		static std::mt19937 _rnd {};
		static std::mutex _rnd_mut {};
		static std::uniform_int_distribution<> _dis (0, 0xF);
		static bool _init = false;

		std::lock_guard<std::mutex> guard {_rnd_mut};
		if (!_init)
			{
				_init = true;
				_rnd.seed (std::chrono::duration_cast<std::chrono::nanoseconds> (
					std::chrono::high_resolution_clock::now ().time_since_epoch ()).count ()
					& 0x7FFFFFFF);
			}

		uuid_t uuid;
		for (int i = 0; i < 4; ++i)
			{
				uuid.data[i] = 0;
				for (int j = 0; j < 8; ++j)
					uuid.data[i] |= ((unsigned int)_dis (_rnd) << (j * 4));
			}

		// version 4, variant 10xx
		uuid.data[1] &= ~(0xFU << 12);
		uuid.data[1] |= 0x4U << 12;

		uuid.data[2] &= ~(0xCU << 28);
		uuid.data[2] |= 0x8U << 28;

		return uuid;
	}



	std::string
	uuid_t::to_str () const
	{
		std::string str;

		static const char *hex_digits = "0123456789abcdef";
		for (int i = 0; i < 4; ++i)
			for (int j = 7; j >= 0; --j)
				str.push_back (hex_digits[(this->data[i] >> (j * 4)) & 0xF]);

		str.insert (8, 1, '-');
		str.insert (13, 1, '-');
		str.insert (18, 1, '-');
		str.insert (23, 1, '-');

		return str;
	}


	static int
	_hex_value (char c)
	{
		if (c >= '0' && c <= '9') return c - '0';
		c = std::tolower ((unsigned char)c);
		if (c >= 'a' && c <= 'f') return c - 'a' + 10;
		return -1;
	}

	/*
	 * Parses the canonical 8-4-4-4-12 hex form.
	 */
	uuid_t
	uuid_t::parse (const std::string& str)
	{
		if (str.size () != 36 || str[8] != '-' || str[13] != '-'
			|| str[18] != '-' || str[23] != '-')
			throw std::invalid_argument ("malformed uuid: \"" + str + "\"");

		uuid_t uuid = uuid_t::nil ();
		int n = 0;
		for (size_t i = 0; i < str.size (); ++i)
			{
				if (i == 8 || i == 13 || i == 18 || i == 23)
					continue;

				int v = _hex_value (str[i]);
				if (v == -1)
					throw std::invalid_argument ("malformed uuid: \"" + str + "\"");

				uuid.data[n / 8] |= (unsigned int)v << ((7 - (n % 8)) * 4);
				++ n;
			}

		return uuid;
	}

	uuid_t
	uuid_t::nil ()
	{
		uuid_t uuid;
		for (int i = 0; i < 4; ++i)
			uuid.data[i] = 0;
		return uuid;
	}



	bool
	uuid_t::operator== (const uuid_t& other) const
	{
		for (int i = 0; i < 4; ++i)
			if (other.data[i] != this->data[i])
				return false;
		return true;
	}

	bool
	uuid_t::operator!= (const uuid_t& other) const
	{
		return !this->operator== (other);
	}

	bool
	uuid_t::operator< (const uuid_t& other) const
	{
		for (int i = 0; i < 4; ++i)
			if (this->data[i] != other.data[i])
				return this->data[i] < other.data[i];
		return false;
	}
}

