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

#include "permissions/group.hpp"
#include "util/stringutils.hpp"
#include <stdexcept>
#include <sstream>


namespace hPerms {
	
	group::group (const std::string& name, int weight)
		: name (sutils::to_lower (name)), display_name (this->name), weight (weight)
	{
		if (this->name.empty ())
			throw std::invalid_argument ("group name cannot be empty");
	}
	
	
	
	void
	group::set_display_name (const std::string& display_name)
	{
		this->display_name = display_name.empty () ? this->name : display_name;
	}
	
	
	std::string
	group::to_string () const
	{
		std::ostringstream ss;
		ss << "group{name=" << this->name << ", display-name=" << this->display_name
			 << ", weight=" << this->weight << "}";
		return ss.str ();
	}
}
