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

#include "permissions/user.hpp"
#include "util/stringutils.hpp"
#include <algorithm>
#include <stdexcept>


namespace hPerms {
	
	const char *user::DEFAULT_GROUP = "default";
	
	
	user::user (const uuid_t& uuid, const std::string& username)
		: uuid (uuid), username (username), primary_group (DEFAULT_GROUP)
		{ }
	
	
	
	void
	user::set_primary_group (const std::string& name)
	{
		if (name.empty ())
			throw std::invalid_argument ("primary group cannot be empty");
		this->primary_group = sutils::to_lower (name);
	}
	
	std::string
	user::get_friendly_name () const
	{
		return this->username.empty () ? this->uuid.to_str () : this->username;
	}
	
	
	
	static void
	_add_primary (std::vector<std::string>& groups, const std::string& primary)
	{
		if (primary.empty ())
			return;
		if (std::find (groups.begin (), groups.end (), primary) == groups.end ())
			groups.push_back (primary);
	}
	
	std::vector<std::string>
	user::get_inherited_groups () const
	{
		std::vector<std::string> groups = permission_holder::get_inherited_groups ();
		_add_primary (groups, this->primary_group);
		return groups;
	}
	
	std::vector<std::string>
	user::get_inherited_groups (const context_set& contexts) const
	{
		std::vector<std::string> groups =
			permission_holder::get_inherited_groups (contexts);
		_add_primary (groups, this->primary_group);
		return groups;
	}
	
	
	bool
	user::has_data (const std::string& default_group) const
	{
		return !this->nodes.empty ()
			|| this->primary_group != sutils::to_lower (default_group);
	}
}
