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

#ifndef _hPerms__USER_H_
#define _hPerms__USER_H_

#include "permissions/holder.hpp"
#include "util/uuid.hpp"
#include <string>
#include <vector>


namespace hPerms {
	
	/*
	 * A principal (player) with directly assigned nodes and group memberships.
	 */
	class user: public permission_holder
	{
		uuid_t uuid;
		std::string username;
		std::string primary_group;
		
	public:
		static const char *DEFAULT_GROUP;
		
	public:
		user (const uuid_t& uuid, const std::string& username = "");
		
		
		
		const uuid_t& get_uuid () const { return this->uuid; }
		
		const std::string& get_username () const { return this->username; }
		void set_username (const std::string& username) { this->username = username; }
		
		const std::string& get_primary_group () const { return this->primary_group; }
		
		/*
		 * Throws `std::invalid_argument' if the name is empty.
		 */
		void set_primary_group (const std::string& name);
		
		virtual std::string get_identifier () const override { return this->uuid.to_str (); }
		virtual std::string get_friendly_name () const override;
		
		
		/*
		 * Same as the base implementation, except that the primary group is
		 * always part of the result, in all contexts.
		 */
		virtual std::vector<std::string> get_inherited_groups () const override;
		virtual std::vector<std::string> get_inherited_groups (
			const context_set& contexts) const override;
		
		/*
		 * Checks whether the user carries anything worth storing (nodes or a
		 * primary group other than @{default_group}).
		 */
		bool has_data (const std::string& default_group = DEFAULT_GROUP) const;
	};
}

#endif
