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

#ifndef _hPerms__USER_REGISTRY_H_
#define _hPerms__USER_REGISTRY_H_

#include "permissions/user.hpp"
#include "util/uuid.hpp"
#include <unordered_map>
#include <string>
#include <vector>
#include <mutex>


namespace hPerms {
	
	class logger;
	namespace cfg {
		class array;
	}
	
	
	/*
	 * Owns all known users, indexed by UUID.
	 */
	class user_registry
	{
		logger& log;
		std::string default_group;
		std::unordered_map<uuid_t, user *> users;
		mutable std::mutex lock;
		
	public:
		/*
		 * @{default_group} is the primary group given to users that do not
		 * specify one.
		 */
		user_registry (logger& log,
			const std::string& default_group = user::DEFAULT_GROUP);
		~user_registry ();
		
		user_registry (const user_registry&) = delete;
		user_registry& operator= (const user_registry&) = delete;
		
		
		
		const std::string& get_default_group () const { return this->default_group; }
		
		/*
		 * Returns the user with the given UUID, creating it (with the specified
		 * name and primary group) if it does not exist yet. An empty primary
		 * group stands for the registry's default group.
		 */
		user* get_or_create (const uuid_t& uuid, const std::string& username = "",
			const std::string& primary_group = "");
		
		user* find (const uuid_t& uuid) const;
		
		/*
		 * Case-insensitive lookup by username. Returns null if not found.
		 */
		user* find_by_name (const std::string& username) const;
		
		bool remove (const uuid_t& uuid);
		void clear ();
		
		/*
		 * Returns all users, sorted by UUID.
		 */
		std::vector<user *> all () const;
		int size () const;
		
		int cleanup_expired ();
		
		
		
		/*
		 * Replaces the contents of the registry with the users described by the
		 * given "users" array:
		 *   { uuid: "..."; name: "..."; primary-group: "..."; groups: [...]; permissions: [...]; }
		 * 
		 * Throws `storage_error' on malformed input.
		 */
		void load (const cfg::array& arr_users);
		
		/*
		 * Writes every user that carries data into @{arr_users}. Users with no
		 * nodes whose primary group is the default group are skipped.
		 */
		void save (cfg::array& arr_users) const;
	};
}

#endif
