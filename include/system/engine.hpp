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

#ifndef _hPerms__ENGINE_H_
#define _hPerms__ENGINE_H_

#include "util/logger.hpp"
#include "util/uuid.hpp"
#include "context/context_manager.hpp"
#include "registry/group_registry.hpp"
#include "registry/user_registry.hpp"
#include "registry/aliases.hpp"
#include "registry/permission_registry.hpp"
#include "resolver/resolver.hpp"
#include <string>
#include <set>


namespace hPerms {
	
	struct engine_config
	{
		std::string default_group;
		std::string server_name;
		std::string permissions_file;
		bool verbose;
		
		std::string log_dir;
		logtype log_level;
	};
	
	/*
	 * Fills the given structure with default settings.
	 */
	void default_config (engine_config& out);
	
	/*
	 * Loads engine settings from the specified file into @{out}. Missing or
	 * invalid settings keep their default values and are reported through the
	 * logger. If the file does not exist, it is created with default settings.
	 */
	void load_config (logger& log, const std::string& path, engine_config& out);
	
	/*
	 * Returns false if the file could not be written.
	 */
	bool write_config (logger& log, const std::string& path, const engine_config& in);
	
	
	
	/*
	 * Ties the registries, the context manager and the resolver together and
	 * answers permission checks for users identified by UUID.
	 */
	class permission_engine
	{
		logger& log;
		engine_config config;
		
		group_registry groups;
		user_registry users;
		permission_aliases aliases;
		permission_registry registry;
		context_manager contexts;
		permission_resolver resolver;
		
	private:
		/*
		 * Resolves the specified user. Unknown users are resolved as a user
		 * that only belongs to the default group.
		 */
		resolved_permissions resolve_uuid (const uuid_t& uuid,
			const context_set& ctx) const;
		
	public:
		permission_engine (logger& log, const engine_config& config);
		
		permission_engine (const permission_engine&) = delete;
		permission_engine& operator= (const permission_engine&) = delete;
		
		
		
		const engine_config& get_config () const { return this->config; }
		group_registry& get_groups () { return this->groups; }
		user_registry& get_users () { return this->users; }
		permission_aliases& get_aliases () { return this->aliases; }
		permission_registry& get_registry () { return this->registry; }
		context_manager& get_context_manager () { return this->contexts; }
		const permission_resolver& get_resolver () const { return this->resolver; }
		
		
		
		/*
		 * Loads groups, users, aliases and registered permissions from the
		 * permissions file, creating the file if it does not exist. The
		 * default group is created if missing.
		 * 
		 * Throws `storage_error' if the file exists but cannot be parsed.
		 * 
		 * Replaces every loaded group and user: must not run concurrently with
		 * checks.
		 */
		void load ();
		
		/*
		 * Writes everything back to the permissions file.
		 * Throws `storage_error' if the file cannot be written.
		 */
		void save () const;
		
		/*
		 * Removes expired nodes from all groups and users.
		 */
		int cleanup_expired ();
		
		
		
		/*
		 * Returns the contexts that currently apply to the given user, as
		 * computed by the registered context calculators.
		 */
		context_set get_contexts (const uuid_t& uuid) const;
		
		resolved_permissions resolve (const uuid_t& uuid) const;
		resolved_permissions resolve (const uuid_t& uuid, const context_set& ctx) const;
		
		tristate check (const uuid_t& uuid, const std::string& perm) const;
		tristate check (const uuid_t& uuid, const std::string& perm,
			const context_set& ctx) const;
		
		permission_trace check_with_trace (const uuid_t& uuid,
			const std::string& perm) const;
		permission_trace check_with_trace (const uuid_t& uuid,
			const std::string& perm, const context_set& ctx) const;
		
		bool has_permission (const uuid_t& uuid, const std::string& perm) const;
		bool has_permission (const uuid_t& uuid, const std::string& perm,
			const context_set& ctx) const;
		
		/*
		 * Returns the user's granted permissions with wildcards and aliases
		 * expanded into concrete permissions.
		 */
		std::set<std::string> get_expanded_permissions (const uuid_t& uuid) const;
		std::set<std::string> get_expanded_permissions (const uuid_t& uuid,
			const context_set& ctx) const;
	};
}

#endif
