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

#ifndef _hPerms__GROUP_REGISTRY_H_
#define _hPerms__GROUP_REGISTRY_H_

#include "permissions/group.hpp"
#include "resolver/inheritance.hpp"
#include <unordered_map>
#include <stdexcept>
#include <string>
#include <vector>
#include <mutex>


namespace hPerms {
	
	class logger;
	namespace cfg {
		class group;
	}
	
	
	class group_error: public std::runtime_error {
	public:
		group_error (const std::string& what)
			: std::runtime_error (what)
			{ }
	};
	
	
	/*
	 * Owns all groups, indexed by their (lowercase) name.
	 * 
	 * Pointers returned by the registry stay valid until the group is removed
	 * or the registry is cleared or reloaded.
	 */
	class group_registry
	{
		logger& log;
		std::unordered_map<std::string, group *> groups;
		mutable std::mutex lock;
		
	public:
		group_registry (logger& log);
		~group_registry ();
		
		group_registry (const group_registry&) = delete;
		group_registry& operator= (const group_registry&) = delete;
		
		
		
		/*
		 * Creates and registers a new group.
		 * Throws `group_error' if a group with the same name (ignoring case)
		 * already exists.
		 */
		group* create (const std::string& name, int weight = 0);
		
		/*
		 * Returns the group with the specified name, creating it if necessary.
		 */
		group* ensure (const std::string& name, int weight = 0);
		
		/*
		 * Case-insensitive lookup. Returns null if not found.
		 */
		group* find (const std::string& name) const;
		
		bool remove (const std::string& name);
		void clear ();
		
		/*
		 * Returns all groups sorted by ascending weight, then by name.
		 */
		std::vector<group *> all () const;
		int size () const;
		
		/*
		 * Returns a group loader that looks groups up in this registry.
		 * The groups it returns are owned by the registry: resolutions going
		 * through the loader must not overlap with remove (), clear () or
		 * load ().
		 */
		group_loader loader () const;
		
		
		
		/*
		 * Makes @{parent} a parent of @{name}.
		 * Throws `group_error' if either group does not exist, or if the link
		 * would make a group inherit from itself.
		 */
		mutate_result add_parent (const std::string& name, const std::string& parent);
		mutate_result remove_parent (const std::string& name, const std::string& parent);
		
		/*
		 * Removes expired nodes from all groups and returns how many were
		 * removed.
		 */
		int cleanup_expired ();
		
		
		
		/*
		 * Replaces the contents of the registry with the groups described by
		 * the given "groups" block:
		 *   name: { weight: 10; display-name: "..."; parents: [...]; permissions: [...]; };
		 * 
		 * Throws `storage_error' on malformed input. Unknown parents and
		 * inheritance cycles are reported through the logger.
		 */
		void load (const cfg::group& grp_groups);
		
		/*
		 * Writes all groups, by ascending weight, into @{grp_groups}.
		 */
		void save (cfg::group& grp_groups) const;
	};
}

#endif
