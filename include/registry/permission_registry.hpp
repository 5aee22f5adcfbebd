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

#ifndef _hPerms__PERMISSION_REGISTRY_H_
#define _hPerms__PERMISSION_REGISTRY_H_

#include <string>
#include <vector>
#include <set>
#include <map>
#include <mutex>


namespace hPerms {
	
	namespace cfg {
		class array;
	}
	
	
	struct permission_info
	{
		std::string perm;        // lowercase
		std::string description;
		std::string category;    // lowercase
		std::string plugin;
		
	//----
		permission_info () { }
		permission_info (const std::string& perm, const std::string& description,
			const std::string& category, const std::string& plugin);
		
		bool is_wildcard () const;
		std::string to_string () const;
	};
	
	
	/*
	 * The set of concrete permissions known to the host, used to expand
	 * wildcards into the permissions they cover.
	 */
	class permission_registry
	{
		std::map<std::string, permission_info> perms;
		mutable std::mutex lock;
		
	public:
		/*
		 * Registers a new permission.
		 * Returns false if the permission is already registered.
		 */
		bool add (const std::string& perm, const std::string& description,
			const std::string& category, const std::string& plugin = "hperms");
		
		bool remove (const std::string& perm);
		
		/*
		 * Copies the entry for @{perm} into @{out}. Returns false if the
		 * permission is not registered.
		 */
		bool find (const std::string& perm, permission_info& out) const;
		bool is_registered (const std::string& perm) const;
		
		
		/*
		 * The following return their results sorted by permission.
		 */
		std::vector<permission_info> all () const;
		std::vector<permission_info> by_category (const std::string& category) const;
		std::vector<permission_info> by_plugin (const std::string& plugin) const;
		
		/*
		 * Case-insensitive search through permission names and descriptions.
		 */
		std::vector<permission_info> search (const std::string& query) const;
		
		std::set<std::string> categories () const;
		
		int size () const;
		void clear ();
		
		
		/*
		 * Returns the registered permissions covered by the given wildcard:
		 *   "*"   -> every registered permission that is not a wildcard.
		 *   "p.*" -> every registered permission starting with "p.", other
		 *            than the pattern itself.
		 * Anything else yields an empty set.
		 */
		std::set<std::string> get_matching_permissions (const std::string& pattern) const;
		
		
		
		/*
		 * Loads entries of the form
		 *   { permission: "..."; description: "..."; category: "..."; plugin: "..."; }
		 * Only "permission" is required.
		 * Throws `cfg::cfg_error' on malformed entries.
		 */
		void load (const cfg::array& arr);
		void save (cfg::array& arr) const;
	};
}

#endif
