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

#ifndef _hPerms__ALIASES_H_
#define _hPerms__ALIASES_H_

#include <string>
#include <set>
#include <map>
#include <mutex>
#include <vector>


namespace hPerms {
	
	namespace cfg {
		class array;
	}
	
	
	/*
	 * Maps simplified permission names to the permissions the host actually
	 * checks, and back. Consulted by resolved permission sets when a
	 * permission does not match anything directly.
	 */
	class alias_table
	{
	public:
		virtual ~alias_table () { }
		
		/*
		 * Returns the simplified names that map to the specified actual
		 * permission.
		 */
		virtual std::set<std::string> get_aliases (const std::string& perm) const = 0;
		
		/*
		 * Returns the actual permissions the specified simplified name maps to.
		 */
		virtual std::set<std::string> get_actual_permissions (
			const std::string& perm) const = 0;
		
		/*
		 * Returns the permission itself along with its actual permissions.
		 */
		virtual std::set<std::string> expand (const std::string& perm) const;
	};
	
	
	
	/*
	 * In-memory alias table.
	 */
	class permission_aliases: public alias_table
	{
		std::map<std::string, std::set<std::string>> alias_to_actual;
		std::map<std::string, std::set<std::string>> actual_to_alias;
		mutable std::mutex lock;
		
	public:
		/*
		 * Maps the simplified name @{alias} to each of the given actual
		 * permissions. Repeated calls for the same alias accumulate.
		 */
		void add (const std::string& alias, const std::vector<std::string>& actuals);
		void add (const std::string& alias, const std::string& actual);
		
		/*
		 * Removes the given alias and all of its mappings.
		 */
		bool remove (const std::string& alias);
		
		virtual std::set<std::string> get_aliases (const std::string& perm) const override;
		virtual std::set<std::string> get_actual_permissions (
			const std::string& perm) const override;
		
		bool has_aliases (const std::string& perm) const;
		
		/*
		 * Returns the number of simplified names.
		 */
		int size () const;
		void clear ();
		
		
		
		/*
		 * Loads entries of the form { alias: "..."; actual: ["...", ...]; }.
		 * Throws `cfg::cfg_error' on malformed entries.
		 */
		void load (const cfg::array& arr);
		void save (cfg::array& arr) const;
	};
}

#endif
