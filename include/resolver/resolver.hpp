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

#ifndef _hPerms__RESOLVER_H_
#define _hPerms__RESOLVER_H_

#include "resolver/wildcard.hpp"
#include "resolver/inheritance.hpp"
#include "resolver/trace.hpp"
#include "permissions/user.hpp"
#include "permissions/group.hpp"
#include "context/context_set.hpp"
#include <unordered_map>
#include <string>
#include <set>


namespace hPerms {
	
	class alias_table;
	class permission_registry;
	
	
	/*
	 * The effective permissions of a user or a group in a given set of
	 * contexts. Immutable once constructed.
	 */
	class resolved_permissions
	{
	public:
		// pattern -> name of the group that set it (empty = the user).
		typedef std::unordered_map<std::string, std::string> source_map;
		
	private:
		permission_map perms;
		source_map sources;
		context_set contexts;
		const alias_table *aliases;
		
	private:
		match_result match_with_aliases (const std::string& lperm) const;
		
	public:
		resolved_permissions (const permission_map& perms, const source_map& sources,
			const context_set& contexts, const alias_table *aliases = nullptr);
		
		
		
		/*
		 * Checks the given permission against the effective map. If nothing
		 * matches, the simplified aliases and then the actual permissions of
		 * the queried permission are tried, in order.
		 */
		tristate check (const std::string& perm) const;
		
		/*
		 * Same as check (), but also reports which entry decided the result
		 * and who it came from.
		 */
		permission_trace check_with_trace (const std::string& perm) const;
		
		bool
		has_permission (const std::string& perm) const
			{ return as_boolean (this->check (perm)); }
		
		
		
		const permission_map& get_permissions () const { return this->perms; }
		const source_map& get_sources () const { return this->sources; }
		const context_set& get_contexts () const { return this->contexts; }
		
		/*
		 * Stores the group a pattern came from into @{out} (empty for the user).
		 * Returns false if the pattern is not set.
		 */
		bool find_source (const std::string& perm, std::string& out) const;
		
		std::set<std::string> get_granted_permissions () const;
		std::set<std::string> get_denied_permissions () const;
		
		/*
		 * Returns the granted permissions with wildcards expanded through the
		 * given registry and aliases expanded through the alias table.
		 */
		std::set<std::string> get_expanded_permissions (
			const permission_registry& registry) const;
		
		int size () const { return this->perms.size (); }
		bool is_empty () const { return this->perms.empty (); }
		
	//----
		bool operator== (const resolved_permissions& other) const;
		bool operator!= (const resolved_permissions& other) const;
	};
	
	
	
	/*
	 * Computes effective permissions.
	 * 
	 * Group nodes are applied by ascending group weight, then the user's own
	 * nodes. A node applies only if it is not expired, is not a group node,
	 * and its contexts are satisfied. A "-x" node is stored as x with the
	 * opposite value. Later nodes overwrite earlier ones for the same key.
	 * 
	 * The resolver holds no mutable state and may be shared between threads,
	 * provided the group loader may be.
	 */
	class permission_resolver
	{
		inheritance_graph graph;
		const alias_table *aliases;
		
	private:
		static void apply_node (permission_map& perms,
			resolved_permissions::source_map& sources, const node& n,
			const std::string& source);
		
		void apply_groups (const std::vector<const group *>& groups,
			const context_set& contexts, permission_map& perms,
			resolved_permissions::source_map& sources) const;
		
	public:
		/*
		 * Throws `std::invalid_argument' if the loader is empty.
		 */
		permission_resolver (const group_loader& loader,
			const alias_table *aliases = nullptr);
		
		const inheritance_graph& get_graph () const { return this->graph; }
		
		
		
		resolved_permissions resolve (const user& usr, const context_set& contexts) const;
		
		/*
		 * Resolves a group on its own (its ancestry, without any user).
		 */
		resolved_permissions resolve_group (const group& grp,
			const context_set& contexts) const;
		
		
		tristate check (const user& usr, const std::string& perm,
			const context_set& contexts) const;
		permission_trace check_with_trace (const user& usr, const std::string& perm,
			const context_set& contexts) const;
		bool has_permission (const user& usr, const std::string& perm,
			const context_set& contexts) const;
	};
}

#endif
