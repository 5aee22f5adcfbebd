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

#ifndef _hPerms__NODE_H_
#define _hPerms__NODE_H_

#include "context/context_set.hpp"
#include <string>
#include <ctime>


namespace hPerms {
	
	/*
	 * A single permission assertion held by a user or a group.
	 * 
	 * The permission string is lowercased on construction. A leading '-'
	 * marks a negated node, whose effective value is the opposite of its
	 * stored value. Nodes whose permission starts with "group." denote
	 * membership of (or inheritance from) the named group.
	 */
	class node
	{
		std::string perm;
		bool val;
		context_set ctx;
		std::time_t expiry; // 0 = permanent
		
	public:
		static const char *GROUP_PREFIX;
		
	public:
		/*
		 * Constructs a new node.
		 * Throws `std::invalid_argument' if the permission string is empty.
		 */
		node (const std::string& perm, bool value = true,
			const context_set& contexts = context_set (), std::time_t expiry = 0);
		
		/*
		 * Returns a node granting membership of the specified group.
		 */
		static node group_node (const std::string& group_name,
			const context_set& contexts = context_set (), std::time_t expiry = 0);
		
		
		
		const std::string& get_permission () const { return this->perm; }
		bool get_value () const { return this->val; }
		const context_set& get_contexts () const { return this->ctx; }
		std::time_t get_expiry () const { return this->expiry; }
		
		
		bool is_expired () const;
		bool is_expired (std::time_t now) const;
		bool is_temporary () const { return this->expiry != 0; }
		bool is_permanent () const { return this->expiry == 0; }
		
		bool is_group_node () const;
		
		/*
		 * Returns the name of the group this node refers to, or an empty string
		 * if this is not a group node.
		 */
		std::string get_group_name () const;
		
		bool is_negated () const;
		
		/*
		 * Returns the permission without its negation prefix.
		 */
		std::string get_base_permission () const;
		
		/*
		 * Checks whether the permission is "*" or ends with ".*".
		 */
		bool is_wildcard () const;
		
		/*
		 * Checks whether this node's context restriction is satisfied by the
		 * given set of active contexts.
		 */
		bool
		applies_in (const context_set& current) const
			{ return this->ctx.is_satisfied_by (current); }
		
		
		node with_expiry (std::time_t expiry) const;
		node with_contexts (const context_set& contexts) const;
		
		bool equals_ignoring_expiry (const node& other) const;
		
		std::string to_string () const;
		
	//----
		bool operator== (const node& other) const;
		bool operator!= (const node& other) const;
	};
}

#endif
