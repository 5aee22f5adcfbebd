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

#ifndef _hPerms__HOLDER_H_
#define _hPerms__HOLDER_H_

#include "permissions/node.hpp"
#include <vector>
#include <string>


namespace hPerms {
	
	enum mutate_result
	{
		MUTATE_SUCCESS,
		MUTATE_ALREADY_EXISTS,
		MUTATE_DOES_NOT_EXIST,
	};
	
	
	/*
	 * Base class for entities that carry permission nodes (users and groups).
	 * Nodes are kept in declaration order.
	 * 
	 * Holders are plain data and are not synchronized: owners that share them
	 * across threads must guard them.
	 */
	class permission_holder
	{
	protected:
		std::vector<node> nodes;
		
	public:
		virtual ~permission_holder () { }
		
		/*
		 * Returns the name (or UUID) that identifies this holder.
		 */
		virtual std::string get_identifier () const = 0;
		virtual std::string get_friendly_name () const = 0;
		
		
		
		const std::vector<node>& get_nodes () const { return this->nodes; }
		
		/*
		 * Returns the nodes that apply in the specified contexts.
		 */
		std::vector<node> get_nodes (const context_set& contexts) const;
		
		bool has_node (const node& n) const;
		
		/*
		 * Appends the given node, unless an identical node already exists.
		 */
		mutate_result add_node (const node& n);
		
		mutate_result remove_node (const node& n);
		
		/*
		 * Removes every node whose permission string equals @{perm}.
		 */
		mutate_result remove_node (const std::string& perm);
		
		/*
		 * Adds the specified node, replacing any node that differs from it only
		 * in its expiry.
		 */
		mutate_result set_node (const node& n);
		
		void clear_nodes ();
		
		/*
		 * Removes the nodes whose context restriction equals @{contexts}.
		 */
		void clear_nodes (const context_set& contexts);
		
		/*
		 * Removes expired nodes and returns the number of nodes removed.
		 */
		int cleanup_expired ();
		int cleanup_expired (std::time_t now);
		
		
		
		/*
		 * Returns the names of the groups referenced by non-expired group nodes,
		 * in declaration order and without duplicates.
		 */
		virtual std::vector<std::string> get_inherited_groups () const;
		virtual std::vector<std::string> get_inherited_groups (
			const context_set& contexts) const;
		
		mutate_result add_group (const std::string& name);
		mutate_result remove_group (const std::string& name);
	};
}

#endif
