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

#ifndef _hPerms__STORAGE_H_
#define _hPerms__STORAGE_H_

#include "permissions/holder.hpp"
#include <stdexcept>
#include <string>


namespace hPerms {
	
	namespace cfg {
		class value;
		class array;
	}
	
	
	class storage_error: public std::runtime_error {
	public:
		storage_error (const std::string& what)
			: std::runtime_error (what)
			{ }
	};
	
	
	/*
	 * Conversion of nodes to and from the permissions file format.
	 * 
	 * A node is written as a plain string ("perm" or "-perm") when it grants
	 * its permission in all contexts without expiry, and as a group
	 * otherwise:
	 *   { permission: "fly"; value: false; contexts: ["world=nether"]; expiry: 1900000000; }
	 */
	namespace storage {
		
		/*
		 * Throws `storage_error' if the value does not describe a valid node.
		 */
		node read_node (const cfg::value& val);
		
		/*
		 * Returns a newly allocated value describing the given node.
		 */
		cfg::value* write_node (const node& n);
		
		
		/*
		 * Appends every node in @{arr} to the holder, in order.
		 */
		void read_nodes (const cfg::array& arr, permission_holder& holder);
		
		/*
		 * Writes the holder's nodes into @{arr}. Permanent, context-free group
		 * nodes are skipped when @{skip_plain_groups} is set (they are stored
		 * separately as parent/group lists).
		 */
		void write_nodes (const permission_holder& holder, cfg::array& arr,
			bool skip_plain_groups);
		
		/*
		 * Checks whether the node is a permanent group node without contexts.
		 */
		bool is_plain_group_node (const node& n);
	}
}

#endif
