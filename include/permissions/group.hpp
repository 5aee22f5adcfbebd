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

#ifndef _hPerms__GROUP_H_
#define _hPerms__GROUP_H_

#include "permissions/holder.hpp"
#include <string>
#include <vector>


namespace hPerms {
	
	/*
	 * A named collection of permission nodes.
	 * Parents are expressed as group nodes; a group inherits the permissions
	 * of all of its parents.
	 */
	class group: public permission_holder
	{
		std::string name;
		std::string display_name;
		int weight; // higher weight = higher priority when nodes conflict.
		
	public:
		/*
		 * Constructs a new group. The name is lowercased.
		 * Throws `std::invalid_argument' if the name is empty.
		 */
		group (const std::string& name, int weight = 0);
		
		
		
		const std::string& get_name () const { return this->name; }
		
		const std::string& get_display_name () const { return this->display_name; }
		
		/*
		 * An empty display name resets it to the group's name.
		 */
		void set_display_name (const std::string& display_name);
		
		int get_weight () const { return this->weight; }
		void set_weight (int weight) { this->weight = weight; }
		
		virtual std::string get_identifier () const override { return this->name; }
		virtual std::string get_friendly_name () const override { return this->display_name; }
		
		
		
		mutate_result add_parent (const std::string& parent)
			{ return this->add_group (parent); }
		mutate_result remove_parent (const std::string& parent)
			{ return this->remove_group (parent); }
		
		std::vector<std::string> get_parents () const
			{ return this->get_inherited_groups (); }
		std::vector<std::string> get_parents (const context_set& contexts) const
			{ return this->get_inherited_groups (contexts); }
		
		std::string to_string () const;
	};
}

#endif
