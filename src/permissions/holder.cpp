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

#include "permissions/holder.hpp"
#include "util/stringutils.hpp"
#include <algorithm>


namespace hPerms {
	
	/*
	 * Returns the nodes that apply in the specified contexts.
	 */
	std::vector<node>
	permission_holder::get_nodes (const context_set& contexts) const
	{
		std::vector<node> res;
		for (const node& n : this->nodes)
			if (n.applies_in (contexts))
				res.push_back (n);
		return res;
	}
	
	bool
	permission_holder::has_node (const node& n) const
	{
		return std::find (this->nodes.begin (), this->nodes.end (), n)
			!= this->nodes.end ();
	}
	
	
	
	mutate_result
	permission_holder::add_node (const node& n)
	{
		if (this->has_node (n))
			return MUTATE_ALREADY_EXISTS;
		
		this->nodes.push_back (n);
		return MUTATE_SUCCESS;
	}
	
	mutate_result
	permission_holder::remove_node (const node& n)
	{
		auto itr = std::find (this->nodes.begin (), this->nodes.end (), n);
		if (itr == this->nodes.end ())
			return MUTATE_DOES_NOT_EXIST;
		
		this->nodes.erase (itr);
		return MUTATE_SUCCESS;
	}
	
	/*
	 * Removes every node whose permission string equals @{perm}.
	 */
	mutate_result
	permission_holder::remove_node (const std::string& perm)
	{
		std::string lperm = sutils::to_lower (perm);
		auto itr = std::remove_if (this->nodes.begin (), this->nodes.end (),
			[&lperm] (const node& n) { return n.get_permission () == lperm; });
		if (itr == this->nodes.end ())
			return MUTATE_DOES_NOT_EXIST;
		
		this->nodes.erase (itr, this->nodes.end ());
		return MUTATE_SUCCESS;
	}
	
	/*
	 * Adds the specified node, replacing any node that differs from it only
	 * in its expiry.
	 */
	mutate_result
	permission_holder::set_node (const node& n)
	{
		this->nodes.erase (std::remove_if (this->nodes.begin (), this->nodes.end (),
			[&n] (const node& o) { return o.equals_ignoring_expiry (n); }),
			this->nodes.end ());
		this->nodes.push_back (n);
		return MUTATE_SUCCESS;
	}
	
	void
	permission_holder::clear_nodes ()
	{
		this->nodes.clear ();
	}
	
	void
	permission_holder::clear_nodes (const context_set& contexts)
	{
		this->nodes.erase (std::remove_if (this->nodes.begin (), this->nodes.end (),
			[&contexts] (const node& n) { return n.get_contexts () == contexts; }),
			this->nodes.end ());
	}
	
	
	int
	permission_holder::cleanup_expired ()
	{
		return this->cleanup_expired (std::time (nullptr));
	}
	
	int
	permission_holder::cleanup_expired (std::time_t now)
	{
		int before = this->nodes.size ();
		this->nodes.erase (std::remove_if (this->nodes.begin (), this->nodes.end (),
			[now] (const node& n) { return n.is_expired (now); }),
			this->nodes.end ());
		return before - (int)this->nodes.size ();
	}
	
	
	
	static void
	_add_unique (std::vector<std::string>& vec, const std::string& name)
	{
		if (std::find (vec.begin (), vec.end (), name) == vec.end ())
			vec.push_back (name);
	}
	
	std::vector<std::string>
	permission_holder::get_inherited_groups () const
	{
		std::vector<std::string> groups;
		for (const node& n : this->nodes)
			if (n.is_group_node () && !n.is_expired ())
				_add_unique (groups, n.get_group_name ());
		return groups;
	}
	
	std::vector<std::string>
	permission_holder::get_inherited_groups (const context_set& contexts) const
	{
		std::vector<std::string> groups;
		for (const node& n : this->nodes)
			if (n.is_group_node () && !n.is_expired () && n.applies_in (contexts))
				_add_unique (groups, n.get_group_name ());
		return groups;
	}
	
	
	mutate_result
	permission_holder::add_group (const std::string& name)
	{
		return this->add_node (node::group_node (name));
	}
	
	mutate_result
	permission_holder::remove_group (const std::string& name)
	{
		return this->remove_node (node::GROUP_PREFIX + sutils::to_lower (name));
	}
}
