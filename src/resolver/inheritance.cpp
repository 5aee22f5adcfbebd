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

#include "resolver/inheritance.hpp"
#include "util/stringutils.hpp"
#include <unordered_set>
#include <algorithm>
#include <stdexcept>
#include <deque>


namespace hPerms {
	
	inheritance_graph::inheritance_graph (const group_loader& loader)
		: loader (loader)
	{
		if (!this->loader)
			throw std::invalid_argument ("group loader cannot be empty");
	}
	
	
	
	std::vector<const group *>
	inheritance_graph::resolve_inheritance (const std::set<std::string>& start,
		const context_set& contexts) const
	{
		std::vector<const group *> result;
		std::unordered_set<std::string> visited;
		std::deque<std::string> queue;
		
		for (const std::string& name : start)
			queue.push_back (sutils::to_lower (name));
		
		while (!queue.empty ())
			{
				std::string name = queue.front ();
				queue.pop_front ();
				
				if (!visited.insert (name).second)
					continue;
				
				const group *grp = this->loader (name);
				if (!grp)
					continue;
				
				result.push_back (grp);
				for (const std::string& parent : grp->get_parents (contexts))
					if (visited.find (parent) == visited.end ())
						queue.push_back (parent);
			}
		
		std::stable_sort (result.begin (), result.end (),
			[] (const group *a, const group *b) {
				return a->get_weight () < b->get_weight ();
			});
		return result;
	}
	
	
	std::vector<node>
	inheritance_graph::applicable_nodes (const permission_holder& holder,
		const context_set& contexts)
	{
		std::vector<node> nodes;
		for (const node& n : holder.get_nodes ())
			{
				if (!n.is_expired () && !n.is_group_node () && n.applies_in (contexts))
					nodes.push_back (n);
			}
		return nodes;
	}
	
	std::vector<node>
	inheritance_graph::collect_nodes (const std::vector<const group *>& groups,
		const context_set& contexts) const
	{
		std::vector<node> nodes;
		for (const group *grp : groups)
			{
				std::vector<node> curr = applicable_nodes (*grp, contexts);
				nodes.insert (nodes.end (), curr.begin (), curr.end ());
			}
		return nodes;
	}
	
	
	bool
	inheritance_graph::would_create_cycle (const group& grp,
		const std::string& parent) const
	{
		std::unordered_set<std::string> visited;
		std::deque<std::string> queue;
		queue.push_back (sutils::to_lower (parent));
		
		while (!queue.empty ())
			{
				std::string name = queue.front ();
				queue.pop_front ();
				
				if (sutils::iequals (name, grp.get_name ()))
					return true;
				if (!visited.insert (name).second)
					continue;
				
				const group *curr = this->loader (name);
				if (curr)
					for (const std::string& p : curr->get_parents ())
						queue.push_back (p);
			}
		
		return false;
	}
	
	
	std::vector<std::string>
	inheritance_graph::get_inheritance_chain (const std::string& name) const
	{
		std::set<std::string> start;
		start.insert (name);
		
		std::vector<std::string> chain;
		for (const group *grp : this->resolve_inheritance (start, context_set::empty ()))
			chain.push_back (grp->get_name ());
		return chain;
	}
}
