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

#ifndef _hPerms__INHERITANCE_H_
#define _hPerms__INHERITANCE_H_

#include "permissions/group.hpp"
#include "context/context_set.hpp"
#include <functional>
#include <string>
#include <vector>
#include <set>


namespace hPerms {
	
	/*
	 * Looks up a group by its (lowercase) name. Returns null if no such group
	 * exists. Must be safe to call concurrently.
	 * 
	 * The returned pointer is borrowed: it is only used for the duration of
	 * the resolution that requested it, and the group it points to must stay
	 * alive until then. The loader of a `group_registry' hands out pointers
	 * that its remove (), clear () and load () delete, so callers must not
	 * run those concurrently with a resolution (or a check) that uses it.
	 */
	typedef std::function<const group* (const std::string&)> group_loader;
	
	
	/*
	 * Flattens group inheritance.
	 */
	class inheritance_graph
	{
		group_loader loader;
		
	public:
		/*
		 * Throws `std::invalid_argument' if the loader is empty.
		 */
		inheritance_graph (const group_loader& loader);
		
		
		
		/*
		 * Returns the given groups along with every group they inherit from
		 * (directly or not) in the specified contexts, each group exactly once,
		 * sorted by ascending weight.
		 * 
		 * Groups are discovered breadth-first, starting names in order and then
		 * parents in declaration order; groups of equal weight keep that order.
		 * Groups that cannot be loaded are skipped, and cycles are cut at the
		 * first revisit.
		 */
		std::vector<const group *> resolve_inheritance (
			const std::set<std::string>& start, const context_set& contexts) const;
		
		/*
		 * Returns the nodes of @{holder} that take part in resolution: not
		 * expired, not group nodes, and applicable in @{contexts}. Declaration
		 * order is kept.
		 */
		static std::vector<node> applicable_nodes (const permission_holder& holder,
			const context_set& contexts);
		
		/*
		 * Returns the applicable nodes of the given groups, group by group.
		 */
		std::vector<node> collect_nodes (const std::vector<const group *>& groups,
			const context_set& contexts) const;
		
		/*
		 * Checks whether making @{parent} a parent of @{grp} would introduce a
		 * cycle, that is, whether @{grp} is reachable from @{parent}. All parent
		 * links are followed regardless of context.
		 */
		bool would_create_cycle (const group& grp, const std::string& parent) const;
		
		/*
		 * Returns the names of the groups resolved from @{name} in the empty
		 * context, by ascending weight.
		 */
		std::vector<std::string> get_inheritance_chain (const std::string& name) const;
	};
}

#endif
