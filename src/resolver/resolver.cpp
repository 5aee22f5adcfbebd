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

#include "resolver/resolver.hpp"
#include "registry/aliases.hpp"
#include "registry/permission_registry.hpp"
#include "util/stringutils.hpp"


namespace hPerms {
	
	resolved_permissions::resolved_permissions (const permission_map& perms,
		const source_map& sources, const context_set& contexts,
		const alias_table *aliases)
		: perms (perms), sources (sources), contexts (contexts), aliases (aliases)
		{ }
	
	
	
	/*
	 * Wildcard check, falling back to aliases.
	 */
	match_result
	resolved_permissions::match_with_aliases (const std::string& lperm) const
	{
		match_result res = wildcard::check_with_trace (lperm, this->perms);
		if (res.is_matched () || !this->aliases)
			return res;
		
		for (const std::string& alias : this->aliases->get_aliases (lperm))
			{
				res = wildcard::check_with_trace (alias, this->perms);
				if (res.is_matched ())
					return res;
			}
		
		for (const std::string& actual : this->aliases->get_actual_permissions (lperm))
			{
				res = wildcard::check_with_trace (actual, this->perms);
				if (res.is_matched ())
					return res;
			}
		
		return match_result ();
	}
	
	
	tristate
	resolved_permissions::check (const std::string& perm) const
	{
		if (perm.empty ())
			return TS_UNDEFINED;
		return this->match_with_aliases (sutils::to_lower (perm)).result;
	}
	
	
	permission_trace
	resolved_permissions::check_with_trace (const std::string& perm) const
	{
		if (perm.empty ())
			return permission_trace::not_found (perm, this->contexts);
		
		match_result res = this->match_with_aliases (sutils::to_lower (perm));
		if (!res.is_matched ())
			return permission_trace::not_found (perm, this->contexts);
		
		auto itr = this->sources.find (res.matched_node);
		if (itr != this->sources.end () && !itr->second.empty ())
			return permission_trace::for_group (perm, res, itr->second, this->contexts);
		return permission_trace::for_user (perm, res, this->contexts);
	}
	
	
	
	bool
	resolved_permissions::find_source (const std::string& perm,
		std::string& out) const
	{
		auto itr = this->sources.find (sutils::to_lower (perm));
		if (itr == this->sources.end ())
			return false;
		
		out = itr->second;
		return true;
	}
	
	std::set<std::string>
	resolved_permissions::get_granted_permissions () const
	{
		std::set<std::string> res;
		for (auto& entry : this->perms)
			if (entry.second)
				res.insert (entry.first);
		return res;
	}
	
	std::set<std::string>
	resolved_permissions::get_denied_permissions () const
	{
		std::set<std::string> res;
		for (auto& entry : this->perms)
			if (!entry.second)
				res.insert (entry.first);
		return res;
	}
	
	
	static void
	_insert_all (std::set<std::string>& dest, const std::set<std::string>& src)
	{
		dest.insert (src.begin (), src.end ());
	}
	
	std::set<std::string>
	resolved_permissions::get_expanded_permissions (
		const permission_registry& registry) const
	{
		std::set<std::string> granted = this->get_granted_permissions ();
		std::set<std::string> expanded = granted;
		
		for (const std::string& perm : granted)
			{
				if (this->aliases)
					_insert_all (expanded, this->aliases->expand (perm));
				
				if (perm != "*" && !sutils::ends_with (perm, ".*"))
					continue;
				
				_insert_all (expanded, registry.get_matching_permissions (perm));
				if (this->aliases)
					{
						for (const std::string& actual : this->aliases->get_actual_permissions (perm))
							{
								expanded.insert (actual);
								if (sutils::ends_with (actual, ".*"))
									_insert_all (expanded, registry.get_matching_permissions (actual));
							}
					}
			}
		
		return expanded;
	}
	
	
	
	bool
	resolved_permissions::operator== (const resolved_permissions& other) const
	{
		return this->perms == other.perms && this->sources == other.sources
			&& this->contexts == other.contexts;
	}
	
	bool
	resolved_permissions::operator!= (const resolved_permissions& other) const
	{
		return !this->operator== (other);
	}
	
	
	
//----
	
	permission_resolver::permission_resolver (const group_loader& loader,
		const alias_table *aliases)
		: graph (loader), aliases (aliases)
		{ }
	
	
	
	void
	permission_resolver::apply_node (permission_map& perms,
		resolved_permissions::source_map& sources, const node& n,
		const std::string& source)
	{
		std::string perm = n.get_permission ();
		bool value = n.get_value ();
		if (n.is_negated ())
			{
				perm.erase (0, 1);
				value = !value;
			}
		
		perms[perm] = value;
		sources[perm] = source;
	}
	
	void
	permission_resolver::apply_groups (const std::vector<const group *>& groups,
		const context_set& contexts, permission_map& perms,
		resolved_permissions::source_map& sources) const
	{
		for (const group *grp : groups)
			for (const node& n : inheritance_graph::applicable_nodes (*grp, contexts))
				apply_node (perms, sources, n, grp->get_name ());
	}
	
	
	resolved_permissions
	permission_resolver::resolve (const user& usr, const context_set& contexts) const
	{
		permission_map perms;
		resolved_permissions::source_map sources;
		
		std::vector<std::string> names = usr.get_inherited_groups (contexts);
		std::set<std::string> start (names.begin (), names.end ());
		if (!usr.get_primary_group ().empty ())
			start.insert (usr.get_primary_group ());
		
		this->apply_groups (this->graph.resolve_inheritance (start, contexts),
			contexts, perms, sources);
		
		// the user's own nodes come last and override everything else.
		for (const node& n : inheritance_graph::applicable_nodes (usr, contexts))
			apply_node (perms, sources, n, "");
		
		return resolved_permissions (perms, sources, contexts, this->aliases);
	}
	
	resolved_permissions
	permission_resolver::resolve_group (const group& grp,
		const context_set& contexts) const
	{
		permission_map perms;
		resolved_permissions::source_map sources;
		
		std::set<std::string> start;
		start.insert (grp.get_name ());
		this->apply_groups (this->graph.resolve_inheritance (start, contexts),
			contexts, perms, sources);
		
		return resolved_permissions (perms, sources, contexts, this->aliases);
	}
	
	
	
	tristate
	permission_resolver::check (const user& usr, const std::string& perm,
		const context_set& contexts) const
	{
		return this->resolve (usr, contexts).check (perm);
	}
	
	permission_trace
	permission_resolver::check_with_trace (const user& usr,
		const std::string& perm, const context_set& contexts) const
	{
		return this->resolve (usr, contexts).check_with_trace (perm);
	}
	
	bool
	permission_resolver::has_permission (const user& usr, const std::string& perm,
		const context_set& contexts) const
	{
		return as_boolean (this->check (usr, perm, contexts));
	}
}
