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

#include "resolver/trace.hpp"
#include <sstream>


namespace hPerms {
	
	permission_trace::permission_trace (const std::string& perm, tristate result,
		const std::string& matched_node, match_type type,
		const std::string& source_group, bool from_user,
		const context_set& contexts)
		: perm (perm), result (result), matched_node (matched_node), type (type),
			source_group (source_group), from_user (from_user), contexts (contexts)
		{ }
	
	
	permission_trace
	permission_trace::not_found (const std::string& perm,
		const context_set& contexts)
	{
		return permission_trace (perm, TS_UNDEFINED, "", MT_NONE, "", false,
			contexts);
	}
	
	permission_trace
	permission_trace::for_user (const std::string& perm,
		const match_result& match, const context_set& contexts)
	{
		return permission_trace (perm, match.result, match.matched_node,
			match.type, "", true, contexts);
	}
	
	permission_trace
	permission_trace::for_group (const std::string& perm,
		const match_result& match, const std::string& group_name,
		const context_set& contexts)
	{
		return permission_trace (perm, match.result, match.matched_node,
			match.type, group_name, false, contexts);
	}
	
	
	
	bool
	permission_trace::is_from_wildcard () const
	{
		return match_result (this->result, this->matched_node, this->type)
			.is_wildcard ();
	}
	
	bool
	permission_trace::is_from_negation () const
	{
		return match_result (this->result, this->matched_node, this->type)
			.is_negation ();
	}
	
	
	std::string
	permission_trace::get_source_description () const
	{
		if (this->from_user)
			return "user";
		if (!this->source_group.empty ())
			return "group:" + this->source_group;
		return "unknown";
	}
	
	
	
	std::string
	permission_trace::to_string () const
	{
		std::ostringstream ss;
		ss << "trace{permission=" << this->perm
			 << ", result=" << tristate_name (this->result);
		if (!this->matched_node.empty ())
			ss << ", matched-node=" << this->matched_node;
		ss << ", match-type=" << match_type_name (this->type)
			 << ", source=" << this->get_source_description ();
		if (!this->contexts.is_empty ())
			ss << ", contexts=" << this->contexts.to_string ();
		ss << "}";
		return ss.str ();
	}
	
	std::string
	permission_trace::to_verbose_string () const
	{
		std::ostringstream ss;
		ss << "Permission check trace\n"
			 << "  Permission: " << this->perm << "\n"
			 << "  Result: " << tristate_name (this->result) << "\n"
			 << "  Match type: " << match_type_name (this->type) << "\n";
		if (!this->matched_node.empty ())
			ss << "  Matched node: " << this->matched_node << "\n";
		ss << "  Source: " << this->get_source_description () << "\n";
		if (!this->contexts.is_empty ())
			ss << "  Active contexts: " << this->contexts.to_string () << "\n";
		return ss.str ();
	}
}
