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

#ifndef _hPerms__TRACE_H_
#define _hPerms__TRACE_H_

#include "resolver/wildcard.hpp"
#include "context/context_set.hpp"
#include <string>


namespace hPerms {
	
	/*
	 * Explains how a single permission check was resolved.
	 */
	class permission_trace
	{
		std::string perm;
		tristate result;
		std::string matched_node;
		match_type type;
		std::string source_group; // empty if not from a group
		bool from_user;
		context_set contexts;
		
	public:
		permission_trace (const std::string& perm, tristate result,
			const std::string& matched_node, match_type type,
			const std::string& source_group, bool from_user,
			const context_set& contexts);
		
		static permission_trace not_found (const std::string& perm,
			const context_set& contexts);
		static permission_trace for_user (const std::string& perm,
			const match_result& match, const context_set& contexts);
		static permission_trace for_group (const std::string& perm,
			const match_result& match, const std::string& group_name,
			const context_set& contexts);
		
		
		
		const std::string& get_permission () const { return this->perm; }
		tristate get_result () const { return this->result; }
		const std::string& get_matched_node () const { return this->matched_node; }
		match_type get_match_type () const { return this->type; }
		const std::string& get_source_group () const { return this->source_group; }
		bool is_from_user () const { return this->from_user; }
		const context_set& get_contexts () const { return this->contexts; }
		
		bool is_matched () const { return this->type != MT_NONE; }
		bool is_from_wildcard () const;
		bool is_from_negation () const;
		
		/*
		 * Returns "user", "group:<name>" or "unknown".
		 */
		std::string get_source_description () const;
		
		/*
		 * Single-line summary.
		 */
		std::string to_string () const;
		
		/*
		 * Multi-line report, one field per line.
		 */
		std::string to_verbose_string () const;
	};
}

#endif
