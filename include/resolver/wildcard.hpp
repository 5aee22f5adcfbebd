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

#ifndef _hPerms__WILDCARD_H_
#define _hPerms__WILDCARD_H_

#include <string>
#include <vector>
#include <unordered_map>


namespace hPerms {
	
	/*
	 * Outcome of a permission check.
	 */
	enum tristate
	{
		TS_TRUE,
		TS_FALSE,
		TS_UNDEFINED,
	};
	
	/*
	 * Converts a tristate into a boolean, mapping TS_UNDEFINED to @{def}.
	 */
	inline bool
	as_boolean (tristate ts, bool def = false)
		{ return (ts == TS_UNDEFINED) ? def : (ts == TS_TRUE); }
	
	const char* tristate_name (tristate ts);
	
	
	enum match_type
	{
		MT_NONE,
		MT_EXACT,
		MT_EXACT_NEGATION,
		MT_WILDCARD,
		MT_WILDCARD_NEGATION,
		MT_UNIVERSAL,
		MT_UNIVERSAL_NEGATION,
	};
	
	const char* match_type_name (match_type mt);
	
	
	/*
	 * Result of a traced check: the outcome, the key in the permission map
	 * that decided it (empty if none) and how that key matched.
	 */
	struct match_result
	{
		tristate result;
		std::string matched_node;
		match_type type;
		
	//----
		match_result ()
			: result (TS_UNDEFINED), type (MT_NONE)
			{ }
		
		match_result (tristate result, const std::string& matched_node,
			match_type type)
			: result (result), matched_node (matched_node), type (type)
			{ }
		
		bool is_matched () const { return this->type != MT_NONE; }
		bool is_negation () const;
		bool is_wildcard () const;
	};
	
	
	/*
	 * Pattern -> value map of effective permissions.
	 */
	typedef std::unordered_map<std::string, bool> permission_map;
	
	
	
	/*
	 * Wildcard-aware permission matching.
	 * 
	 * A permission is resolved against a permission map in the following
	 * order, the first hit deciding the outcome:
	 *   1. "*" granted (true).
	 *   2. "-*" granted.
	 *   3. The exact permission, then its negation ("-" + permission).
	 *   4. Prefix wildcards from the shortest prefix to the longest ("a.*"
	 *      before "a.b.*"). At each length: the wildcard granted, its
	 *      negation granted, then the wildcard set to false.
	 * Broad grants are therefore consulted before narrow denials. "*" set to
	 * false (what a "-*" node resolves to) only decides through "-*"; on its
	 * own it matches nothing.
	 * 
	 * If nothing matches and the permission starts with a common namespace
	 * prefix (com., net., org., io., me.), steps 3 and 4 are repeated for the
	 * permission with that prefix removed.
	 */
	namespace wildcard {
		
		/*
		 * Checks whether @{pattern} (a literal permission, "*" or "x.y.*")
		 * covers @{perm}.
		 */
		bool matches (const std::string& perm, const std::string& pattern);
		
		/*
		 * Resolves @{perm} against the given map. An empty permission yields
		 * TS_UNDEFINED.
		 */
		tristate check (const std::string& perm, const permission_map& values);
		
		/*
		 * Same as check (), but also reports which entry decided the outcome.
		 */
		match_result check_with_trace (const std::string& perm,
			const permission_map& values);
		
		/*
		 * Returns every pattern that could cover @{perm}, from the most
		 * specific to the least specific:
		 *   "a.b.c" -> ["a.b.c", "a.b.*", "a.*", "*"]
		 */
		std::vector<std::string> generate_patterns (const std::string& perm);
	}
}

#endif
