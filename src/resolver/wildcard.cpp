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

#include "resolver/wildcard.hpp"
#include "util/stringutils.hpp"


namespace hPerms {
	
	const char*
	tristate_name (tristate ts)
	{
		switch (ts)
			{
				case TS_TRUE: return "true";
				case TS_FALSE: return "false";
				default: return "undefined";
			}
	}
	
	const char*
	match_type_name (match_type mt)
	{
		switch (mt)
			{
				case MT_EXACT: return "exact";
				case MT_EXACT_NEGATION: return "exact negation";
				case MT_WILDCARD: return "wildcard";
				case MT_WILDCARD_NEGATION: return "wildcard negation";
				case MT_UNIVERSAL: return "universal";
				case MT_UNIVERSAL_NEGATION: return "universal negation";
				default: return "none";
			}
	}
	
	
	bool
	match_result::is_negation () const
	{
		return this->type == MT_EXACT_NEGATION
			|| this->type == MT_WILDCARD_NEGATION
			|| this->type == MT_UNIVERSAL_NEGATION;
	}
	
	bool
	match_result::is_wildcard () const
	{
		return this->type == MT_WILDCARD
			|| this->type == MT_WILDCARD_NEGATION
			|| this->type == MT_UNIVERSAL
			|| this->type == MT_UNIVERSAL_NEGATION;
	}
	
	
	
	namespace wildcard {
		
		static const char *_common_prefixes[] = {
			"com.", "net.", "org.", "io.", "me.", nullptr };
		
		
		/*
		 * Returns 1 if @{key} is present and true, 0 if it is present and false,
		 * and -1 if it is absent.
		 */
		static int
		_lookup (const permission_map& values, const std::string& key)
		{
			auto itr = values.find (key);
			if (itr == values.end ())
				return -1;
			return itr->second ? 1 : 0;
		}
		
		/*
		 * Joins the first @{len} parts with dots and appends ".*".
		 */
		static std::string
		_build_wildcard (const std::vector<std::string>& parts, int len)
		{
			if (len == 0)
				return "*";
			
			std::string str;
			for (int i = 0; i < len; ++i)
				{
					str.append (parts[i]);
					str.push_back ('.');
				}
			str.push_back ('*');
			return str;
		}
		
		
		/*
		 * Exact and prefix wildcard lookup (steps 3 and 4) for a single,
		 * already lowercased permission.
		 */
		static bool
		_check_specific (const std::string& perm, const permission_map& values,
			match_result& res)
		{
			int v = _lookup (values, perm);
			if (v != -1)
				{
					res = match_result (v ? TS_TRUE : TS_FALSE, perm, MT_EXACT);
					return true;
				}
			
			std::string neg = "-" + perm;
			v = _lookup (values, neg);
			if (v != -1)
				{
					res = match_result (v ? TS_FALSE : TS_TRUE, neg, MT_EXACT_NEGATION);
					return true;
				}
			
			std::vector<std::string> parts = sutils::split (perm, '.');
			for (int len = 1; len < (int)parts.size (); ++len)
				{
					std::string wc = _build_wildcard (parts, len);
					v = _lookup (values, wc);
					if (v == 1)
						{
							res = match_result (TS_TRUE, wc, MT_WILDCARD);
							return true;
						}
					
					std::string neg_wc = "-" + wc;
					if (_lookup (values, neg_wc) == 1)
						{
							res = match_result (TS_FALSE, neg_wc, MT_WILDCARD_NEGATION);
							return true;
						}
					
					if (v == 0)
						{
							res = match_result (TS_FALSE, wc, MT_WILDCARD);
							return true;
						}
				}
			
			return false;
		}
		
		
		
		/*
		 * Checks whether @{pattern} covers @{perm}.
		 */
		bool
		matches (const std::string& perm, const std::string& pattern)
		{
			if (perm.empty () || pattern.empty ())
				return perm == pattern;
			if (perm == pattern || pattern == "*")
				return true;
			
			if (sutils::ends_with (pattern, ".*"))
				return sutils::starts_with (perm, pattern.substr (0, pattern.size () - 1));
			
			return false;
		}
		
		
		tristate
		check (const std::string& perm, const permission_map& values)
		{
			return check_with_trace (perm, values).result;
		}
		
		
		match_result
		check_with_trace (const std::string& perm, const permission_map& values)
		{
			if (perm.empty ())
				return match_result ();
			
			// universal grant and deny
			if (_lookup (values, "*") == 1)
				return match_result (TS_TRUE, "*", MT_UNIVERSAL);
			if (_lookup (values, "-*") == 1)
				return match_result (TS_FALSE, "-*", MT_UNIVERSAL_NEGATION);
			
			std::string lperm = sutils::to_lower (perm);
			
			match_result res;
			if (_check_specific (lperm, values, res))
				return res;
			
			// retry without the namespace prefix
			for (int i = 0; _common_prefixes[i]; ++i)
				{
					const char *prefix = _common_prefixes[i];
					if (!sutils::starts_with (lperm, prefix))
						continue;
					
					std::string stripped = lperm.substr (std::char_traits<char>::length (prefix));
					if (!stripped.empty () && _check_specific (stripped, values, res))
						return res;
				}
			
			return match_result ();
		}
		
		
		
		/*
		 * Returns every pattern that could cover @{perm}, most specific first.
		 */
		std::vector<std::string>
		generate_patterns (const std::string& perm)
		{
			std::vector<std::string> patterns;
			
			std::vector<std::string> parts = sutils::split (perm, '.');
			if (parts.empty ())
				{
					patterns.push_back (perm);
					patterns.push_back ("*");
					return patterns;
				}
			
			patterns.push_back (perm);
			for (int len = (int)parts.size () - 1; len >= 0; --len)
				patterns.push_back (_build_wildcard (parts, len));
			return patterns;
		}
	}
}
