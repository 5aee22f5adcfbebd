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

#include "permissions/node.hpp"
#include "util/stringutils.hpp"
#include <stdexcept>
#include <sstream>


namespace hPerms {
	
	const char *node::GROUP_PREFIX = "group.";
	
	
	node::node (const std::string& perm, bool value, const context_set& contexts,
		std::time_t expiry)
		: perm (sutils::to_lower (perm)), val (value), ctx (contexts),
			expiry (expiry)
	{
		if (this->perm.empty ())
			throw std::invalid_argument ("node permission cannot be empty");
	}
	
	
	/*
	 * Returns a node granting membership of the specified group.
	 */
	node
	node::group_node (const std::string& group_name, const context_set& contexts,
		std::time_t expiry)
	{
		if (group_name.empty ())
			throw std::invalid_argument ("group name cannot be empty");
		return node (GROUP_PREFIX + group_name, true, contexts, expiry);
	}
	
	
	
	bool
	node::is_expired () const
	{
		return this->is_expired (std::time (nullptr));
	}
	
	bool
	node::is_expired (std::time_t now) const
	{
		return this->expiry != 0 && now > this->expiry;
	}
	
	
	bool
	node::is_group_node () const
	{
		return sutils::starts_with (this->perm, GROUP_PREFIX);
	}
	
	std::string
	node::get_group_name () const
	{
		if (!this->is_group_node ())
			return std::string ();
		return this->perm.substr (std::char_traits<char>::length (GROUP_PREFIX));
	}
	
	
	bool
	node::is_negated () const
	{
		return this->perm[0] == '-';
	}
	
	std::string
	node::get_base_permission () const
	{
		return this->is_negated () ? this->perm.substr (1) : this->perm;
	}
	
	bool
	node::is_wildcard () const
	{
		return this->perm == "*" || sutils::ends_with (this->perm, ".*");
	}
	
	
	
	node
	node::with_expiry (std::time_t expiry) const
	{
		return node (this->perm, this->val, this->ctx, expiry);
	}
	
	node
	node::with_contexts (const context_set& contexts) const
	{
		return node (this->perm, this->val, contexts, this->expiry);
	}
	
	bool
	node::equals_ignoring_expiry (const node& other) const
	{
		return this->perm == other.perm && this->val == other.val
			&& this->ctx == other.ctx;
	}
	
	
	
	std::string
	node::to_string () const
	{
		std::ostringstream ss;
		ss << "node{" << this->perm;
		if (!this->val)
			ss << ", value=false";
		if (this->expiry != 0)
			ss << ", expiry=" << (long long)this->expiry;
		if (!this->ctx.is_empty ())
			ss << ", contexts=" << this->ctx.to_string ();
		ss << "}";
		return ss.str ();
	}
	
	
	
	bool
	node::operator== (const node& other) const
	{
		return this->equals_ignoring_expiry (other) && this->expiry == other.expiry;
	}
	
	bool
	node::operator!= (const node& other) const
	{
		return !this->operator== (other);
	}
}
