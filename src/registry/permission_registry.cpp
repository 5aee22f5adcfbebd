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

#include "registry/permission_registry.hpp"
#include "util/stringutils.hpp"
#include "util/config.hpp"


namespace hPerms {
	
	permission_info::permission_info (const std::string& perm,
		const std::string& description, const std::string& category,
		const std::string& plugin)
		: perm (sutils::to_lower (perm)), description (description),
			category (sutils::to_lower (category)), plugin (plugin)
		{ }
	
	
	bool
	permission_info::is_wildcard () const
	{
		return this->perm.find ('*') != std::string::npos;
	}
	
	std::string
	permission_info::to_string () const
	{
		return this->perm + " - " + this->description + " [" + this->category + "]";
	}
	
	
	
//----
	
	bool
	permission_registry::add (const std::string& perm,
		const std::string& description, const std::string& category,
		const std::string& plugin)
	{
		permission_info info (perm, description, category, plugin);
		if (info.perm.empty ())
			return false;
		
		std::lock_guard<std::mutex> guard {this->lock};
		return this->perms.insert (std::make_pair (info.perm, info)).second;
	}
	
	bool
	permission_registry::remove (const std::string& perm)
	{
		std::lock_guard<std::mutex> guard {this->lock};
		return this->perms.erase (sutils::to_lower (perm)) > 0;
	}
	
	
	bool
	permission_registry::find (const std::string& perm, permission_info& out) const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = this->perms.find (sutils::to_lower (perm));
		if (itr == this->perms.end ())
			return false;
		
		out = itr->second;
		return true;
	}
	
	bool
	permission_registry::is_registered (const std::string& perm) const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		return this->perms.find (sutils::to_lower (perm)) != this->perms.end ();
	}
	
	
	
	std::vector<permission_info>
	permission_registry::all () const
	{
		std::vector<permission_info> res;
		
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto& entry : this->perms)
			res.push_back (entry.second);
		return res;
	}
	
	std::vector<permission_info>
	permission_registry::by_category (const std::string& category) const
	{
		std::vector<permission_info> res;
		std::string lcat = sutils::to_lower (category);
		
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto& entry : this->perms)
			if (entry.second.category == lcat)
				res.push_back (entry.second);
		return res;
	}
	
	std::vector<permission_info>
	permission_registry::by_plugin (const std::string& plugin) const
	{
		std::vector<permission_info> res;
		
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto& entry : this->perms)
			if (sutils::iequals (entry.second.plugin, plugin))
				res.push_back (entry.second);
		return res;
	}
	
	std::vector<permission_info>
	permission_registry::search (const std::string& query) const
	{
		std::vector<permission_info> res;
		
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto& entry : this->perms)
			{
				const permission_info& info = entry.second;
				if (sutils::icontains (info.perm, query)
					|| sutils::icontains (info.description, query))
					res.push_back (info);
			}
		return res;
	}
	
	std::set<std::string>
	permission_registry::categories () const
	{
		std::set<std::string> res;
		
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto& entry : this->perms)
			res.insert (entry.second.category);
		return res;
	}
	
	
	int
	permission_registry::size () const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		return this->perms.size ();
	}
	
	void
	permission_registry::clear ()
	{
		std::lock_guard<std::mutex> guard {this->lock};
		this->perms.clear ();
	}
	
	
	
	/*
	 * Returns the registered permissions covered by the given wildcard.
	 */
	std::set<std::string>
	permission_registry::get_matching_permissions (const std::string& pattern) const
	{
		std::set<std::string> res;
		std::string lpattern = sutils::to_lower (pattern);
		
		std::lock_guard<std::mutex> guard {this->lock};
		if (lpattern == "*")
			{
				for (auto& entry : this->perms)
					if (!entry.second.is_wildcard ())
						res.insert (entry.first);
			}
		else if (sutils::ends_with (lpattern, ".*"))
			{
				std::string prefix = lpattern.substr (0, lpattern.size () - 1);
				
				// keys are sorted, so matches form a contiguous range.
				for (auto itr = this->perms.lower_bound (prefix);
					itr != this->perms.end () && sutils::starts_with (itr->first, prefix);
					++itr)
					{
						if (itr->first != lpattern)
							res.insert (itr->first);
					}
			}
		
		return res;
	}
	
	
	
	void
	permission_registry::load (const cfg::array& arr)
	{
		for (cfg::value *val : arr)
			{
				if (val->type () != cfg::CFG_GROUP)
					throw cfg::cfg_type_error ("registry entries must be groups");
				
				cfg::group *grp = static_cast<cfg::group *> (val);
				std::string perm = grp->get_string ("permission");
				std::string description, category, plugin = "hperms";
				grp->try_get_string ("description", description);
				grp->try_get_string ("category", category);
				grp->try_get_string ("plugin", plugin);
				
				this->add (perm, description, category, plugin);
			}
	}
	
	void
	permission_registry::save (cfg::array& arr) const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto& entry : this->perms)
			{
				const permission_info& info = entry.second;
				
				cfg::group *grp = new cfg::group ();
				grp->add_string ("permission", info.perm);
				if (!info.description.empty ())
					grp->add_string ("description", info.description);
				if (!info.category.empty ())
					grp->add_string ("category", info.category);
				grp->add_string ("plugin", info.plugin);
				arr.add (grp);
			}
	}
}
