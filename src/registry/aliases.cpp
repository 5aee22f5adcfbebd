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

#include "registry/aliases.hpp"
#include "util/stringutils.hpp"
#include "util/config.hpp"


namespace hPerms {
	
	std::set<std::string>
	alias_table::expand (const std::string& perm) const
	{
		std::set<std::string> res = this->get_actual_permissions (perm);
		res.insert (sutils::to_lower (perm));
		return res;
	}
	
	
	
//----
	
	void
	permission_aliases::add (const std::string& alias,
		const std::vector<std::string>& actuals)
	{
		std::string lalias = sutils::to_lower (alias);
		if (lalias.empty ())
			return;
		
		std::lock_guard<std::mutex> guard {this->lock};
		std::set<std::string>& dest = this->alias_to_actual[lalias];
		for (const std::string& actual : actuals)
			{
				std::string lactual = sutils::to_lower (actual);
				if (lactual.empty ())
					continue;
				
				dest.insert (lactual);
				this->actual_to_alias[lactual].insert (lalias);
			}
	}
	
	void
	permission_aliases::add (const std::string& alias, const std::string& actual)
	{
		this->add (alias, std::vector<std::string> {actual});
	}
	
	
	bool
	permission_aliases::remove (const std::string& alias)
	{
		std::string lalias = sutils::to_lower (alias);
		
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = this->alias_to_actual.find (lalias);
		if (itr == this->alias_to_actual.end ())
			return false;
		
		for (const std::string& actual : itr->second)
			{
				auto aitr = this->actual_to_alias.find (actual);
				if (aitr == this->actual_to_alias.end ())
					continue;
				
				aitr->second.erase (lalias);
				if (aitr->second.empty ())
					this->actual_to_alias.erase (aitr);
			}
		
		this->alias_to_actual.erase (itr);
		return true;
	}
	
	
	
	std::set<std::string>
	permission_aliases::get_aliases (const std::string& perm) const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = this->actual_to_alias.find (sutils::to_lower (perm));
		if (itr == this->actual_to_alias.end ())
			return std::set<std::string> ();
		return itr->second;
	}
	
	std::set<std::string>
	permission_aliases::get_actual_permissions (const std::string& perm) const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = this->alias_to_actual.find (sutils::to_lower (perm));
		if (itr == this->alias_to_actual.end ())
			return std::set<std::string> ();
		return itr->second;
	}
	
	bool
	permission_aliases::has_aliases (const std::string& perm) const
	{
		std::string lperm = sutils::to_lower (perm);
		
		std::lock_guard<std::mutex> guard {this->lock};
		return this->alias_to_actual.find (lperm) != this->alias_to_actual.end ()
			|| this->actual_to_alias.find (lperm) != this->actual_to_alias.end ();
	}
	
	
	int
	permission_aliases::size () const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		return this->alias_to_actual.size ();
	}
	
	void
	permission_aliases::clear ()
	{
		std::lock_guard<std::mutex> guard {this->lock};
		this->alias_to_actual.clear ();
		this->actual_to_alias.clear ();
	}
	
	
	
	void
	permission_aliases::load (const cfg::array& arr)
	{
		for (cfg::value *val : arr)
			{
				if (val->type () != cfg::CFG_GROUP)
					throw cfg::cfg_type_error ("alias entries must be groups");
				
				cfg::group *grp = static_cast<cfg::group *> (val);
				std::string alias = grp->get_string ("alias");
				
				std::vector<std::string> actuals;
				if (grp->exists ("actual", cfg::CFG_ARRAY))
					{
						cfg::array *actual_arr = grp->find_array ("actual");
						for (int i = 0; i < actual_arr->size (); ++i)
							actuals.push_back (actual_arr->get_string (i));
					}
				else
					actuals.push_back (grp->get_string ("actual"));
				
				this->add (alias, actuals);
			}
	}
	
	void
	permission_aliases::save (cfg::array& arr) const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto& entry : this->alias_to_actual)
			{
				cfg::group *grp = new cfg::group ();
				grp->add_string ("alias", entry.first);
				
				cfg::array *actuals = new cfg::array ();
				for (const std::string& actual : entry.second)
					actuals->add_string (actual);
				grp->add ("actual", actuals);
				
				arr.add (grp);
			}
	}
}
