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

#include "registry/group_registry.hpp"
#include "registry/storage.hpp"
#include "util/stringutils.hpp"
#include "util/logger.hpp"
#include "util/config.hpp"
#include <algorithm>
#include <memory>


namespace hPerms {
	
	group_registry::group_registry (logger& log)
		: log (log)
		{ }
	
	group_registry::~group_registry ()
	{
		this->clear ();
	}
	
	
	
	group*
	group_registry::create (const std::string& name, int weight)
	{
		std::unique_ptr<group> grp {new group (name, weight)};
		
		std::lock_guard<std::mutex> guard {this->lock};
		if (this->groups.find (grp->get_name ()) != this->groups.end ())
			throw group_error ("group \"" + grp->get_name () + "\" already exists");
		
		group *ptr = grp.release ();
		this->groups[ptr->get_name ()] = ptr;
		return ptr;
	}
	
	group*
	group_registry::ensure (const std::string& name, int weight)
	{
		group *grp = this->find (name);
		if (grp)
			return grp;
		
		grp = this->create (name, weight);
		this->log (LT_INFO) << "Created group \"" << grp->get_name () << "\"" << std::endl;
		return grp;
	}
	
	group*
	group_registry::find (const std::string& name) const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = this->groups.find (sutils::to_lower (name));
		if (itr == this->groups.end ())
			return nullptr;
		return itr->second;
	}
	
	bool
	group_registry::remove (const std::string& name)
	{
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = this->groups.find (sutils::to_lower (name));
		if (itr == this->groups.end ())
			return false;
		
		delete itr->second;
		this->groups.erase (itr);
		return true;
	}
	
	void
	group_registry::clear ()
	{
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto itr = this->groups.begin (); itr != this->groups.end (); ++itr)
			delete itr->second;
		this->groups.clear ();
	}
	
	
	std::vector<group *>
	group_registry::all () const
	{
		std::vector<group *> res;
		{
			std::lock_guard<std::mutex> guard {this->lock};
			for (auto itr = this->groups.begin (); itr != this->groups.end (); ++itr)
				res.push_back (itr->second);
		}
		
		std::sort (res.begin (), res.end (),
			[] (const group *a, const group *b) -> bool
				{
					if (a->get_weight () != b->get_weight ())
						return a->get_weight () < b->get_weight ();
					return a->get_name () < b->get_name ();
				});
		return res;
	}
	
	int
	group_registry::size () const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		return this->groups.size ();
	}
	
	
	group_loader
	group_registry::loader () const
	{
		return [this] (const std::string& name) -> const group* {
			return this->find (name);
		};
	}
	
	
	
	mutate_result
	group_registry::add_parent (const std::string& name, const std::string& parent)
	{
		group *grp = this->find (name);
		if (!grp)
			throw group_error ("group \"" + name + "\" does not exist");
		if (!this->find (parent))
			throw group_error ("parent group \"" + parent + "\" does not exist");
		
		if (sutils::iequals (grp->get_name (), parent))
			throw group_error ("group \"" + grp->get_name () + "\" cannot inherit from itself");
		
		inheritance_graph graph {this->loader ()};
		if (graph.would_create_cycle (*grp, parent))
			throw group_error ("making \"" + sutils::to_lower (parent) + "\" a parent of \""
				+ grp->get_name () + "\" would create an inheritance cycle");
		
		return grp->add_parent (parent);
	}
	
	mutate_result
	group_registry::remove_parent (const std::string& name, const std::string& parent)
	{
		group *grp = this->find (name);
		if (!grp)
			return MUTATE_DOES_NOT_EXIST;
		return grp->remove_parent (parent);
	}
	
	
	int
	group_registry::cleanup_expired ()
	{
		int total = 0;
		for (group *grp : this->all ())
			total += grp->cleanup_expired ();
		return total;
	}
	
	
	
//----
	
	static void
	_load_group (const cfg::group& in, group& grp)
	{
		long long num;
		std::string str;
		
		if (in.try_get_integer ("weight", num))
			grp.set_weight ((int)num);
		if (in.try_get_string ("display-name", str))
			grp.set_display_name (str);
		
		cfg::array *arr = in.find_array ("parents");
		if (arr)
			{
				for (int i = 0; i < arr->size (); ++i)
					grp.add_parent (arr->get_string (i));
			}
		
		arr = in.find_array ("permissions");
		if (arr)
			storage::read_nodes (*arr, grp);
	}
	
	void
	group_registry::load (const cfg::group& grp_groups)
	{
		this->clear ();
		
		for (auto sett : grp_groups)
			{
				if (sett.val->type () != cfg::CFG_GROUP)
					throw storage_error ("\"groups\" group has a non-group element (\""
						+ sett.name + "\")");
				
				group *grp;
				try
					{
						grp = this->create (sett.name);
					}
				catch (const group_error& ex)
					{
						throw storage_error (std::string ("duplicate group: ") + ex.what ());
					}
				catch (const std::invalid_argument& ex)
					{
						throw storage_error (std::string ("invalid group: ") + ex.what ());
					}
				
				try
					{
						_load_group (*static_cast<cfg::group *> (sett.val), *grp);
					}
				catch (const cfg::cfg_error& ex)
					{
						throw storage_error ("in group \"" + sett.name + "\": " + ex.what ());
					}
				catch (const std::invalid_argument& ex)
					{
						throw storage_error ("in group \"" + sett.name + "\": " + ex.what ());
					}
			}
		
		// inheritance sanity checks
		inheritance_graph graph {this->loader ()};
		for (group *grp : this->all ())
			for (const std::string& parent : grp->get_parents ())
				{
					if (!this->find (parent))
						this->log (LT_WARNING) << "Group \"" << grp->get_name ()
							<< "\": parent group \"" << parent << "\" does not exist" << std::endl;
					else if (graph.would_create_cycle (*grp, parent))
						this->log (LT_WARNING) << "Group \"" << grp->get_name ()
							<< "\": inheriting from \"" << parent << "\" forms a cycle" << std::endl;
				}
	}
	
	
	void
	group_registry::save (cfg::group& grp_groups) const
	{
		for (const group *grp : this->all ())
			{
				cfg::group *curr = new cfg::group ();
				
				curr->add_integer ("weight", grp->get_weight ());
				if (grp->get_display_name () != grp->get_name ())
					curr->add_string ("display-name", grp->get_display_name ());
				
				cfg::array *arr = new cfg::array ();
				for (const node& n : grp->get_nodes ())
					if (storage::is_plain_group_node (n))
						arr->add_string (n.get_group_name ());
				if (arr->size () > 0)
					curr->add ("parents", arr);
				else
					delete arr;
				
				arr = new cfg::array ();
				storage::write_nodes (*grp, *arr, true);
				curr->add ("permissions", arr);
				
				grp_groups.add (grp->get_name (), curr);
			}
	}
}
