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

#include "registry/user_registry.hpp"
#include "registry/storage.hpp"
#include "util/stringutils.hpp"
#include "util/logger.hpp"
#include "util/config.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>


namespace hPerms {
	
	user_registry::user_registry (logger& log, const std::string& default_group)
		: log (log), default_group (sutils::to_lower (default_group))
	{
		if (this->default_group.empty ())
			throw std::invalid_argument ("default group cannot be empty");
	}
	
	user_registry::~user_registry ()
	{
		this->clear ();
	}
	
	
	
	user*
	user_registry::get_or_create (const uuid_t& uuid, const std::string& username,
		const std::string& primary_group)
	{
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = this->users.find (uuid);
		if (itr != this->users.end ())
			return itr->second;
		
		std::unique_ptr<user> usr {new user (uuid, username)};
		usr->set_primary_group (primary_group.empty ()
			? this->default_group : primary_group);
		
		user *ptr = usr.release ();
		this->users[uuid] = ptr;
		return ptr;
	}
	
	user*
	user_registry::find (const uuid_t& uuid) const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = this->users.find (uuid);
		if (itr == this->users.end ())
			return nullptr;
		return itr->second;
	}
	
	user*
	user_registry::find_by_name (const std::string& username) const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto itr = this->users.begin (); itr != this->users.end (); ++itr)
			if (sutils::iequals (itr->second->get_username (), username))
				return itr->second;
		return nullptr;
	}
	
	bool
	user_registry::remove (const uuid_t& uuid)
	{
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = this->users.find (uuid);
		if (itr == this->users.end ())
			return false;
		
		delete itr->second;
		this->users.erase (itr);
		return true;
	}
	
	void
	user_registry::clear ()
	{
		std::lock_guard<std::mutex> guard {this->lock};
		for (auto itr = this->users.begin (); itr != this->users.end (); ++itr)
			delete itr->second;
		this->users.clear ();
	}
	
	
	std::vector<user *>
	user_registry::all () const
	{
		std::vector<user *> res;
		{
			std::lock_guard<std::mutex> guard {this->lock};
			for (auto itr = this->users.begin (); itr != this->users.end (); ++itr)
				res.push_back (itr->second);
		}
		
		std::sort (res.begin (), res.end (),
			[] (const user *a, const user *b) -> bool
				{
					return a->get_uuid () < b->get_uuid ();
				});
		return res;
	}
	
	int
	user_registry::size () const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		return this->users.size ();
	}
	
	int
	user_registry::cleanup_expired ()
	{
		int total = 0;
		for (user *usr : this->all ())
			total += usr->cleanup_expired ();
		return total;
	}
	
	
	
//----
	
	static void
	_load_user (const cfg::group& in, user& usr)
	{
		std::string str;
		
		if (in.try_get_string ("name", str))
			usr.set_username (str);
		if (in.try_get_string ("primary-group", str))
			usr.set_primary_group (str);
		
		cfg::array *arr = in.find_array ("groups");
		if (arr)
			{
				for (int i = 0; i < arr->size (); ++i)
					usr.add_group (arr->get_string (i));
			}
		
		arr = in.find_array ("permissions");
		if (arr)
			storage::read_nodes (*arr, usr);
	}
	
	void
	user_registry::load (const cfg::array& arr_users)
	{
		this->clear ();
		
		int index = 0;
		for (cfg::value *val : arr_users)
			{
				++ index;
				if (val->type () != cfg::CFG_GROUP)
					throw storage_error ("\"users\" array has a non-group element");
				cfg::group *in = static_cast<cfg::group *> (val);
				
				try
					{
						uuid_t uuid = uuid_t::parse (in->get_string ("uuid"));
						if (this->find (uuid))
							{
								this->log (LT_WARNING) << "Duplicate user entry for "
									<< uuid.to_str () << ", ignoring" << std::endl;
								continue;
							}
						
						_load_user (*in, *this->get_or_create (uuid));
					}
				catch (const cfg::cfg_error& ex)
					{
						throw storage_error ("in user entry #" + std::to_string (index)
							+ ": " + ex.what ());
					}
				catch (const std::invalid_argument& ex)
					{
						throw storage_error ("in user entry #" + std::to_string (index)
							+ ": " + ex.what ());
					}
			}
	}
	
	
	void
	user_registry::save (cfg::array& arr_users) const
	{
		for (const user *usr : this->all ())
			{
				if (!usr->has_data (this->default_group))
					continue;
				
				cfg::group *out = new cfg::group ();
				out->add_string ("uuid", usr->get_uuid ().to_str ());
				if (!usr->get_username ().empty ())
					out->add_string ("name", usr->get_username ());
				out->add_string ("primary-group", usr->get_primary_group ());
				
				cfg::array *arr = new cfg::array ();
				for (const node& n : usr->get_nodes ())
					if (storage::is_plain_group_node (n))
						arr->add_string (n.get_group_name ());
				out->add ("groups", arr);
				
				arr = new cfg::array ();
				storage::write_nodes (*usr, *arr, true);
				out->add ("permissions", arr);
				
				arr_users.add (out);
			}
	}
}
