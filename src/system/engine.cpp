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

#include "system/engine.hpp"
#include "registry/storage.hpp"
#include "util/config.hpp"
#include <fstream>
#include <memory>
#include <sys/stat.h>


namespace hPerms {
	
	permission_engine::permission_engine (logger& log, const engine_config& config)
		: log (log), config (config), groups (log), users (log, config.default_group),
			contexts (log), resolver (groups.loader (), &aliases)
	{
		this->log.set_level (config.log_level);
		
		if (!config.server_name.empty ())
			this->contexts.register_calculator (std::make_shared<server_context_calculator> (
				config.server_name));
	}
	
	
	
//----
	// load (), save ():
	
	void
	permission_engine::load ()
	{
		const std::string& path = this->config.permissions_file;
		
		std::ifstream fs {path};
		if (!fs)
			{
				this->log () << "\"" << path << "\" does not exist, creating..." << std::endl;
				this->groups.clear ();
				this->users.clear ();
				this->groups.ensure (this->config.default_group);
				this->save ();
				return;
			}
		
		this->log () << "Loading permissions from \"" << path << "\"" << std::endl;
		try
			{
				std::unique_ptr<cfg::group> root {cfg::group::read_from (fs)};
				fs.close ();
				
				cfg::group *grp_groups = root->find_group ("groups");
				if (!grp_groups)
					throw storage_error ("\"groups\" group not found");
				this->groups.load (*grp_groups);
				
				cfg::array *arr = root->find_array ("users");
				if (arr)
					this->users.load (*arr);
				else
					this->users.clear ();
				
				this->aliases.clear ();
				arr = root->find_array ("aliases");
				if (arr)
					this->aliases.load (*arr);
				
				this->registry.clear ();
				arr = root->find_array ("registry");
				if (arr)
					this->registry.load (*arr);
			}
		catch (const cfg::cfg_error& ex)
			{
				throw storage_error ("\"" + path + "\": " + ex.what ());
			}
		
		this->groups.ensure (this->config.default_group);
		
		this->log (LT_INFO) << " - Loaded " << this->groups.size () << " groups, "
			<< this->users.size () << " users, " << this->aliases.size () << " aliases and "
			<< this->registry.size () << " registered permissions." << std::endl;
	}
	
	
	/*
	 * Creates every directory leading up to the file at @{path}.
	 */
	static void
	_make_parent_dirs (const std::string& path)
	{
		std::string::size_type pos = 0;
		while ((pos = path.find ('/', pos + 1)) != std::string::npos)
			mkdir (path.substr (0, pos).c_str (), 0744);
	}
	
	void
	permission_engine::save () const
	{
		const std::string& path = this->config.permissions_file;
		
		cfg::group root {1};
		
		cfg::group *grp_groups = new cfg::group (1);
		this->groups.save (*grp_groups);
		root.add ("groups", grp_groups);
		
		cfg::array *arr = new cfg::array ();
		this->users.save (*arr);
		root.add ("users", arr);
		
		arr = new cfg::array ();
		this->aliases.save (*arr);
		root.add ("aliases", arr);
		
		arr = new cfg::array ();
		this->registry.save (*arr);
		root.add ("registry", arr);
		
		_make_parent_dirs (path);
		std::ofstream fs {path};
		if (!fs)
			throw storage_error ("failed to open \"" + path + "\" for writing");
		root.write_to (fs);
		fs.close ();
		if (!fs)
			throw storage_error ("failed to write \"" + path + "\"");
	}
	
	
	int
	permission_engine::cleanup_expired ()
	{
		int removed = this->groups.cleanup_expired () + this->users.cleanup_expired ();
		if (removed > 0)
			this->log (LT_INFO) << "Removed " << removed << " expired node(s)" << std::endl;
		return removed;
	}
	
	
	
//----
	
	context_set
	permission_engine::get_contexts (const uuid_t& uuid) const
	{
		return this->contexts.get_contexts (uuid);
	}
	
	
	resolved_permissions
	permission_engine::resolve_uuid (const uuid_t& uuid,
		const context_set& ctx) const
	{
		const user *usr = this->users.find (uuid);
		if (usr)
			return this->resolver.resolve (*usr, ctx);
		
		user transient {uuid};
		transient.set_primary_group (this->config.default_group);
		return this->resolver.resolve (transient, ctx);
	}
	
	resolved_permissions
	permission_engine::resolve (const uuid_t& uuid) const
	{
		return this->resolve_uuid (uuid, this->get_contexts (uuid));
	}
	
	resolved_permissions
	permission_engine::resolve (const uuid_t& uuid, const context_set& ctx) const
	{
		return this->resolve_uuid (uuid, ctx);
	}
	
	
	
	tristate
	permission_engine::check (const uuid_t& uuid, const std::string& perm) const
	{
		return this->check (uuid, perm, this->get_contexts (uuid));
	}
	
	tristate
	permission_engine::check (const uuid_t& uuid, const std::string& perm,
		const context_set& ctx) const
	{
		if (this->config.verbose)
			return this->check_with_trace (uuid, perm, ctx).get_result ();
		return this->resolve_uuid (uuid, ctx).check (perm);
	}
	
	
	permission_trace
	permission_engine::check_with_trace (const uuid_t& uuid,
		const std::string& perm) const
	{
		return this->check_with_trace (uuid, perm, this->get_contexts (uuid));
	}
	
	permission_trace
	permission_engine::check_with_trace (const uuid_t& uuid,
		const std::string& perm, const context_set& ctx) const
	{
		permission_trace trace = this->resolve_uuid (uuid, ctx).check_with_trace (perm);
		if (this->config.verbose)
			this->log (LT_DEBUG) << "Check for " << uuid.to_str () << ": "
				<< trace.to_string () << std::endl;
		return trace;
	}
	
	
	bool
	permission_engine::has_permission (const uuid_t& uuid,
		const std::string& perm) const
	{
		return as_boolean (this->check (uuid, perm));
	}
	
	bool
	permission_engine::has_permission (const uuid_t& uuid,
		const std::string& perm, const context_set& ctx) const
	{
		return as_boolean (this->check (uuid, perm, ctx));
	}
	
	
	std::set<std::string>
	permission_engine::get_expanded_permissions (const uuid_t& uuid) const
	{
		return this->get_expanded_permissions (uuid, this->get_contexts (uuid));
	}
	
	std::set<std::string>
	permission_engine::get_expanded_permissions (const uuid_t& uuid,
		const context_set& ctx) const
	{
		return this->resolve_uuid (uuid, ctx).get_expanded_permissions (this->registry);
	}
}
