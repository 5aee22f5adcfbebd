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
#include "util/config.hpp"
#include <fstream>
#include <memory>


namespace hPerms {
	
	/*
	 * Fills the given structure with default settings.
	 */
	void
	default_config (engine_config& out)
	{
		out.default_group = "default";
		out.server_name = "";
		out.permissions_file = "data/permissions.cfg";
		out.verbose = false;
		
		out.log_dir = "";
		out.log_level = LT_INFO;
	}
	
	
	bool
	write_config (logger& log, const std::string& path, const engine_config& in)
	{
		cfg::group root {1};
		
		{
			cfg::group *grp_general = new cfg::group ();
			
			grp_general->add_string ("default-group", in.default_group);
			grp_general->add_string ("server-name", in.server_name);
			grp_general->add_string ("permissions-file", in.permissions_file);
			
			root.add ("general", grp_general);
		}
		
		{
			cfg::group *grp_debug = new cfg::group ();
			
			grp_debug->add_boolean ("verbose", in.verbose);
			
			root.add ("debug", grp_debug);
		}
		
		{
			cfg::group *grp_logging = new cfg::group ();
			
			static const char *level_names[] = {
				"debug", "system", "info", "warning", "error", "fatal" };
			grp_logging->add_string ("directory", in.log_dir);
			grp_logging->add_string ("level", level_names[in.log_level]);
			
			root.add ("logging", grp_logging);
		}
		
		std::ofstream fs {path};
		if (!fs)
			{
				log (LT_ERROR) << "Failed to save configuration file to \"" << path << "\"" << std::endl;
				return false;
			}
		
		root.write_to (fs);
		return true;
	}
	
	
	
	static void
	_cfg_read_general_grp (logger& log, cfg::group *grp_general, engine_config& out)
	{
		std::string str;
		bool error = false;
		
		// default group
		if (grp_general->try_get_string ("default-group", str))
			{
				if (!str.empty ())
					out.default_group = str;
				else
					{
						if (!error)
							log (LT_ERROR) << "Config: at group \"general\":" << std::endl;
						log (LT_INFO) << " - \"default-group\" must not be empty." << std::endl;
						error = true;
					}
			}
		
		// server name
		if (grp_general->try_get_string ("server-name", str))
			out.server_name = str;
		
		// permissions file
		if (grp_general->try_get_string ("permissions-file", str))
			{
				if (!str.empty ())
					out.permissions_file = str;
				else
					{
						if (!error)
							log (LT_ERROR) << "Config: at group \"general\":" << std::endl;
						log (LT_INFO) << " - \"permissions-file\" must not be empty." << std::endl;
						error = true;
					}
			}
	}
	
	static void
	_cfg_read_debug_grp (logger& log, cfg::group *grp_debug, engine_config& out)
	{
		bool bl;
		
		if (grp_debug->try_get_boolean ("verbose", bl))
			out.verbose = bl;
	}
	
	static void
	_cfg_read_logging_grp (logger& log, cfg::group *grp_logging, engine_config& out)
	{
		std::string str;
		logtype lt;
		
		if (grp_logging->try_get_string ("directory", str))
			out.log_dir = str;
		
		if (grp_logging->try_get_string ("level", str))
			{
				if (parse_logtype (str, lt))
					out.log_level = lt;
				else
					{
						log (LT_ERROR) << "Config: at group \"logging\":" << std::endl;
						log (LT_INFO) << " - \"level\" must be one of: debug, system, info, "
							"warning, error, fatal." << std::endl;
					}
			}
	}
	
	
	static void
	_cfg_read_root_grp (logger& log, cfg::group *root, engine_config& out)
	{
		try
			{
				cfg::group *grp_general = root->find_group ("general");
				if (!grp_general) throw cfg::cfg_find_error ("not found");
				_cfg_read_general_grp (log, grp_general, out);
			}
		catch (const cfg::cfg_error& ex)
			{
				log (LT_WARNING) << "Config: Group \"general\" not found or invalid, using defaults" << std::endl;
			}
		
		try
			{
				cfg::group *grp_debug = root->find_group ("debug");
				if (!grp_debug) throw cfg::cfg_find_error ("not found");
				_cfg_read_debug_grp (log, grp_debug, out);
			}
		catch (const cfg::cfg_error& ex)
			{
				log (LT_WARNING) << "Config: Group \"debug\" not found or invalid, using defaults" << std::endl;
			}
		
		try
			{
				cfg::group *grp_logging = root->find_group ("logging");
				if (!grp_logging) throw cfg::cfg_find_error ("not found");
				_cfg_read_logging_grp (log, grp_logging, out);
			}
		catch (const cfg::cfg_error& ex)
			{
				log (LT_WARNING) << "Config: Group \"logging\" not found or invalid, using defaults" << std::endl;
			}
	}
	
	
	void
	load_config (logger& log, const std::string& path, engine_config& out)
	{
		default_config (out);
		
		std::ifstream fs {path};
		if (!fs)
			{
				log () << "\"" << path << "\" does not exist, creating..." << std::endl;
				write_config (log, path, out);
				return;
			}
		
		std::unique_ptr<cfg::group> root;
		try
			{
				root.reset (cfg::group::read_from (fs));
			}
		catch (const cfg::cfg_error& ex)
			{
				log (LT_WARNING) << "Config: Failed to parse \"" << path << "\" ("
					<< ex.what () << "), using defaults" << std::endl;
				return;
			}
		
		_cfg_read_root_grp (log, root.get (), out);
	}
}
