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

#include "registry/storage.hpp"
#include "util/config.hpp"


namespace hPerms {
	namespace storage {
		
		static context_set
		_read_contexts (const cfg::array& arr)
		{
			context_set::builder builder;
			for (cfg::value *val : arr)
				{
					if (val->type () != cfg::CFG_STRING)
						throw storage_error ("node contexts must be strings");
					builder.add (context::parse (static_cast<cfg::string *> (val)->val ()));
				}
			return builder.build ();
		}
		
		node
		read_node (const cfg::value& val)
		{
			try
				{
					if (val.type () == cfg::CFG_STRING)
						return node (static_cast<const cfg::string&> (val).val ());
					
					if (val.type () != cfg::CFG_GROUP)
						throw storage_error ("nodes must be either strings or groups");
					
					const cfg::group& grp = static_cast<const cfg::group&> (val);
					std::string perm = grp.get_string ("permission");
					
					bool value = true;
					grp.try_get_boolean ("value", value);
					
					long long expiry = 0;
					grp.try_get_integer ("expiry", expiry);
					if (expiry < 0)
						throw storage_error ("\"" + perm + "\": negative expiry");
					
					context_set contexts;
					cfg::array *arr = grp.find_array ("contexts");
					if (arr)
						contexts = _read_contexts (*arr);
					
					return node (perm, value, contexts, (std::time_t)expiry);
				}
			catch (const cfg::cfg_error& ex)
				{
					throw storage_error (std::string ("invalid node: ") + ex.what ());
				}
			catch (const std::invalid_argument& ex)
				{
					throw storage_error (std::string ("invalid node: ") + ex.what ());
				}
		}
		
		
		cfg::value*
		write_node (const node& n)
		{
			if (n.get_value () && n.is_permanent () && n.get_contexts ().is_empty ())
				return new cfg::string (n.get_permission ());
			
			cfg::group *grp = new cfg::group ();
			grp->add_string ("permission", n.get_permission ());
			if (!n.get_value ())
				grp->add_boolean ("value", false);
			if (!n.get_contexts ().is_empty ())
				{
					cfg::array *arr = new cfg::array ();
					for (const context& ctx : n.get_contexts ())
						arr->add_string (ctx.to_string ());
					grp->add ("contexts", arr);
				}
			if (n.is_temporary ())
				grp->add_integer ("expiry", (long long)n.get_expiry ());
			return grp;
		}
		
		
		
		void
		read_nodes (const cfg::array& arr, permission_holder& holder)
		{
			for (cfg::value *val : arr)
				holder.add_node (read_node (*val));
		}
		
		void
		write_nodes (const permission_holder& holder, cfg::array& arr,
			bool skip_plain_groups)
		{
			for (const node& n : holder.get_nodes ())
				{
					if (skip_plain_groups && is_plain_group_node (n))
						continue;
					arr.add (write_node (n));
				}
		}
		
		
		bool
		is_plain_group_node (const node& n)
		{
			return n.is_group_node () && n.get_value () && n.is_permanent ()
				&& n.get_contexts ().is_empty ();
		}
	}
}
