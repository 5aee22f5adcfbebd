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

#ifndef _hPerms__TEST_H_
#define _hPerms__TEST_H_

#include "util/logger.hpp"
#include "permissions/group.hpp"
#include "resolver/inheritance.hpp"
#include <map>
#include <memory>
#include <string>
#include <sstream>


/*
 * Logger shared by all tests. Output is kept in memory.
 */
hPerms::logger& test_logger ();
std::ostringstream& test_log_output ();

void test_log_off ();
void test_log_on ();


/*
 * Minimal in-memory group store used to feed the resolver.
 */
class test_groups
{
	std::map<std::string, std::unique_ptr<hPerms::group>> groups;
	
public:
	hPerms::group&
	add (const std::string& name, int weight = 0)
	{
		hPerms::group *grp = new hPerms::group (name, weight);
		this->groups[grp->get_name ()].reset (grp);
		return *grp;
	}
	
	hPerms::group_loader
	loader () const
	{
		return [this] (const std::string& name) -> const hPerms::group* {
			auto itr = this->groups.find (name);
			return (itr == this->groups.end ()) ? nullptr : itr->second.get ();
		};
	}
};


/*
 * Returns a path inside the working directory that does not exist yet.
 */
std::string test_temp_path (const std::string& name);

#endif
