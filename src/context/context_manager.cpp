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

#include "context/context_manager.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <stdexcept>


namespace hPerms {
	
	void
	server_context_calculator::calculate (const uuid_t& uuid,
		context_set::builder& out)
	{
		if (!this->server_name.empty ())
			out.add (context::server (this->server_name));
	}
	
	void
	static_context_calculator::calculate (const uuid_t& uuid,
		context_set::builder& out)
	{
		out.add_all (this->contexts);
	}
	
	
	
//----
	
	context_manager::context_manager (logger& log)
		: log (log)
		{ }
	
	
	
	void
	context_manager::register_calculator (std::shared_ptr<context_calculator> calc)
	{
		if (!calc)
			throw std::invalid_argument ("context calculator cannot be null");
		
		std::lock_guard<std::mutex> guard {this->lock};
		this->calcs.push_back (calc);
	}
	
	bool
	context_manager::unregister_calculator (
		const std::shared_ptr<context_calculator>& calc)
	{
		std::lock_guard<std::mutex> guard {this->lock};
		auto itr = std::find (this->calcs.begin (), this->calcs.end (), calc);
		if (itr == this->calcs.end ())
			return false;
		
		this->calcs.erase (itr);
		return true;
	}
	
	int
	context_manager::size () const
	{
		std::lock_guard<std::mutex> guard {this->lock};
		return this->calcs.size ();
	}
	
	void
	context_manager::clear ()
	{
		std::lock_guard<std::mutex> guard {this->lock};
		this->calcs.clear ();
	}
	
	
	
	/*
	 * Runs all registered calculators for the given subject.
	 */
	context_set
	context_manager::get_contexts (const uuid_t& uuid) const
	{
		std::vector<std::shared_ptr<context_calculator>> snapshot;
		{
			std::lock_guard<std::mutex> guard {this->lock};
			snapshot = this->calcs;
		}
		
		context_set::builder builder;
		for (auto& calc : snapshot)
			{
				try
					{
						calc->calculate (uuid, builder);
					}
				catch (const std::exception& ex)
					{
						this->log (LT_WARNING) << "Context calculator \"" << calc->get_name ()
							<< "\" failed for " << uuid.to_str () << ": " << ex.what () << std::endl;
					}
			}
		
		return builder.build ();
	}
}

