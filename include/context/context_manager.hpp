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

#ifndef _hPerms__CONTEXT_MANAGER_H_
#define _hPerms__CONTEXT_MANAGER_H_

#include "context/context_set.hpp"
#include "util/uuid.hpp"
#include <vector>
#include <string>
#include <memory>
#include <mutex>


namespace hPerms {

	class logger;
	
	/*
	 * Capability interface through which the host (or an integration) adds
	 * the contexts that currently apply to a subject.
	 */
	class context_calculator
	{
	public:
		virtual ~context_calculator () { }
		
		/*
		 * Name used when reporting failures.
		 */
		virtual std::string get_name () const = 0;
		
		/*
		 * Adds the contexts that apply to the subject identified by @{uuid}
		 * into @{out}.
		 */
		virtual void calculate (const uuid_t& uuid, context_set::builder& out) = 0;
	};
	
	
	
	/*
	 * Adds "server=<name>" to every subject, unless the name is empty.
	 */
	class server_context_calculator: public context_calculator
	{
		std::string server_name;
		
	public:
		server_context_calculator (const std::string& server_name)
			: server_name (server_name)
			{ }
		
		virtual std::string get_name () const override { return "server"; }
		virtual void calculate (const uuid_t& uuid, context_set::builder& out) override;
	};
	
	
	/*
	 * Adds a fixed set of contexts to every subject.
	 */
	class static_context_calculator: public context_calculator
	{
		std::string name;
		context_set contexts;
		
	public:
		static_context_calculator (const std::string& name, const context_set& contexts)
			: name (name), contexts (contexts)
			{ }
		
		virtual std::string get_name () const override { return this->name; }
		virtual void calculate (const uuid_t& uuid, context_set::builder& out) override;
	};
	
	
	
	/*
	 * Keeps track of registered context calculators and combines their output
	 * into a single context set.
	 */
	class context_manager
	{
		logger& log;
		std::vector<std::shared_ptr<context_calculator>> calcs;
		mutable std::mutex lock;
		
	public:
		context_manager (logger& log);
		
		
		
		void register_calculator (std::shared_ptr<context_calculator> calc);
		
		/*
		 * Returns false if the calculator was never registered.
		 */
		bool unregister_calculator (const std::shared_ptr<context_calculator>& calc);
		
		int size () const;
		void clear ();
		
		
		/*
		 * Runs all registered calculators for the given subject.
		 * A calculator that throws is logged and skipped.
		 */
		context_set get_contexts (const uuid_t& uuid) const;
	};
}

#endif

