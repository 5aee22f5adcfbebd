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

#ifndef _hPerms__CONTEXT_SET_H_
#define _hPerms__CONTEXT_SET_H_

#include <string>
#include <set>
#include <utility>
#include <initializer_list>


namespace hPerms {

	/*
	 * A single key=value pair describing where or how a check takes place
	 * (e.g. world=nether). Both the key and the value are lowercased.
	 */
	struct context
	{
		static const char *WORLD_KEY;
		static const char *SERVER_KEY;
		static const char *GAMEMODE_KEY;

		std::string key;
		std::string value;

	//----
		/*
		 * Throws `std::invalid_argument' if either the key or the value is
		 * empty.
		 */
		context (const std::string& key, const std::string& value);

		static context world (const std::string& name);
		static context server (const std::string& name);
		static context gamemode (const std::string& mode);

		/*
		 * Parses a context from its "key=value" form.
		 * Throws `std::invalid_argument' on malformed input.
		 */
		static context parse (const std::string& str);

		std::string to_string () const;

	//----
		bool operator== (const context& other) const;
		bool operator!= (const context& other) const;
		bool operator< (const context& other) const;
	};



	/*
	 * An immutable, ordered set of contexts.
	 */
	class context_set
	{
		std::set<context> contexts;

	public:
		class builder
		{
			std::set<context> contexts;

		public:
			builder& add (const context& ctx);
			builder& add (const std::string& key, const std::string& value);
			builder& add_all (const context_set& other);

			context_set build () const;
		};

	private:
		explicit context_set (const std::set<context>& contexts);

	public:
		/*
		 * Constructs an empty context set.
		 */
		context_set () { }

		static context_set empty ();
		static context_set of (const std::string& key, const std::string& value);
		static context_set of (std::initializer_list<std::pair<std::string, std::string>> pairs);



		bool is_empty () const { return this->contexts.empty (); }
		int size () const { return this->contexts.size (); }

		std::set<context>::const_iterator begin () const { return this->contexts.begin (); }
		std::set<context>::const_iterator end () const { return this->contexts.end (); }

		bool contains (const context& ctx) const;
		bool contains_key (const std::string& key) const;

		/*
		 * Returns the first value associated with the given key, or an empty
		 * string if the key is not present.
		 */
		std::string get_value (const std::string& key) const;

		/*
		 * Returns all values associated with the given key.
		 */
		std::set<std::string> get_values (const std::string& key) const;


		/*
		 * Checks whether every context in this set is also present in
		 * @{current}. An empty set is satisfied by anything.
		 */
		bool is_satisfied_by (const context_set& current) const;

		std::string to_string () const;

	//----
		bool operator== (const context_set& other) const;
		bool operator!= (const context_set& other) const;
		bool operator< (const context_set& other) const;
	};
}

#endif

