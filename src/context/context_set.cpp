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

#include "context/context_set.hpp"
#include "util/stringutils.hpp"
#include <stdexcept>
#include <algorithm>


namespace hPerms {

	const char *context::WORLD_KEY    = "world";
	const char *context::SERVER_KEY   = "server";
	const char *context::GAMEMODE_KEY = "gamemode";


	context::context (const std::string& key, const std::string& value)
		: key (sutils::to_lower (key)), value (sutils::to_lower (value))
	{
		if (this->key.empty ())
			throw std::invalid_argument ("context key cannot be empty");
		if (this->value.empty ())
			throw std::invalid_argument ("context value cannot be empty");
	}


	context
	context::world (const std::string& name)
		{ return context (WORLD_KEY, name); }

	context
	context::server (const std::string& name)
		{ return context (SERVER_KEY, name); }

	context
	context::gamemode (const std::string& mode)
		{ return context (GAMEMODE_KEY, mode); }


	/*
	 * Parses a context from its "key=value" form.
	 */
	context
	context::parse (const std::string& str)
	{
		std::string::size_type idx = str.find ('=');
		if (idx == std::string::npos || idx == 0 || idx == str.size () - 1)
			throw std::invalid_argument ("invalid context format: \"" + str
				+ "\", expected 'key=value'");

		return context (str.substr (0, idx), str.substr (idx + 1));
	}

	std::string
	context::to_string () const
	{
		return this->key + "=" + this->value;
	}



	bool
	context::operator== (const context& other) const
	{
		return this->key == other.key && this->value == other.value;
	}

	bool
	context::operator!= (const context& other) const
	{
		return !this->operator== (other);
	}

	bool
	context::operator< (const context& other) const
	{
		int c = this->key.compare (other.key);
		if (c != 0)
			return c < 0;
		return this->value < other.value;
	}



//----

	context_set::builder&
	context_set::builder::add (const context& ctx)
	{
		this->contexts.insert (ctx);
		return *this;
	}

	context_set::builder&
	context_set::builder::add (const std::string& key, const std::string& value)
	{
		return this->add (context (key, value));
	}

	context_set::builder&
	context_set::builder::add_all (const context_set& other)
	{
		this->contexts.insert (other.contexts.begin (), other.contexts.end ());
		return *this;
	}

	context_set
	context_set::builder::build () const
	{
		return context_set (this->contexts);
	}



//----

	context_set::context_set (const std::set<context>& contexts)
		: contexts (contexts)
		{ }


	context_set
	context_set::empty ()
	{
		return context_set ();
	}

	context_set
	context_set::of (const std::string& key, const std::string& value)
	{
		return builder ().add (key, value).build ();
	}

	context_set
	context_set::of (std::initializer_list<std::pair<std::string, std::string>> pairs)
	{
		builder b;
		for (const auto& p : pairs)
			b.add (p.first, p.second);
		return b.build ();
	}



	bool
	context_set::contains (const context& ctx) const
	{
		return this->contexts.find (ctx) != this->contexts.end ();
	}

	bool
	context_set::contains_key (const std::string& key) const
	{
		std::string lkey = sutils::to_lower (key);
		for (const context& ctx : this->contexts)
			if (ctx.key == lkey)
				return true;
		return false;
	}


	/*
	 * Returns the first value associated with the given key.
	 */
	std::string
	context_set::get_value (const std::string& key) const
	{
		std::string lkey = sutils::to_lower (key);
		for (const context& ctx : this->contexts)
			if (ctx.key == lkey)
				return ctx.value;
		return std::string ();
	}

	/*
	 * Returns all values associated with the given key.
	 */
	std::set<std::string>
	context_set::get_values (const std::string& key) const
	{
		std::set<std::string> values;

		std::string lkey = sutils::to_lower (key);
		for (const context& ctx : this->contexts)
			if (ctx.key == lkey)
				values.insert (ctx.value);
		return values;
	}



	/*
	 * Checks whether every context in this set is also present in
	 * @{current}.
	 */
	bool
	context_set::is_satisfied_by (const context_set& current) const
	{
		if (this->contexts.empty ())
			return true;

		// both sets are sorted.
		return std::includes (current.contexts.begin (), current.contexts.end (),
			this->contexts.begin (), this->contexts.end ());
	}



	std::string
	context_set::to_string () const
	{
		std::string str {"{"};
		for (auto itr = this->contexts.begin (); itr != this->contexts.end (); ++itr)
			{
				if (itr != this->contexts.begin ())
					str.append (", ");
				str.append (itr->to_string ());
			}
		str.push_back ('}');
		return str;
	}



	bool
	context_set::operator== (const context_set& other) const
	{
		return this->contexts == other.contexts;
	}

	bool
	context_set::operator!= (const context_set& other) const
	{
		return this->contexts != other.contexts;
	}

	bool
	context_set::operator< (const context_set& other) const
	{
		return this->contexts < other.contexts;
	}
}

