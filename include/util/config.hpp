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

#ifndef _hPerms__CONFIG_H_
#define _hPerms__CONFIG_H_

#include <stdexcept>
#include <string>
#include <vector>
#include <ostream>
#include <istream>


namespace hPerms {

	/*
	 * The configuration format shared by the engine settings file and the
	 * permissions file:
	 *
	 *   {
	 *     name: "string";
	 *     count: -12;
	 *     enabled: true;
	 *     list: ["a", "b", { nested: 1; }];
	 *     sub: { ... };  // comment
	 *   }
	 */
	namespace cfg {

		class cfg_error: public std::runtime_error {
		public:
			cfg_error (const std::string& what)
				: std::runtime_error (what)
				{ }
		};

		class cfg_find_error: public cfg_error {
		public:
			cfg_find_error (const std::string& what)
				: cfg_error (what)
				{ }
		};

		class cfg_type_error: public cfg_error {
		public:
			cfg_type_error (const std::string& what)
				: cfg_error (what)
				{ }
		};


		enum value_type
		{
			CFG_NONE = -1,

			CFG_GROUP = 0,
			CFG_STRING,
			CFG_INTEGER,
			CFG_BOOLEAN,
			CFG_ARRAY,
		};

		class value
		{
		public:
			virtual ~value () { }

			virtual value_type type () const = 0;
			virtual void write_to (std::ostream& strm, int indent = 0) const = 0;
		};


		class string: public value
		{
			std::string str;

		public:
			string () { }
			string (const std::string& str)
				: str (str)
				{ }

			const std::string& val () const { return this->str; }

			virtual value_type type () const override { return CFG_STRING; }
			virtual void write_to (std::ostream& strm, int indent = 0) const override;
		};


		class integer: public value
		{
			long long num;

		public:
			integer (long long num = 0)
				: num (num)
				{ }

			long long val () const { return this->num; }

			virtual value_type type () const override { return CFG_INTEGER; }
			virtual void write_to (std::ostream& strm, int indent = 0) const override;
		};


		class boolean: public value
		{
			bool v;

		public:
			boolean (bool v = false)
				: v (v)
				{ }

			bool val () const { return this->v; }

			virtual value_type type () const override { return CFG_BOOLEAN; }
			virtual void write_to (std::ostream& strm, int indent = 0) const override;
		};


		class array: public value
		{
			std::vector<value *> vals;

		public:
			array () { }
			~array ();

			array (const array&) = delete;
			array& operator= (const array&) = delete;



			/*
			 * Adds a new element to the end of the array.
			 * The array takes ownership of the value.
			 */
			void add (value *val);
			void add_integer (long long val);
			void add_string (const std::string& val);
			void add_boolean (bool val);

			value* at (int index) const;
			std::string get_string (int index) const;

			int size () const { return this->vals.size (); }
			std::vector<value *>::const_iterator begin () const { return this->vals.begin (); }
			std::vector<value *>::const_iterator end () const { return this->vals.end (); }

			/*
			 * Removes all elements from the array.
			 */
			void clear ();


			virtual value_type type () const override { return CFG_ARRAY; }
			virtual void write_to (std::ostream& strm, int indent = 0) const override;
		};



		struct setting
		{
			std::string name;
			value *val;

		//---
			setting (const std::string& n, value *v)
				: name (n), val (v)
				{ }
		};

		class group: public value
		{
			// settings are kept in insertion order so that files are written back
			// the way they were read.
			std::vector<setting> settings;

		public:
			int lines_between;

		public:
			group (int lines_between = 0);
			~group ();

			group (const group&) = delete;
			group& operator= (const group&) = delete;



			/*
			 * Inserts a new setting into the group, replacing any previous setting
			 * that had the same name. The group takes ownership of the value.
			 */
			void add (const std::string& name, value *val);
			void add_integer (const std::string& name, long long val);
			void add_string (const std::string& name, const std::string& val);
			void add_boolean (const std::string& name, bool val);

			/*
			 * Removes the setting that has the specified name.
			 */
			void remove (const std::string& name);

			/*
			 * Removes all settings from the group.
			 */
			void clear ();



			/*
			 * Lookup:
			 * find_* return null if the setting does not exist, get_* throw
			 * `cfg_find_error' instead. Both throw `cfg_type_error' if the
			 * setting is of another type.
			 */

			value* find (const std::string& name) const;
			integer* find_integer (const std::string& name) const;
			string* find_string (const std::string& name) const;
			boolean* find_boolean (const std::string& name) const;
			group* find_group (const std::string& name) const;
			array* find_array (const std::string& name) const;

			long long get_integer (const std::string& name) const;
			std::string get_string (const std::string& name) const;
			bool get_boolean (const std::string& name) const;

			bool try_get_integer (const std::string& name, long long& out) const;
			bool try_get_string (const std::string& name, std::string& out) const;
			bool try_get_boolean (const std::string& name, bool& out) const;

			bool exists (const std::string& name, value_type typ = CFG_NONE) const;


			int size () const { return this->settings.size (); }
			std::vector<setting>::const_iterator begin () const { return this->settings.begin (); }
			std::vector<setting>::const_iterator end () const { return this->settings.end (); }



			virtual value_type type () const override { return CFG_GROUP; }
			virtual void write_to (std::ostream& strm, int indent = 0) const override;

			/*
			 * Parses a whole group (and nothing after it) from the given stream.
			 * Throws `cfg_error' on malformed input.
			 */
			static group* read_from (std::istream& strm);
			static group* read_from (const std::string& str);
		};
	}
}

#endif

