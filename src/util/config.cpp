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

#include "util/config.hpp"
#include <sstream>
#include <cctype>
#include <memory>


namespace hPerms {
	namespace cfg {

		namespace {

			static void
			indent_with_spaces (std::ostream& os, int s)
			{
				for (int i = 0; i < s; ++i)
					os.put (' ');
			}
		}


	//----
		/*
		 * Scalars:
		 */

		void
		string::write_to (std::ostream& strm, int indent) const
		{
			strm.put ('"');

			for (size_t i = 0; i < this->str.size (); ++i)
				{
					char c = this->str[i];
					if (c == '"')
						strm << "\\\"";
					else if (c == '\\')
						strm << "\\\\";
					else if (c == '\n')
						strm << "\\n";
					else
						strm.put (c);
				}

			strm.put ('"');
		}

		void
		integer::write_to (std::ostream& strm, int indent) const
		{
			strm << this->num;
		}

		void
		boolean::write_to (std::ostream& strm, int indent) const
		{
			strm << (this->v ? "true" : "false");
		}



	//----
		/*
		 * cfg::array:
		 */

		array::~array ()
		{
			this->clear ();
		}



		void
		array::add (value *val)
		{
			this->vals.push_back (val);
		}

		void
		array::add_integer (long long val)
			{ this->add (new integer (val)); }

		void
		array::add_string (const std::string& val)
			{ this->add (new string (val)); }

		void
		array::add_boolean (bool val)
			{ this->add (new boolean (val)); }



		value*
		array::at (int index) const
		{
			if (index < 0 || index >= (int)this->vals.size ())
				throw cfg_find_error ("array index out of bounds");
			return this->vals[index];
		}

		std::string
		array::get_string (int index) const
		{
			value *val = this->at (index);
			if (val->type () != CFG_STRING)
				throw cfg_type_error ("expected a string");
			return static_cast<string *> (val)->val ();
		}



		/*
		 * Removes all elements from the array.
		 */
		void
		array::clear ()
		{
			for (value *val : this->vals)
				delete val;
			this->vals.clear ();
		}



		void
		array::write_to (std::ostream& strm, int indent) const
		{
			if (this->vals.empty ())
				{
					strm << "[]";
					return;
				}

			// arrays of scalars are kept on a single line, arrays that hold
			// groups get one element per line.
			bool multiline = false;
			for (value *val : this->vals)
				if (val->type () == CFG_GROUP || val->type () == CFG_ARRAY)
					{ multiline = true; break; }

			if (!multiline)
				{
					strm << "[";
					for (auto itr = this->vals.begin (); itr != this->vals.end (); )
						{
							(*itr)->write_to (strm, indent);
							++ itr;
							if (itr != this->vals.end ())
								strm << ", ";
						}
					strm << "]";
					return;
				}

			strm << "[\n";
			for (auto itr = this->vals.begin (); itr != this->vals.end (); )
				{
					indent_with_spaces (strm, indent + 2);
					(*itr)->write_to (strm, indent + 2);
					++ itr;
					if (itr != this->vals.end ())
						strm << ",";
					strm << "\n";
				}
			indent_with_spaces (strm, indent);
			strm << "]";
		}



	//----
		/*
		 * cfg::group:
		 */

		group::group (int lines_between)
			: lines_between (lines_between)
			{ }

		group::~group ()
		{
			this->clear ();
		}



		/*
		 * Inserts a new setting into the group.
		 */
		void
		group::add (const std::string& name, value *val)
		{
			for (setting& s : this->settings)
				if (s.name == name)
					{
						delete s.val;
						s.val = val;
						return;
					}

			this->settings.emplace_back (name, val);
		}

		void
		group::add_integer (const std::string& name, long long val)
			{ this->add (name, new integer (val)); }

		void
		group::add_string (const std::string& name, const std::string& val)
			{ this->add (name, new string (val)); }

		void
		group::add_boolean (const std::string& name, bool val)
			{ this->add (name, new boolean (val)); }



		/*
		 * Removes the setting that has the specified name.
		 */
		void
		group::remove (const std::string& name)
		{
			for (auto itr = this->settings.begin (); itr != this->settings.end (); ++itr)
				if (itr->name == name)
					{
						delete itr->val;
						this->settings.erase (itr);
						return;
					}
		}

		/*
		 * Removes all settings from the group.
		 */
		void
		group::clear ()
		{
			for (setting& s : this->settings)
				delete s.val;
			this->settings.clear ();
		}



		value*
		group::find (const std::string& name) const
		{
			for (const setting& s : this->settings)
				if (s.name == name)
					return s.val;
			return nullptr;
		}

		template<typename T> static T*
		_find_typed (const group& grp, const std::string& name, value_type typ,
			const char *type_name)
		{
			value *val = grp.find (name);
			if (!val) return nullptr;
			if (val->type () != typ)
				throw cfg_type_error ("\"" + name + "\": expected " + type_name);
			return static_cast<T *> (val);
		}

		integer*
		group::find_integer (const std::string& name) const
			{ return _find_typed<integer> (*this, name, CFG_INTEGER, "an integer"); }

		string*
		group::find_string (const std::string& name) const
			{ return _find_typed<string> (*this, name, CFG_STRING, "a string"); }

		boolean*
		group::find_boolean (const std::string& name) const
			{ return _find_typed<boolean> (*this, name, CFG_BOOLEAN, "a boolean"); }

		group*
		group::find_group (const std::string& name) const
			{ return _find_typed<group> (*this, name, CFG_GROUP, "a group"); }

		array*
		group::find_array (const std::string& name) const
			{ return _find_typed<array> (*this, name, CFG_ARRAY, "an array"); }



		long long
		group::get_integer (const std::string& name) const
		{
			integer *val = this->find_integer (name);
			if (!val)
				throw cfg_find_error ("\"" + name + "\" not found");
			return val->val ();
		}

		std::string
		group::get_string (const std::string& name) const
		{
			string *val = this->find_string (name);
			if (!val)
				throw cfg_find_error ("\"" + name + "\" not found");
			return val->val ();
		}

		bool
		group::get_boolean (const std::string& name) const
		{
			boolean *val = this->find_boolean (name);
			if (!val)
				throw cfg_find_error ("\"" + name + "\" not found");
			return val->val ();
		}



		bool
		group::try_get_integer (const std::string& name, long long& out) const
		{
			if (!this->exists (name, CFG_INTEGER))
				return false;
			out = this->get_integer (name);
			return true;
		}

		bool
		group::try_get_string (const std::string& name, std::string& out) const
		{
			if (!this->exists (name, CFG_STRING))
				return false;
			out = this->get_string (name);
			return true;
		}

		bool
		group::try_get_boolean (const std::string& name, bool& out) const
		{
			if (!this->exists (name, CFG_BOOLEAN))
				return false;
			out = this->get_boolean (name);
			return true;
		}



		bool
		group::exists (const std::string& name, value_type typ) const
		{
			value *val = this->find (name);
			if (!val)
				return false;
			return (typ == CFG_NONE) || (val->type () == typ);
		}



		void
		group::write_to (std::ostream& strm, int indent) const
		{
			if (this->settings.empty ())
				{
					strm << "{}";
					return;
				}

			strm << "{\n";
			bool is_first = true;
			for (const setting& s : this->settings)
				{
					if (!is_first)
						{
							for (int i = 0; i < this->lines_between; ++i)
								strm << "\n";
						}

					indent_with_spaces (strm, indent + 2);
					strm << s.name << ": ";
					s.val->write_to (strm, indent + 2);
					strm << ";\n";

					is_first = false;
				}

			indent_with_spaces (strm, indent);
			strm << "}";
		}



	//----
		/*
		 * READING
		 */

		namespace {

			static void
			_expect (std::istream& strm, int ch, const char *err = "encountered unexpected character")
			{
				if (strm.get () != ch)
					throw cfg_error (err);
			}

			static void
			_skip_whitespace (std::istream& strm)
			{
				int c;
				for (;;)
					{
						c = strm.peek ();
						if (c == std::istream::traits_type::eof ())
							break;
						if (!std::isspace (c))
							{
								// maybe it's a comment
								if (c == '/')
									{
										strm.get ();
										if (strm.peek () != '/')
											{ strm.unget (); break; }
										for (;;)
											{
												c = strm.get ();
												if (c == '\n' || c == std::istream::traits_type::eof ())
													break;
											}
										continue;
									}
								else
									break;
							}
						strm.get ();
					}
			}


			static bool
			_is_name_char (int c, bool initial = false)
			{
				if (c == std::istream::traits_type::eof ())
					return false;
				return ((initial ? std::isalpha (c) : std::isalnum (c)) || (c == '-') || (c == '_'));
			}

			static std::string
			_read_name (std::istream& strm)
			{
				std::string str;

				bool initial = true;
				while (_is_name_char (strm.peek (), initial))
					{
						str.push_back (strm.get ());
						initial = false;
					}

				if (str.empty ())
					throw cfg_error ("expected a name");
				return str;
			}


			static value* _read_value (std::istream& strm); // forward dec

			static integer*
			_read_integer (std::istream& strm)
			{
				bool neg = false;
				if (strm.peek () == '-')
					{
						strm.get ();
						neg = true;
					}

				long long val = 0;
				int digits = 0;
				while (std::isdigit (strm.peek ()))
					{
						val = (val * 10) + (strm.get () - '0');
						++ digits;
					}

				if (digits == 0)
					throw cfg_error ("expected a number");
				return new integer (neg ? -val : val);
			}

			static string*
			_read_string (std::istream& strm)
			{
				_expect (strm, '"');

				std::string str;
				int c;
				for (;;)
					{
						c = strm.get ();
						if (c == std::istream::traits_type::eof ())
							throw cfg_error ("unexpected end of string");
						if (c == '"')
							break;

						if (c == '\\')
							{
								c = strm.get ();
								switch (c)
									{
										case '\\': str.push_back ('\\'); break;
										case '"': str.push_back ('"'); break;
										case 'n': str.push_back ('\n'); break;

										case std::istream::traits_type::eof ():
											throw cfg_error ("unexpected end of string");
										default:
											throw cfg_error ("unknown escape sequence in string");
									}
							}
						else
							str.push_back (c);
					}

				return new string (str);
			}

			static group*
			_read_group (std::istream& strm)
			{
				std::unique_ptr<group> grp {new group ()};

				_skip_whitespace (strm);
				_expect (strm, '{', "expected {");

				int c;
				for (;;)
					{
						_skip_whitespace (strm);
						c = strm.peek ();
						if (c == std::istream::traits_type::eof ())
							throw cfg_error ("unexpected eof");
						if (c == '}')
							{
								strm.get ();
								break;
							}

						std::string name = _read_name (strm);
						_skip_whitespace (strm);
						_expect (strm, ':', "expected :");
						_skip_whitespace (strm);

						grp->add (name, _read_value (strm));

						_skip_whitespace (strm);
						_expect (strm, ';', "expected ;");
					}

				return grp.release ();
			}

			static array*
			_read_array (std::istream& strm)
			{
				std::unique_ptr<array> arr {new array ()};

				_skip_whitespace (strm);
				_expect (strm, '[', "expected [");

				int c;
				for (;;)
					{
						_skip_whitespace (strm);
						c = strm.peek ();
						if (c == std::istream::traits_type::eof ())
							throw cfg_error ("unexpected eof");
						if (c == ']')
							{
								strm.get ();
								break;
							}

						arr->add (_read_value (strm));

						_skip_whitespace (strm);
						c = strm.peek ();
						if (c == ',')
							strm.get ();
						else if (c != ']')
							throw cfg_error ("expected , inside array");
					}

				return arr.release ();
			}

			static boolean*
			_read_boolean (std::istream& strm)
			{
				std::string word;
				while (std::isalpha (strm.peek ()))
					word.push_back (strm.get ());

				if (word == "true")
					return new boolean (true);
				else if (word == "false")
					return new boolean (false);

				throw cfg_error ("expected a boolean");
			}

			static value*
			_read_value (std::istream& strm)
			{
				int c = strm.peek ();
				if (c == std::istream::traits_type::eof ())
					throw cfg_error ("expected a value");

				if (std::isdigit (c) || (c == '-'))
					return _read_integer (strm);

				if (c == '"')
					return _read_string (strm);

				if (c == '{')
					return _read_group (strm);

				if (c == '[')
					return _read_array (strm);

				if (c == 't' || c == 'f')
					return _read_boolean (strm);

				throw cfg_error ("unknown type of value");
			}
		}



		group*
		group::read_from (std::istream& strm)
		{
			std::unique_ptr<group> grp {_read_group (strm)};

			// make sure there's nothing after this
			_skip_whitespace (strm);
			if (strm.peek () != std::istream::traits_type::eof ())
				throw cfg_error ("unexpected characters after group");

			return grp.release ();
		}

		group*
		group::read_from (const std::string& str)
		{
			std::istringstream ss {str};
			return group::read_from (ss);
		}
	}
}

