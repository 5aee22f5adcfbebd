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

#ifndef _hPerms__LOGGER_H_
#define _hPerms__LOGGER_H_

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <pthread.h>


namespace hPerms {

	enum logtype
	{
		LT_DEBUG = 0,
		LT_SYSTEM,
		LT_INFO,
		LT_WARNING,
		LT_ERROR,
		LT_FATAL,
	};

	/*
	 * Parses a level name (debug, system, info, warning, error, fatal).
	 * Returns false if the name is not recognized.
	 */
	bool parse_logtype (const std::string& name, logtype& out);


	/*
	 * Thread-safe line logger.
	 * Every thread writes into its own stream, a line is handed over to the
	 * underlying sinks only once the stream is flushed.
	 */
	class logger
	{
	public:
		class logger_buf: public std::stringbuf
		{
			logger& log;

		public:
			logtype lt;

		public:
			logger_buf (logger& log);

			/*
			 * Locks the logger and outputs whatever's in the internal string
			 * buffer to the logger's sinks.
			 */
			virtual int sync () override;
		};

		class logger_strm: public std::ostream
		{
			friend class logger;
			logger_buf buf;

		public:
			logger_strm (logger& log);
		};

	private:
		std::mutex lock;
		std::ostream& out;

		std::string log_dir;
		std::ofstream fs;
		int fsc;
		int day;

		logtype min_level;
		pthread_key_t strm_key;

	private:
		/*
		 * Reopens the internal file stream and sets its path to a file whose
		 * name contains the current date.
		 */
		void recalc_date ();

	public:
		/*
		 * Class constructor.
		 * If @{log_dir} is empty, lines are only written to @{out}.
		 *
		 * Throws `std::runtime_error' on failure.
		 */
		logger (std::ostream& out = std::clog, const std::string& log_dir = "");

		/*
		 * Class destructor.
		 */
		~logger ();

		logger (const logger&) = delete;
		logger& operator= (const logger&) = delete;



		void set_level (logtype lt) { this->min_level = lt; }
		logtype get_level () const { return this->min_level; }

		/*
		 * Returns a stream unique to the calling thread that it can use to log
		 * events.
		 *
		 * NOTE: After messages are written to the stream, the stream MUST be
		 * flushed (i.e. std::endl or std::flush).
		 */
		logger_strm& operator() (logtype lt = LT_SYSTEM);
	};
}

#endif

