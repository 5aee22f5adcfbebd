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

#include "util/logger.hpp"
#include "util/stringutils.hpp"
#include <string>
#include <stdexcept>
#include <chrono>
#include <iomanip>
#include <sys/stat.h>
#include <ctime>


namespace hPerms {

	static const char *logtype_names[] =
		{
			"debug  ",
			"system ",
			"info   ",
			"warning",
			"error  ",
			"fatal  ",
		};

	/*
	 * Parses a level name (debug, system, info, warning, error, fatal).
	 */
	bool
	parse_logtype (const std::string& name, logtype& out)
	{
		std::string str = sutils::to_lower (name);
		sutils::trim (str);

		for (int i = LT_DEBUG; i <= LT_FATAL; ++i)
			{
				std::string lname {logtype_names[i]};
				sutils::trim (lname);
				if (lname == str)
					{
						out = static_cast<logtype> (i);
						return true;
					}
			}

		return false;
	}



	/*
	 * Class constructor.
	 */
	logger::logger_buf::logger_buf (logger& log)
		: log (log), lt (LT_INFO)
		{ }


	/*
	 * Locks the buffer's underlying mutex and outputs whatever's in the
	 * internal string buffer out to the logger's sinks.
	 */
	int
	logger::logger_buf::sync ()
	{
		std::string output = this->str ();
		this->str (std::string ());
		if (output.empty () || this->lt < this->log.min_level)
			return 0;

		std::lock_guard<std::mutex> guard {this->log.lock};

		this->log.out << output;
		this->log.out.flush ();

		// write to disk
		if (!this->log.log_dir.empty ())
			{
				std::time_t t = std::time (nullptr);
				struct tm ltm;
				localtime_r (&t, &ltm);

				if (ltm.tm_mday != this->log.day)
					this->log.recalc_date ();

				if (this->log.fs)
					{
						this->log.fs << output;
						if (this->log.fsc++ % 30 == 0)
							this->log.fs.flush ();
					}
			}

		return 0;
	}



	/*
	 * Class constructor.
	 */
	logger::logger_strm::logger_strm (logger& log)
		: std::ostream (&buf), buf (log)
		{ }



	static void
	_mark_session (std::ofstream& fs)
	{
		if (!fs) return;

		std::time_t t = std::time (nullptr);
		struct tm lt;
		localtime_r (&t, &lt);

		if (fs.tellp () > 0)
			fs << "\n\n" << std::flush;

		fs <<
"********************************************************************************\n"
"    New Session:\n"
"      @ " << std::setfill ('0')
					 << std::setw (2) << lt.tm_hour << ":"
					 << std::setw (2) << lt.tm_min << ":"
					 << std::setw (2) << lt.tm_sec << "   "
					 << std::setw (2) << (lt.tm_mon + 1) << "/"
					 << std::setw (2) << lt.tm_mday << "/"
					 << (lt.tm_year + 1900) << std::setfill (' ') << "\n" <<
"********************************************************************************\n"
			 << std::endl;
	}

	/*
	 * Class constructor.
	 *
	 * Throws `std::runtime_error' on failure.
	 */
	logger::logger (std::ostream& out, const std::string& log_dir)
		: out (out), log_dir (log_dir)
	{
		this->fsc = 0;
		this->day = -1;
		this->min_level = LT_INFO;

		if (!this->log_dir.empty ())
			{
				this->recalc_date ();
				_mark_session (this->fs);
			}

		if (pthread_key_create (&this->strm_key,
			[] (void *param)
				{
					delete static_cast<logger::logger_strm *> (param);
				}))
			throw std::runtime_error ("failed to create stream key");
	}

	/*
	 * Class destructor.
	 */
	logger::~logger ()
	{
		// streams owned by other threads are released when those threads exit.
		void *ptr = pthread_getspecific (this->strm_key);
		if (ptr)
			{
				pthread_setspecific (this->strm_key, nullptr);
				delete static_cast<logger_strm *> (ptr);
			}
		pthread_key_delete (this->strm_key);

		if (this->fs.is_open ())
			this->fs.close ();
	}



	/*
	 * Reopens the internal file stream and sets its path to a file whose name
	 * contains the appropriate date.
	 */
	void
	logger::recalc_date ()
	{
		if (this->fs.is_open ())
			this->fs.close ();
		this->fsc = 0;

		std::time_t t = std::time (nullptr);
		struct tm lt;
		localtime_r (&t, &lt);
		this->day = lt.tm_mday;

		std::ostringstream ss;
		ss << this->log_dir << "/log-" << std::setfill ('0')
			 << std::setw (2) << (lt.tm_mon + 1) << "-"
			 << std::setw (2) << lt.tm_mday << "-"
			 << (lt.tm_year + 1900) << ".log";

		mkdir (this->log_dir.c_str (), 0744);
		this->fs.open (ss.str (), std::ios_base::out | std::ios_base::app);
		if (!this->fs)
			this->out << "[LOGGER ERROR] Failed to open logfile for writing!" << std::endl;
	}



	static void
	write_logtype_and_time (logger::logger_strm& strm, logtype lt)
	{
		std::time_t t1;
		std::tm     t2;

		t1 = std::chrono::system_clock::to_time_t (
			std::chrono::system_clock::now ());
		localtime_r (&t1, &t2);

		strm << logtype_names[lt] << " | " << std::setfill ('0')
				 << std::setw (2) << t2.tm_hour << ':'
				 << std::setw (2) << t2.tm_min  << ':'
				 << std::setw (2) << t2.tm_sec  << " | " << std::setfill (' ');
	}

	/*
	 * Returns a stream unique to the calling thread that it can use to log
	 * events. Returning a thread-local instance this way ensures
	 * thread-safety.
	 */
	logger::logger_strm&
	logger::operator() (logtype lt)
	{
		void *ptr;

		ptr = pthread_getspecific (this->strm_key);
		if (!ptr)
			{
				ptr = new logger_strm (*this);
				if (pthread_setspecific (this->strm_key, ptr))
					{
						delete static_cast<logger_strm *> (ptr);
						throw std::runtime_error ("failed to bind key with stream");
					}
			}

		logger_strm* strm = static_cast<logger_strm *> (ptr);
		strm->buf.lt = lt;
		write_logtype_and_time (*strm, lt);
		return *strm;
	}
}

