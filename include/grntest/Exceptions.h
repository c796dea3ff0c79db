/*
**
* BEGIN_COPYRIGHT
*
* This file is part of SciDB.
* Copyright (C) 2008-2014 SciDB, Inc.
*
* SciDB is free software: you can redistribute it and/or modify
* it under the terms of the AFFERO GNU General Public License as published by
* the Free Software Foundation.
*
* SciDB is distributed "AS-IS" AND WITHOUT ANY WARRANTY OF ANY KIND,
* INCLUDING ANY IMPLIED WARRANTY OF MERCHANTABILITY,
* NON-INFRINGEMENT, OR FITNESS FOR A PARTICULAR PURPOSE. See
* the AFFERO GNU General Public License for the complete license terms.
*
* You should have received a copy of the AFFERO GNU General Public License
* along with SciDB.  If not, see <http://www.gnu.org/licenses/agpl-3.0.html>
*
* END_COPYRIGHT
*/

/**
 * @file Exceptions.h
 * @brief file containing concrete classes for accessing corresponding error databases
 */

# ifndef GRNTEST_EXCEPTIONS_H
# define GRNTEST_EXCEPTIONS_H

# include <string>
# include <exception>
# include <stdexcept>

# include "grntest/helper.h"
# include "grntest/errdb.h"

# define NO_CODE -1
# define FILE_LINE_FUNCTION __FILE__,__LINE__,__FUNCTION__
# define PRINT_ERROR(msg) \
{\
	if (_loggerEnabled)\
	{\
		LOG4CXX_ERROR (_logger, msg);\
	}\
	else\
		std::cerr << msg << std::endl;\
}

namespace grntestharness
{
namespace Exceptions
{

/**
 * basic class only displaying the message that was set in its member variables.
 * '_msg' holds the place the error was raised at, '_detail' what went wrong.
 */
class ERROR
{
	public :
		ERROR (void) {}
		ERROR (std::string m) : _detail(m) {}

		virtual std::string what (void) throw();

		/**
		 * @return the message without the source location, suitable for result logs
		 */
		virtual std::string detail (void) const throw() { return _detail; }
		virtual ~ERROR () throw () {}

	protected :
		void setLocation (const std::string &filename, int linenum, const std::string &functionname)
		{
			_msg = filename + ":" + iTos (linenum) + ":" + functionname + "(): ";
		}

		std::string _msg;
		std::string _detail;
};

/**
 * accesses configuration error messages
 */
class ConfigError : public ERROR
{
	public :
		ConfigError (const std::string &filename, int linenum, const std::string &functionname, int c) : ERROR ()
		{
			setLocation (filename, linenum, functionname);
			if (c<=config_errdb.errorcodeMin || c>=config_errdb.errorcodeMax)
			{
				_msg = _msg + "Out of range. Invalid Error Code mentioned for ConfigError.";
				throw std::range_error (_msg);
			}
			_detail = config_errdb.core[c].msg;
			_code = c;
		}

		ConfigError (const std::string &filename, int linenum, const std::string &functionname, const std::string &m) : ERROR (m)
		{
			setLocation (filename, linenum, functionname);
			_code = NO_CODE;
		}

		~ConfigError () throw () {}
		std::string what (void) throw();
		int code (void) const { return _code; }

	private :
		int _code;
};

/**
 * accesses system error messages
 */
class SystemError : public ERROR
{
	public :
		SystemError (const std::string &filename, int linenum, const std::string &functionname, int c) : ERROR ()
		{
			setLocation (filename, linenum, functionname);
			if (c<=system_errdb.errorcodeMin || c>=system_errdb.errorcodeMax)
			{
				_msg = _msg + "Out of range. Invalid Error Code mentioned for SystemError.";
				throw std::range_error (_msg);
			}
			_detail = system_errdb.core[c].msg;
			_code = c;
		}

		SystemError (const std::string &filename, int linenum, const std::string &functionname, const std::string &m) : ERROR (m)
		{
			setLocation (filename, linenum, functionname);
			_code = NO_CODE;
		}

		~SystemError () throw () {}
		std::string what (void) throw();
		int code (void) const { return _code; }

	private :
		int _code;
};

/**
 * accesses executor error messages
 */
class ExecutorError : public ERROR
{
	public :
		ExecutorError (const std::string &filename, int linenum, const std::string &functionname, int c) : ERROR ()
		{
			setLocation (filename, linenum, functionname);
			if (c<=executor_errdb.errorcodeMin || c>=executor_errdb.errorcodeMax)
			{
				_msg = _msg + "Out of range. Invalid Error Code mentioned for ExecutorError.";
				throw std::range_error (_msg);
			}
			_detail = executor_errdb.core[c].msg;
			_code = c;
		}

		ExecutorError (const std::string &filename, int linenum, const std::string &functionname, const std::string &m) : ERROR (m)
		{
			setLocation (filename, linenum, functionname);
			_code = NO_CODE;
		}

		~ExecutorError () throw () {}
		std::string what (void) throw();
		int code (void) const { return _code; }

	private :
		int _code;
};

/**
 * raised when a script (top level or included) does not exist
 */
class NotExist : public ExecutorError
{
	public :
		NotExist (const std::string &filename, int linenum, const std::string &functionname, const std::string &path) :
			ExecutorError (filename, linenum, functionname, "<" + path + "> doesn't exist."),
			_path(path)
		{ }

		~NotExist () throw () {}
		const std::string &path (void) const { return _path; }

	private :
		std::string _path;
};

} //END namespace Exceptions
} //END namespace grntestharness

# endif
