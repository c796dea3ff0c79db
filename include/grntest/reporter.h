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
 * @file reporter.h
 * @brief file containing reporter class
 */

# ifndef GRNTEST_REPORTER_H
# define GRNTEST_REPORTER_H

# include <iostream>
# include <fstream>
# include <string>
# include <log4cxx/logger.h>
# include <boost/thread/mutex.hpp>
# include <boost/scoped_ptr.hpp>

# include "grntest/global.h"
# include "grntest/xmlarchive.h"

namespace grntestharness
{

/**
 * this class prints the outcome of every test to the console, tallies the
 * outcomes and, when a report file is given, also writes them into the
 * report file in the XML format.
 * Every public call prints one whole block so workers can share it.
 */
class REPORTER
{
	public :
		REPORTER (const HarnessCommandLineOptions &options, std::ostream &output = std::cout);
		~REPORTER ();

		void start (void);
		void passTest (const TestcaseExecutionInfo &info);
		void failTest (const TestcaseExecutionInfo &info, const std::string &expected, const std::string &actual);
		void noCheckTest (const TestcaseExecutionInfo &info, const std::string &actual);
		void omitTest (const TestcaseExecutionInfo &info);

		/* the test could not be run at all */
		void errorTest (const TestcaseExecutionInfo &info);
		void finish (void);

		struct ExecutionStats getExecutionStats (void);

		/* COLUMNS, then TERM_WIDTH, else DEFAULT_TERM_WIDTH. 0 when the value is not a number */
		static int guessTermWidth (void);

	private :
		REPORTER (const REPORTER &);
		REPORTER &operator= (const REPORTER &);

		void reportTestResult (const TestcaseExecutionInfo &info, const std::string &label);
		void reportDiff (const std::string &expected, const std::string &actual);
		void putRule (void);
		void finishTest (const TestcaseExecutionInfo &info);

		std::ostream                    &_output;
		HarnessCommandLineOptions        _options;
		int                              _termWidth;
		struct ExecutionStats            _es;
		boost::mutex                     _mutex;

		std::ofstream                    _ofs;
		boost::scoped_ptr<XMLArchive>    _xa;
		log4cxx::LoggerPtr               _logger;
};

} //END namespace grntestharness

# endif
