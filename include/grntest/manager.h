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
 * @file manager.h
 * @brief file containing thread manager class
 */

# ifndef GRNTEST_MANAGER_H
# define GRNTEST_MANAGER_H

# include <vector>
# include <string>
# include <boost/thread/thread.hpp>
# include <boost/thread/mutex.hpp>
# include <log4cxx/logger.h>

# include "grntest/global.h"
# include "grntest/reporter.h"

# define DEFAULT_nWORKERS 1

namespace grntestharness
{

/**
 * class responsible for creating the worker threads and handing out the
 * test files to them. Each worker takes the next test file from the job
 * list as soon as it is done with the previous one, and runs it in its own
 * temporary directory slot.
 */
class MANAGER
{
	private :
		boost::thread_group           _G;
		int                           _nWorkers;
		HarnessCommandLineOptions     _options;
		log4cxx::LoggerPtr            _logger;

		/* shared between the workers */
		boost::mutex                  _jobMutex;
		const std::vector<std::string> *_joblist;
		std::vector<std::string>::size_type _nextJob;
		REPORTER                     *_rptr;

		boost::mutex                  _statsMutex;
		struct ExecutionStats         _es;

		bool nextJob (std::string &job);
		void workerFunction (int slot);

	public :
		MANAGER () : _nWorkers(-1), _logger(log4cxx::Logger::getLogger (HARNESS_LOGGER_NAME)),
		             _joblist(0), _nextJob(0), _rptr(0)
		{
		}

		void join_all (void)
		{
			_G.join_all ();
		}
		void cleanup (void);
		struct ExecutionStats getExecutionStats (void);
		int runJob (const std::vector <std::string> &joblist, REPORTER *rptr);
		void createWorkgroup (int number_of_workers = DEFAULT_nWORKERS);
		void getInfoForRunnerFromharness (const HarnessCommandLineOptions &c)
		{
			_options = c;
		}
		void useLogger (const std::string logger_name)
		{
			_logger = log4cxx::Logger::getLogger (logger_name);
		}

		~MANAGER ()
		{
			cleanup ();
		}
};
} //END namespace grntestharness

# endif
