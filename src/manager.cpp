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

/*
 * @file manager.cpp
 */

# include <vector>
# include <string>
# include <exception>
# include <boost/thread/thread.hpp>
# include <boost/bind/bind.hpp>
# include <log4cxx/logger.h>
# include <log4cxx/ndc.h>

# include "grntest/Exceptions.h"
# include "grntest/errdb.h"
# include "grntest/manager.h"
# include "grntest/reporter.h"
# include "grntest/runner.h"
# include "grntest/global.h"
# include "grntest/helper.h"

# define LOGGER_TAG_MANAGER  "[MANAGER]"
# define LOGGER_TAG_WORKER   "WORKER"

using namespace std;
using namespace log4cxx;
using namespace grntestharness::Exceptions;
namespace harnessexceptions = grntestharness::Exceptions;

namespace grntestharness
{

bool MANAGER :: nextJob (string &job)
{
	boost::mutex::scoped_lock lock (_jobMutex);
	if (!_joblist || _nextJob >= _joblist->size ())
		return false;

	job = (*_joblist)[_nextJob++];
	return true;
}

void MANAGER :: workerFunction (int slot)
{
	string worker_tag = LOGGER_TAG_WORKER;
	worker_tag = worker_tag + '[' + iTos (slot) + ']';

	LogString saved_context;
	LOGGER_PUSH_NDCTAG (worker_tag);

	LOG4CXX_TRACE (_logger, "Entered ...");

	string job;
	while (nextJob (job))
	{
		LOG4CXX_DEBUG (_logger, "Executing job [" << job << "]");

		Result r = RESULT_FAIL;
		try
		{
			Runner runner (_options, job, slot);
			r = runner.run (*_rptr);
		}
		catch (harnessexceptions :: ERROR &e)
		{
			/* the runner reports its own failures, this is the reporter failing */
			LOG4CXX_ERROR (_logger, "Worker failed to execute the job [" << job << "] completely : " << e.what ());
		}
		catch (std::exception &e)
		{
			LOG4CXX_ERROR (_logger, "Worker failed to execute the job [" << job << "] completely : " << e.what ());
		}

		boost::mutex::scoped_lock lock (_statsMutex);
		_es.testcasesTotal++;
		switch (r)
		{
			case RESULT_PASS        : _es.testcasesPassed++;     break;
			case RESULT_FAIL        : _es.testcasesFailed++;     break;
			case RESULT_NOT_CHECKED : _es.testcasesNotChecked++; break;
			case RESULT_OMITTED     : _es.testcasesOmitted++;    break;
		}
	}

	LOG4CXX_DEBUG (_logger, "Job list exhausted. Returning.");
	LOGGER_POP_NDCTAG;
}

void MANAGER :: cleanup (void)
{
	LogString saved_context;
	LOGGER_PUSH_NDCTAG (LOGGER_TAG_MANAGER);

	if (_nWorkers <= 0)
	{
		LOGGER_POP_NDCTAG;
		return;
	}

	LOG4CXX_INFO (_logger, "Cleaning up by joining all the workers.");
	join_all ();
	_nWorkers = -1;
	LOG4CXX_INFO (_logger, "joined all.");

	LOGGER_POP_NDCTAG;
}

struct ExecutionStats MANAGER :: getExecutionStats (void)
{
	boost::mutex::scoped_lock lock (_statsMutex);
	return _es;
}

int MANAGER :: runJob (const vector <string> &joblist, REPORTER *rptr)
{
	LogString saved_context;
	LOGGER_PUSH_NDCTAG (LOGGER_TAG_MANAGER);

	if (joblist.empty ())
	{
		LOGGER_POP_NDCTAG;
		throw SystemError (FILE_LINE_FUNCTION, ERR_SYSTEM_EMPTY_JOBLIST);
	}

	{
		boost::mutex::scoped_lock lock (_jobMutex);
		_joblist = &joblist;
		_nextJob = 0;
		_rptr = rptr;
	}

	LOG4CXX_INFO (_logger, "There are " << joblist.size () << " test case(s) to be run.");
	createWorkgroup (_options.parallelTestCases);

	/* the job list has to outlive the workers */
	cleanup ();

	{
		boost::mutex::scoped_lock lock (_jobMutex);
		_joblist = 0;
		_rptr = 0;
	}

	struct ExecutionStats es = getExecutionStats ();
	LOGGER_POP_NDCTAG;
	return es.testcasesFailed > 0 ? FAILURE : SUCCESS;
}

void MANAGER :: createWorkgroup (int number_of_workers)
{
	LOG4CXX_INFO (_logger, "Creating a pool of " << number_of_workers << " worker(s).");
	if (_nWorkers > 0)
	{
		LOG4CXX_INFO (_logger, "Worker pool is already created with " << _nWorkers << " worker(s). Returning...");
		return;
	}

	if (number_of_workers < MIN_PARALLEL_TESTCASES)
		number_of_workers = MIN_PARALLEL_TESTCASES;

	for (int i = 0; i < number_of_workers; i++)
		_G.create_thread (boost::bind (&MANAGER::workerFunction, this, i));

	_nWorkers = number_of_workers;
}

} //END namespace grntestharness
