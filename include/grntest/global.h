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
 * @file global.h
 * @brief file containing global macros, structure, variable definitions
 */

# ifndef GRNTEST_GLOBAL_H
# define GRNTEST_GLOBAL_H

# include <string>
# include <vector>

# define GRNTEST_VERSION                "1.0.0"
# define HARNESS_LOGGER_NAME            "GrnTestHarness"

# define DEFAULT_GROONGA_COMMAND        "groonga"
# define DEFAULT_BASE_DIRECTORY         "."
# define DEFAULT_TEMPORARY_DIRECTORY    "tmp"
# define DEFAULT_DB_NAME                "db"
# define DEFAULT_LOG_FILE               "grntest.log"
# define DEFAULT_DEBUGLEVEL             3
# define MIN_DEBUG_LEVEL                0
# define MAX_DEBUG_LEVEL                5
# define DEFAULT_PARALLEL_TESTCASES     1
# define MIN_PARALLEL_TESTCASES         1
# define MAX_PARALLEL_TESTCASES         50

/* first poll of a drain waits this long for the peer to start answering */
# define DEFAULT_FIRST_TIMEOUT_MSEC     1000
# define SERVER_SHUTDOWN_TIMEOUT_MSEC   10000
# define READ_CHUNK_SIZE                65535

/* normalized json output longer than this is pretty printed */
# define MAX_N_COLUMNS                  79
# define DEFAULT_TERM_WIDTH             79

# define DEFAULT_TESTCASE_FILE_EXTENSION ".test"
# define EXPECTED_FILE_EXTENSION        "expected"
# define REJECT_FILE_EXTENSION          "reject"
# define ACTUAL_FILE_EXTENSION          "actual"

# define OUTPUT_FORMAT_JSON             "json"
# define OUTPUT_FORMAT_GROONGA_COMMAND  "groonga-command"

# define LOGDESTINATION_FILE      "file"
# define LOGDESTINATION_CONSOLE   "console"

# define DEBUGLEVEL_FATAL    0
# define DEBUGLEVEL_ERROR    1
# define DEBUGLEVEL_WARN     2
# define DEBUGLEVEL_INFO     3
# define DEBUGLEVEL_DEBUG    4
# define DEBUGLEVEL_TRACE    5

# define LINE_FEED  '\n'

# define FAILURE   -1
# define SUCCESS    0
# define EXIT       1

# define LOGGER_PUSH_NDCTAG(tag) \
{\
    log4cxx::NDC :: get(saved_context);\
    log4cxx::NDC :: clear();\
    log4cxx::NDC :: push(tag);\
}

# define LOGGER_POP_NDCTAG \
{\
    log4cxx::NDC :: pop();\
    log4cxx::NDC :: remove();\
    log4cxx::NDC :: push(saved_context);\
}

namespace grntestharness
{

enum Result
{
	RESULT_PASS,
	RESULT_FAIL,
	RESULT_NOT_CHECKED,
	RESULT_OMITTED
};

struct ExecutionStats
{
	ExecutionStats ()
	{
		testcasesTotal = testcasesPassed = testcasesFailed = testcasesNotChecked = testcasesOmitted = 0;
	}
	unsigned int testcasesTotal;
	unsigned int testcasesPassed;
	unsigned int testcasesFailed;
	unsigned int testcasesNotChecked;
	unsigned int testcasesOmitted;
};

struct TestcaseExecutionInfo
{
	TestcaseExecutionInfo ()
	{
		sTime = eTime = 0;
		result = RESULT_FAIL;
	}

	std::string testID;
	std::string tcfile;
	long int sTime;
	long int eTime;
	Result result;
	std::string failureReason;
};

/* commandline options for harness */
struct HarnessCommandLineOptions
{
	std::string                  groonga;
	std::string                  baseDirectory;
	std::string                  temporaryDirectory;
	std::string                  diff;
	std::vector<std::string>     diffOptions;
	std::vector<std::string>     targets;
	int                          firstTimeout;        /* milliseconds */
	int                          parallelTestCases;
	std::string                  reportFilename;
	std::string                  logDestination;
	std::string                  logFile;
	int                          debugLevel;
};

} //END namespace grntestharness
# endif
