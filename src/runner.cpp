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
 * @file runner.cpp
 */

# include <string>
# include <vector>
# include <exception>
# include <log4cxx/logger.h>
# include <log4cxx/ndc.h>
# include <boost/filesystem/operations.hpp>
# include <boost/date_time/posix_time/posix_time.hpp>

# include "grntest/global.h"
# include "grntest/Exceptions.h"
# include "grntest/helper.h"
# include "grntest/executioncontext.h"
# include "grntest/serverprocess.h"
# include "grntest/scriptinterpreter.h"
# include "grntest/outputnormalizer.h"
# include "grntest/reporter.h"
# include "grntest/runner.h"

# define LOGGER_TAG_RUNNER  "[RUNNER]"

using namespace std;
using namespace log4cxx;
using namespace grntestharness::Exceptions;
namespace harnessexceptions = grntestharness::Exceptions;
namespace bfs = boost :: filesystem;

namespace grntestharness
{

namespace
{
long int currentTimeMsec (void)
{
	boost::posix_time::ptime time_of_epoch (boost::gregorian::date (1970,1,1));
	return (boost::posix_time::microsec_clock::local_time () - time_of_epoch).total_milliseconds ();
}
}

Runner :: Runner (const HarnessCommandLineOptions &options, const string &tcfile, int slot) :
	_options(options),
	_tcfile(tcfile),
	_tmpdir((bfs::path (options.temporaryDirectory) / iTos (slot)).string ()),
	_logger(log4cxx::Logger::getLogger (HARNESS_LOGGER_NAME))
{
}

Result Runner :: run (REPORTER &reporter)
{
	LogString saved_context;
	LOGGER_PUSH_NDCTAG (LOGGER_TAG_RUNNER);

	struct TestcaseExecutionInfo info;
	bfs::path p (_tcfile);
	info.testID = (p.parent_path () / p.stem ()).string ();
	info.tcfile = _tcfile;
	info.sTime = currentTimeMsec ();

	LOG4CXX_INFO (_logger, "Running test [" << _tcfile << "]");

	string expected;
	bool omitted = false;
	try
	{
		_actual = runScript (omitted);
		info.result = omitted ? RESULT_OMITTED : check (_actual, expected);
	}
	catch (harnessexceptions :: ERROR &e)
	{
		LOG4CXX_ERROR (_logger, e.what ());
		info.eTime = currentTimeMsec ();
		info.result = RESULT_FAIL;
		info.failureReason = e.detail ();
		reporter.errorTest (info);
		LOGGER_POP_NDCTAG;
		return info.result;
	}
	catch (std::exception &e)
	{
		LOG4CXX_ERROR (_logger, e.what ());
		info.eTime = currentTimeMsec ();
		info.result = RESULT_FAIL;
		info.failureReason = e.what ();
		reporter.errorTest (info);
		LOGGER_POP_NDCTAG;
		return info.result;
	}

	info.eTime = currentTimeMsec ();
	LOG4CXX_INFO (_logger, "Test [" << _tcfile << "] finished in " << (info.eTime - info.sTime) << " ms");

	switch (info.result)
	{
		case RESULT_PASS        : reporter.passTest (info); break;
		case RESULT_FAIL        :
			info.failureReason = "Expected output and actual output differ.";
			reporter.failTest (info, expected, _actual);
			break;
		case RESULT_NOT_CHECKED : reporter.noCheckTest (info, _actual); break;
		case RESULT_OMITTED     : reporter.omitTest (info); break;
	}

	LOGGER_POP_NDCTAG;
	return info.result;
}

string Runner :: runScript (bool &omitted)
{
	ScopedTemporaryDirectory tmpdir (_tmpdir);
	string db_path = (bfs::path (tmpdir.path ()) / DEFAULT_DB_NAME).string ();

	ExecutionContext context;
	context.setBaseDirectory (_options.baseDirectory);
	context.setTemporaryDirectory (tmpdir.path ());
	context.setDbPath (db_path);
	context.setFirstTimeout (_options.firstTimeout);

	vector<string> argv;
	argv.push_back (_options.groonga);
	argv.push_back ("-n");
	argv.push_back (db_path);

	{
		ServerProcess server (argv);
		executors::ScriptInterpreter interpreter (server.getChannel (), context);
		interpreter.execute (_tcfile);

		int status = server.close ();
		LOG4CXX_DEBUG (_logger, "Server [" << _options.groonga << "] exited with status " << status);
	}

	omitted = context.isOmitted ();

	OutputNormalizer normalizer;
	return normalizer.normalizeResult (context.result ());
}

Result Runner :: check (const string &actual, string &expected)
{
	string expected_file = relatedFilePath (_tcfile, EXPECTED_FILE_EXTENSION);

	/* no extension, so nowhere to put related files */
	if (expected_file.empty ())
		return RESULT_NOT_CHECKED;

	if (bfs::exists (expected_file) && readBinaryFile (expected_file, expected) == SUCCESS)
	{
		string reject_file = relatedFilePath (_tcfile, REJECT_FILE_EXTENSION);
		if (actual == expected)
		{
			boost::system::error_code ec;
			bfs::remove (reject_file, ec);
			return RESULT_PASS;
		}

		LOG4CXX_DEBUG (_logger, "Writing reject file [" << reject_file << "]");
		writeBinaryFile (reject_file, actual);
		return RESULT_FAIL;
	}

	string actual_file = relatedFilePath (_tcfile, ACTUAL_FILE_EXTENSION);
	LOG4CXX_DEBUG (_logger, "No expected result, writing [" << actual_file << "]");
	writeBinaryFile (actual_file, actual);
	return RESULT_NOT_CHECKED;
}

} //END namespace grntestharness
