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
 * @file reporter.cpp
 */

# include <stdio.h>
# include <stdlib.h>
# include <fstream>
# include <string>
# include <vector>
# include <exception>
# include <log4cxx/logger.h>
# include <log4cxx/ndc.h>
# include <boost/filesystem/operations.hpp>
# include <boost/archive/archive_exception.hpp>

# include "grntest/global.h"
# include "grntest/errdb.h"
# include "grntest/Exceptions.h"
# include "grntest/helper.h"
# include "grntest/reporter.h"
# include "grntest/xmlarchive.h"

# define LOGGER_TAG_REPORTER   "[REPORTER]"

using namespace std;
using namespace log4cxx;
using namespace grntestharness::Exceptions;
namespace harnessexceptions = grntestharness::Exceptions;
namespace bfs = boost :: filesystem;

namespace grntestharness
{

namespace
{
/* removes the file when going out of scope */
class ScopedFileRemover
{
	public :
		explicit ScopedFileRemover (const string &path) : _path(path) {}
		~ScopedFileRemover ()
		{
			boost::system::error_code ec;
			bfs::remove (_path, ec);
		}

	private :
		ScopedFileRemover (const ScopedFileRemover &);
		ScopedFileRemover &operator= (const ScopedFileRemover &);

		string _path;
};
}

REPORTER :: REPORTER (const HarnessCommandLineOptions &options, ostream &output) :
	_output(output),
	_options(options),
	_termWidth(guessTermWidth ()),
	_logger(log4cxx::Logger::getLogger (HARNESS_LOGGER_NAME))
{
}

REPORTER :: ~REPORTER ()
{
	_xa.reset ();
	_ofs.flush ();
}

int REPORTER :: guessTermWidth (void)
{
	const char *width = getenv ("COLUMNS");
	if (!width)
		width = getenv ("TERM_WIDTH");
	if (!width)
		return DEFAULT_TERM_WIDTH;

	long int w = sToi (width);
	return w < 0 ? 0 : w;
}

void REPORTER :: start (void)
{
	if (_options.reportFilename.empty ())
		return;

	LogString saved_context;
	LOGGER_PUSH_NDCTAG (LOGGER_TAG_REPORTER);

	_ofs.open (_options.reportFilename.c_str ());
	if (!_ofs.good ())
	{
		LOG4CXX_ERROR (_logger, "Could not open report file [" << _options.reportFilename << "]");
		LOGGER_POP_NDCTAG;
		throw SystemError (FILE_LINE_FUNCTION, ERR_SYSTEM_FILE_CREATION);
	}

	try
	{
		LOG4CXX_INFO (_logger, "Writing Initial Info to report file.");
		_xa.reset (new XMLArchive (_ofs));
		_xa->putStartTag ("GrnTestEnv");
		_xa->save (_options);
		_xa->putEndTag ("GrnTestEnv");
		_xa->putStartTagNOIndent ("TestResults");
		_xa->flush ();
	}
	catch (boost::archive::archive_exception &ae)
	{
		LOGGER_POP_NDCTAG;
		throw SystemError (FILE_LINE_FUNCTION, ae.what ());
	}

	LOGGER_POP_NDCTAG;
}

void REPORTER :: passTest (const TestcaseExecutionInfo &info)
{
	boost::mutex::scoped_lock lock (_mutex);
	reportTestResult (info, "pass");
	finishTest (info);
}

void REPORTER :: failTest (const TestcaseExecutionInfo &info, const string &expected, const string &actual)
{
	boost::mutex::scoped_lock lock (_mutex);
	reportTestResult (info, "fail");
	putRule ();
	try
	{
		reportDiff (expected, actual);
	}
	catch (harnessexceptions :: ERROR &e)
	{
		LOG4CXX_ERROR (_logger, "Could not show the difference : " << e.what ());
		_output << e.detail () << endl;
	}
	catch (std::exception &e)
	{
		LOG4CXX_ERROR (_logger, "Could not show the difference : " << e.what ());
		_output << e.what () << endl;
	}
	putRule ();
	finishTest (info);
}

void REPORTER :: noCheckTest (const TestcaseExecutionInfo &info, const string &actual)
{
	boost::mutex::scoped_lock lock (_mutex);
	reportTestResult (info, "not checked");
	_output << actual;
	if (actual.empty () || actual[actual.length () - 1] != LINE_FEED)
		_output << LINE_FEED;
	finishTest (info);
}

void REPORTER :: omitTest (const TestcaseExecutionInfo &info)
{
	boost::mutex::scoped_lock lock (_mutex);
	reportTestResult (info, "omitted");
	finishTest (info);
}

void REPORTER :: errorTest (const TestcaseExecutionInfo &info)
{
	boost::mutex::scoped_lock lock (_mutex);
	reportTestResult (info, "fail");
	_output << info.failureReason << endl;
	finishTest (info);
}

void REPORTER :: finish (void)
{
	boost::mutex::scoped_lock lock (_mutex);

	_output << endl;
	_output << _es.testcasesTotal << " tests, "
	        << _es.testcasesPassed << " passes, "
	        << _es.testcasesFailed << " failures." << endl;
	if (_es.testcasesOmitted > 0)
		_output << _es.testcasesOmitted << " omissions." << endl;

	double pass_ratio = 0;
	if (_es.testcasesTotal > 0)
		pass_ratio = (_es.testcasesPassed / double (_es.testcasesTotal)) * 100;

	char buf[64];
	snprintf (buf, sizeof (buf), "%.4g%% passed.", pass_ratio);
	_output << buf << endl;

	if (_xa)
	{
		LogString saved_context;
		LOGGER_PUSH_NDCTAG (LOGGER_TAG_REPORTER);
		LOG4CXX_INFO (_logger, "Writing Final Info to report file.");

		_xa->putEndTagNOIndent ("TestResults");
		_xa->putStartTag ("FinalStats");
		_xa->save (_es);
		_xa->putEndTag ("FinalStats");
		_xa->finish ();
		_xa.reset ();

		LOGGER_POP_NDCTAG;
	}
}

struct ExecutionStats REPORTER :: getExecutionStats (void)
{
	boost::mutex::scoped_lock lock (_mutex);
	return _es;
}

void REPORTER :: reportTestResult (const TestcaseExecutionInfo &info, const string &label)
{
	string name = "  " + bfs::path (info.tcfile).filename ().string ();
	string message = " [" + label + "]";

	if (_termWidth > 0)
	{
		int width = _termWidth - int (name.length ());
		if (width > int (message.length ()))
			message = string (width - message.length (), ' ') + message;
	}

	_output << name << message << endl;
}

void REPORTER :: putRule (void)
{
	_output << string (_termWidth, '=') << endl;
}

void REPORTER :: reportDiff (const string &expected, const string &actual)
{
	string tmpdir = bfs::temp_directory_path ().string ();
	string expected_file = createTemporaryFile (tmpdir, "groonga-test-expected", expected);
	ScopedFileRemover expected_remover (expected_file);
	string actual_file = createTemporaryFile (tmpdir, "groonga-test-actual", actual);
	ScopedFileRemover actual_remover (actual_file);

	vector<string> argv;
	argv.push_back (_options.diff);
	argv.insert (argv.end (), _options.diffOptions.begin (), _options.diffOptions.end ());
	argv.push_back ("--label");
	argv.push_back ("(actual)");
	argv.push_back (actual_file);
	argv.push_back ("--label");
	argv.push_back ("(expected)");
	argv.push_back (expected_file);

	/* diff writes to our stdout */
	_output.flush ();
	int exit_code = runCommand (argv);
	LOG4CXX_DEBUG (_logger, "Diff command exited with code " << exit_code);
}

void REPORTER :: finishTest (const TestcaseExecutionInfo &info)
{
	_es.testcasesTotal++;
	switch (info.result)
	{
		case RESULT_PASS        : _es.testcasesPassed++;     break;
		case RESULT_FAIL        : _es.testcasesFailed++;     break;
		case RESULT_NOT_CHECKED : _es.testcasesNotChecked++; break;
		case RESULT_OMITTED     : _es.testcasesOmitted++;    break;
	}

	if (_xa)
	{
		_xa->putStartTagNOIndent ("IndividualTestResult");
		_xa->save (info);
		_xa->putEndTagNOIndent ("IndividualTestResult");
		_xa->flush ();
	}
}

} //END namespace grntestharness
