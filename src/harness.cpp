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
 * @file harness.cpp
 */

# include <string>
# include <sstream>
# include <iostream>
# include <strings.h>
# include <limits.h>
# include <log4cxx/patternlayout.h>
# include <log4cxx/consoleappender.h>
# include <log4cxx/fileappender.h>
# include <log4cxx/logger.h>
# include <log4cxx/ndc.h>
# include <boost/filesystem/operations.hpp>
# include <boost/program_options/options_description.hpp>
# include <boost/program_options/positional_options.hpp>
# include <boost/program_options/variables_map.hpp>
# include <boost/program_options/parsers.hpp>

# include "grntest/global.h"
# include "grntest/helper.h"
# include "grntest/harness.h"
# include "grntest/manager.h"
# include "grntest/Exceptions.h"
# include "grntest/errdb.h"

# define LOGGER_TAG_HARNESS  "[HARNESS]"

using namespace std;
using namespace log4cxx;
using namespace grntestharness;
using namespace grntestharness::Exceptions;
namespace harnessexceptions = grntestharness::Exceptions;
namespace po = boost::program_options;
namespace bfs = boost :: filesystem;

namespace grntestharness
{

int GrnTestHarness :: execute (void)
{
	int rv = SUCCESS;
	LOG4CXX_INFO (_logger, "Starting the execution.");

	try
	{
		collectTestCases (_c.targets, _tcList);

		ScopedTemporaryDirectory tmpdir (_c.temporaryDirectory);
		_rptr->start ();

		if (_tcList.empty ())
		{
			LOG4CXX_WARN (_logger, "There are no test cases to be run.");
		}
		else
		{
			_M.useLogger (HARNESS_LOGGER_NAME);
			_M.getInfoForRunnerFromharness (_c);
			rv = _M.runJob (_tcList, _rptr);
		}

		_rptr->finish ();

		struct ExecutionStats es = _rptr->getExecutionStats ();
		LOG4CXX_INFO (_logger, "Total test cases = " << es.testcasesTotal
		              << ", passed = " << es.testcasesPassed
		              << ", failed = " << es.testcasesFailed
		              << ", not checked = " << es.testcasesNotChecked
		              << ", omitted = " << es.testcasesOmitted);
		if (es.testcasesFailed > 0)
			rv = FAILURE;

		LOG4CXX_INFO (_logger, "Returning from execute()");
	}

	catch (harnessexceptions :: ERROR &e)
	{
		PRINT_ERROR (e.what ());
		_M.cleanup ();
		LOG4CXX_INFO (_logger, "Returning from execute()");
		return FAILURE;
	}

	catch (exception &e)
	{
		PRINT_ERROR (e.what ());
		_M.cleanup ();
		LOG4CXX_INFO (_logger, "Returning from execute()");
		return FAILURE;
	}

	return rv;
}

void GrnTestHarness :: printConf (void)
{
	LOG4CXX_INFO (_logger, "Printing grntest CommandLine options :");
	LOG4CXX_INFO (_logger, "Groonga =                                     " << _c.groonga);
	LOG4CXX_INFO (_logger, "Base Directory =                              " << _c.baseDirectory);
	LOG4CXX_INFO (_logger, "Temporary Directory =                         " << _c.temporaryDirectory);
	LOG4CXX_INFO (_logger, "Diff =                                        " << _c.diff);
	for (unsigned int i=0; i<_c.diffOptions.size (); i++)
	{
		LOG4CXX_INFO (_logger, "Diff Option =                                 " << _c.diffOptions[i]);
	}
	for (unsigned int i=0; i<_c.targets.size (); i++)
	{
		LOG4CXX_INFO (_logger, "Target =                                      " << _c.targets[i]);
	}
	LOG4CXX_INFO (_logger, "Timeout (msec) =                              " << _c.firstTimeout);
	LOG4CXX_INFO (_logger, "Log Destination =                             " << _c.logDestination);
	LOG4CXX_INFO (_logger, "Log File =                                    " << _c.logFile);
	LOG4CXX_INFO (_logger, "Report File Name  =                           " << _c.reportFilename);
	LOG4CXX_INFO (_logger, "Number of test cases to be run in Parallel =  " << _c.parallelTestCases);
	LOG4CXX_INFO (_logger, "DebugLevel  =                                 " << _c.debugLevel);
}

int GrnTestHarness :: createLogger (void)
{
	_logger = log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME);
	_logger->setAdditivity (0);
	_logger->removeAllAppenders ();

	log4cxx :: LayoutPtr layout (new log4cxx :: PatternLayout (LOG4CXX_STR ("%d %p %x - %m%n")));

	if (strcasecmp (_c.logDestination.c_str (), LOGDESTINATION_CONSOLE) == 0)
	{
		log4cxx :: AppenderPtr appender (new log4cxx :: ConsoleAppender (layout));
		_logger->addAppender (appender);
	}
	else
	{
		log4cxx :: AppenderPtr appender (new log4cxx :: FileAppender (layout, _c.logFile, true));
		_logger->addAppender (appender);
	}

	NDC::push (LOGGER_TAG_HARNESS);
	_loggerEnabled = true;
	LOG4CXX_INFO (_logger, "logger SYSTEM ENABLED");

	switch (_c.debugLevel)
	{
		case DEBUGLEVEL_FATAL : _logger->setLevel (log4cxx :: Level :: getFatal ()); break;
		case DEBUGLEVEL_ERROR : _logger->setLevel (log4cxx :: Level :: getError ()); break;
		case DEBUGLEVEL_WARN  : _logger->setLevel (log4cxx :: Level :: getWarn ()); break;
		case DEBUGLEVEL_INFO  : _logger->setLevel (log4cxx :: Level :: getInfo ()); break;
		case DEBUGLEVEL_DEBUG : _logger->setLevel (log4cxx :: Level :: getDebug ()); break;
		case DEBUGLEVEL_TRACE : _logger->setLevel (log4cxx :: Level :: getTrace ()); break;
		default               : return FAILURE;
	}

	return SUCCESS;
}

/* cut-diff when it is installed, plain diff otherwise */
void GrnTestHarness :: chooseDiff (void)
{
	if (!_c.diff.empty ())
		return;

	if (commandExists (CUT_DIFF_COMMAND))
	{
		_c.diff = CUT_DIFF_COMMAND;
		if (!_diffOptionsGiven)
		{
			_c.diffOptions.push_back ("--context-lines");
			_c.diffOptions.push_back ("10");
		}
	}
	else
	{
		_c.diff = DEFAULT_DIFF_COMMAND;
		if (!_diffOptionsGiven)
			_c.diffOptions.push_back ("-u");
	}
}

int GrnTestHarness :: validateParameters (void)
{
	if (_c.groonga.empty ())
		throw ConfigError (FILE_LINE_FUNCTION, ERR_CONFIG_GROONGA_COMMAND_EMPTY);

	if (_c.baseDirectory.empty () || !bfs::is_directory (_c.baseDirectory))
		throw ConfigError (FILE_LINE_FUNCTION, ERR_CONFIG_BASE_DIRECTORY_INVALID);

	if (_c.temporaryDirectory.empty ())
		throw ConfigError (FILE_LINE_FUNCTION, ERR_CONFIG_TEMPORARY_DIRECTORY_EMPTY);

	if (_c.firstTimeout <= 0)
		throw ConfigError (FILE_LINE_FUNCTION, ERR_CONFIG_INVALID_TIMEOUT);

	if (strcasecmp (_c.logDestination.c_str (), LOGDESTINATION_CONSOLE) != 0 &&
	    strcasecmp (_c.logDestination.c_str (), LOGDESTINATION_FILE) != 0)
		throw ConfigError (FILE_LINE_FUNCTION, ERR_CONFIG_INVALID_LOGDESTINATION);

	if (strcasecmp (_c.logDestination.c_str (), LOGDESTINATION_FILE) == 0 && _c.logFile.empty ())
		throw ConfigError (FILE_LINE_FUNCTION, ERR_CONFIG_LOGFILE_EMPTY);

	if (_c.parallelTestCases < MIN_PARALLEL_TESTCASES || _c.parallelTestCases > MAX_PARALLEL_TESTCASES)
	{
		stringstream ss;
		ss << "Invalid value specified for option --parallel. Valid range is [" << MIN_PARALLEL_TESTCASES << "-" << MAX_PARALLEL_TESTCASES << "]";
		throw ConfigError (FILE_LINE_FUNCTION, ss.str());
	}

	if (_c.debugLevel < MIN_DEBUG_LEVEL || _c.debugLevel > MAX_DEBUG_LEVEL)
	{
		stringstream ss;
		ss << "Invalid value specified for option --debug. Valid range is [" << MIN_DEBUG_LEVEL << "-" << MAX_DEBUG_LEVEL << "]";
		throw ConfigError (FILE_LINE_FUNCTION, ss.str());
	}

	chooseDiff ();

	return SUCCESS;
}

int GrnTestHarness :: parseCommandLine (int argc, char** argv)
{
	po::options_description desc(
			"Usage: grntest [--groonga <command>] [--base-directory <dir>] [--temporary-directory <dir>] "
			"[--diff <command>] [--diff-option <option>]... [--timeout <seconds>] [--parallel <value>] "
			"[--report-file <file>] [--log-destination <value>] [--log-file <file>] [--debug <value>] "
			"[--version] TEST_FILE_OR_DIRECTORY...\n"
			);

	desc.add_options()
		("groonga",              po::value<string>(), "Groonga server command. Started as '<command> -n <temporary-directory>/db'. Default is \"groonga\".")
		("base-directory",       po::value<string>(), "Base directory for relative paths given to '# include'. Default is the current directory.")
		("temporary-directory",  po::value<string>(), "Scratch directory, recreated for each run and removed afterwards. Default is \"tmp\".")
		("diff",                 po::value<string>(), "Diff command used to show failures. Default is \"cut-diff\" when available, otherwise \"diff\".")
		("diff-option",          po::value< vector<string> >()->composing(), "Option passed to the diff command. Can be given multiple times.")
		("timeout",              po::value<double>(), "Seconds to wait for the first chunk of a server response. Default is 1.")
		("parallel",             po::value<int>(),    "Number of test cases to be executed in parallel. Valid range is [1-50]. Default is 1.")
		("report-file",          po::value<string>(), "Name of the file in which a report will be stored in the XML format.")
		("log-destination",      po::value<string>(), "Indicates where to log the messages. Valid values are \"console\" or \"file\". Default is \"file\".")
		("log-file",             po::value<string>(), "Log file used when logging to a file. Default is \"grntest.log\".")
		("debug",                po::value<int>(),    "Log level can be in the range [0-5]. Level 0 only logs fatal errors while level 5 is most verbose. Default is 3.")
		("help,h", "View this text.")
		("version", "version");

	po::options_description hidden;
	hidden.add_options()
		("target", po::value< vector<string> >(), "test file or directory");

	po::options_description all;
	all.add (desc).add (hidden);

	po::positional_options_description positional;
	positional.add ("target", -1);

	po::variables_map vm;
	try
	{
		po::store (po::command_line_parser (argc, argv).options (all).positional (positional).run (), vm);
		po::notify (vm);
	}
	catch (const boost::program_options::error &e)
	{
		cerr << "Error during command line parsing: " << e.what() << endl;
		return FAILURE;
	}

	if (vm.count ("help"))
	{
		cout << desc << endl;
		return EXIT;
	}

	if (vm.count ("version"))
	{
		cout << GRNTEST_VERSION << endl;
		return EXIT;
	}

	if (vm.count ("groonga"))
		_c.groonga = vm["groonga"].as<string>();

	if (vm.count ("base-directory"))
		_c.baseDirectory = vm["base-directory"].as<string>();

	if (vm.count ("temporary-directory"))
		_c.temporaryDirectory = vm["temporary-directory"].as<string>();

	/* an explicit diff command starts with no options of its own */
	if (vm.count ("diff"))
	{
		_c.diff = vm["diff"].as<string>();
		if (_c.diff.empty ())
			throw ConfigError (FILE_LINE_FUNCTION, ERR_CONFIG_DIFF_COMMAND_EMPTY);
	}

	if (vm.count ("diff-option"))
	{
		_c.diffOptions = vm["diff-option"].as< vector<string> >();
		_diffOptionsGiven = true;
	}

	/* seconds on the command line, milliseconds inside; NaN fails the first test */
	if (vm.count ("timeout"))
	{
		double timeout = vm["timeout"].as<double>() * 1000;
		if (!(timeout > 0) || timeout > INT_MAX)
			throw ConfigError (FILE_LINE_FUNCTION, ERR_CONFIG_INVALID_TIMEOUT);
		_c.firstTimeout = int (timeout);
	}

	if (vm.count ("parallel"))
		_c.parallelTestCases = vm["parallel"].as<int>();

	if (vm.count ("report-file"))
		_c.reportFilename = vm["report-file"].as<string>();

	if (vm.count ("log-destination"))
		_c.logDestination = vm["log-destination"].as<string>();

	if (vm.count ("log-file"))
		_c.logFile = vm["log-file"].as<string>();

	if (vm.count ("debug"))
		_c.debugLevel = vm["debug"].as<int>();

	if (vm.count ("target"))
		_c.targets = vm["target"].as< vector<string> >();

	validateParameters ();

	if (createLogger () == FAILURE)
		return FAILURE;

	printConf ();
	createReporter ();

	return SUCCESS;
}

void GrnTestHarness :: initConfDefault (void)
{
	_c.groonga            = DEFAULT_GROONGA_COMMAND;
	_c.baseDirectory      = DEFAULT_BASE_DIRECTORY;
	_c.temporaryDirectory = DEFAULT_TEMPORARY_DIRECTORY;
	_c.firstTimeout       = DEFAULT_FIRST_TIMEOUT_MSEC;
	_c.parallelTestCases  = DEFAULT_PARALLEL_TESTCASES;
	_c.logDestination     = LOGDESTINATION_FILE;
	_c.logFile            = DEFAULT_LOG_FILE;
	_c.debugLevel         = DEFAULT_DEBUGLEVEL;
	_diffOptionsGiven     = false;
}

} //END namespace grntestharness
