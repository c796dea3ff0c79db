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
 * @file runner.h
 * @brief file containing the class which runs a single test script
 */

# ifndef GRNTEST_RUNNER_H
# define GRNTEST_RUNNER_H

# include <string>
# include <log4cxx/logger.h>

# include "grntest/global.h"
# include "grntest/reporter.h"

namespace grntestharness
{

/**
 * runs one test script against a freshly started server and compares
 * the normalized result with the .expected file next to the script.
 * Leaves a .reject file on failure and an .actual file when there is
 * nothing to compare against.
 */
class Runner
{
	public :
		/* 'slot' names the temporary directory under options.temporaryDirectory */
		Runner (const HarnessCommandLineOptions &options, const std::string &tcfile, int slot = 0);

		Result run (REPORTER &reporter);

	private :
		std::string runScript (bool &omitted);
		Result check (const std::string &actual, std::string &expected);

		const HarnessCommandLineOptions &_options;
		std::string         _tcfile;
		std::string         _tmpdir;
		std::string         _actual;
		log4cxx::LoggerPtr  _logger;
};

} //END namespace grntestharness

# endif
