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
 * @file harness.h
 * @brief file containing a concrete class for actual grntest executable
 */

# ifndef GRNTEST_HARNESS_H
# define GRNTEST_HARNESS_H

# include <string>
# include <vector>
# include <log4cxx/logger.h>
# include <log4cxx/ndc.h>

# include "grntest/global.h"
# include "grntest/interface.h"
# include "grntest/manager.h"
# include "grntest/reporter.h"

# define DEFAULT_DIFF_COMMAND         "diff"
# define CUT_DIFF_COMMAND             "cut-diff"

class HarnessTest;
namespace grntestharness
{
/**
 * a concrete class for actual grntest executable
 */
class GrnTestHarness : public interface::Application
{
	public :
		GrnTestHarness ()
		{
			initConfDefault ();
			_rptr = 0;
			_loggerEnabled = false;
		}

		~GrnTestHarness () throw()
		{
			if (_loggerEnabled)
			{
				log4cxx::NDC :: pop ();
				log4cxx::NDC :: remove ();
			}
			if (_rptr)
				delete _rptr;
		}

		const HarnessCommandLineOptions &options (void) const { return _c; }

		friend class ::HarnessTest;
	private :
		struct HarnessCommandLineOptions _c;
		bool _diffOptionsGiven;
		std::vector <std::string> _tcList;
		MANAGER _M;                          /* job manager */
		REPORTER* _rptr;                     /* reporter */
		log4cxx::LoggerPtr _logger;          /* logger */
		bool _loggerEnabled;

	private :
		int execute (void);
		void printConf (void);

		int createLogger (void);
		void createReporter (void)
		{
			_rptr = new REPORTER (_c);
		}
		void chooseDiff (void);
		int validateParameters (void);
		int parseCommandLine (int argc, char** argv);
		void initConfDefault (void);
};
} //END namespace grntestharness

# endif
