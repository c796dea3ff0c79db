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
 * @file scriptinterpreter.h
 * @brief executes a test script line by line against the server
 */

# ifndef GRNTEST_SCRIPTINTERPRETER_H
# define GRNTEST_SCRIPTINTERPRETER_H

# include <string>
# include <log4cxx/logger.h>

# include "grntest/global.h"
# include "grntest/resultlog.h"
# include "grntest/executioncontext.h"
# include "grntest/outputchannel.h"

namespace grntestharness
{
namespace executors
{

/**
 * Reads a test script and sends its commands to the server.
 * Supported lines are:
 *   blank lines                ignored
 *   # disable-logging          stop recording input and output
 *   # enable-logging           record input and output again
 *   # include PATH             run PATH with the same context
 *   # on-error default|omit    what a failed json response does
 *   # omit                     stop the run and mark it omitted
 *   command ... \              continued on the next line
 *   load ...                   following lines are sent until one ending
 *                              with ']' gets a response
 *   any other line             sent as a command
 * One instance serves one script file. Included files get their own
 * instance sharing the context.
 */
class ScriptInterpreter
{
	public :
		ScriptInterpreter (OutputChannel &channel, ExecutionContext &context);

		/**
		 * @return the result log of the context
		 * @throws NotExist when scriptPath does not exist
		 */
		ResultLog &execute (const std::string &scriptPath);

	private :
		void executeLineOnLoading (const std::string &line);
		void executeLineWithContinuationLineSupport (const std::string &line);
		void executeLine (const std::string &line);
		void executeComment (const std::string &content);
		void executeScript (const std::string &path);
		void executeCommand (const std::string &line);
		void extractCommandInfo (const std::string &line);
		std::string readOutput (void);

		void logInput (const std::string &content);
		void logOutput (const std::string &content);
		void logError (const std::string &content);

		OutputChannel     &_channel;
		ExecutionContext  &_context;
		log4cxx::LoggerPtr _logger;

		bool          _loading;
		std::string   _pendingCommand;
		std::string   _currentCommand;
		std::string   _outputFormat;
};

} //END namespace executors
} //END namespace grntestharness
# endif
