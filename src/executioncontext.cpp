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
 * @file executioncontext.cpp
 */

# include <string>
# include <log4cxx/logger.h>

# include "grntest/global.h"
# include "grntest/errdb.h"
# include "grntest/Exceptions.h"
# include "grntest/executioncontext.h"

using namespace std;
using namespace grntestharness::Exceptions;

namespace grntestharness
{

ExecutionContext :: ExecutionContext () :
	_logging(true),
	_baseDirectory(DEFAULT_BASE_DIRECTORY),
	_firstTimeout(DEFAULT_FIRST_TIMEOUT_MSEC),
	_nNested(0),
	_onError(ON_ERROR_DEFAULT),
	_omitted(false),
	_abortToken(0)
{
}

void ExecutionContext :: log (EntryTag tag, const string &content, const OutputOptions &options)
{
	if (!_logging || content.empty ())
		return;

	_result.append (ResultEntry (tag, content, options));
}

void ExecutionContext :: logError (const string &content)
{
	_result.append (ResultEntry (ENTRY_ERROR, content));
}

void ExecutionContext :: error (void)
{
	switch (_onError)
	{
		case ON_ERROR_OMIT :
			omit ();
			break;
		case ON_ERROR_DEFAULT :
			break;
	}
}

void ExecutionContext :: omit (void)
{
	log4cxx :: LoggerPtr logger = log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME);
	LOG4CXX_DEBUG (logger, "Omitting the rest of the run.");

	_omitted = true;
	abort ();
}

void ExecutionContext :: abort (void)
{
	if (!_abortToken)
		throw ExecutorError (FILE_LINE_FUNCTION, ERR_EXECUTOR_NO_ABORT_TOKEN);

	_abortToken->trigger ();
}

AbortScope :: AbortScope (ExecutionContext &context, bool establish) :
	_context(context), _established(false)
{
	if (!establish)
		return;

	if (_context._abortToken)
		throw ExecutorError (FILE_LINE_FUNCTION, ERR_EXECUTOR_ABORT_TOKEN_ALREADY_ESTABLISHED);

	_context._abortToken = &_token;
	_established = true;
}

AbortScope :: ~AbortScope ()
{
	if (_established)
		_context._abortToken = 0;
}

} //END namespace grntestharness
