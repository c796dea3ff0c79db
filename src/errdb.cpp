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
 * @file errdb.cpp
 */

# include "grntest/errdb.h"

namespace grntestharness
{
namespace Exceptions
{

struct ConfigErrorDB config_errdb =
{
	ERR_CONFIG_UNKNOWN,
	{
		{ERR_CONFIG_GROONGA_COMMAND_EMPTY, "Groonga command must be specified"},
		{ERR_CONFIG_BASE_DIRECTORY_INVALID, "Base directory either does not exist or is not a directory"},
		{ERR_CONFIG_TEMPORARY_DIRECTORY_EMPTY, "Temporary directory must be specified"},
		{ERR_CONFIG_INVALID_LOGDESTINATION, "Invalid log destination specified"},
		{ERR_CONFIG_LOGFILE_EMPTY, "Log file must be specified when logging to a file"},
		{ERR_CONFIG_INVALID_TIMEOUT, "Timeout must be > 0 and fit in an int of milliseconds"},
		{ERR_CONFIG_DIFF_COMMAND_EMPTY, "Diff command must be specified"},
	},
	ERR_CONFIG_MAX
};

struct SystemErrorDB system_errdb =
{
	ERR_SYSTEM_UNKNOWN,
	{
		{ERR_SYSTEM_FILE_CREATION, "Failed to create a file"},
		{ERR_SYSTEM_EMPTY_JOBLIST, "empty job list"},
		{ERR_SYSTEM_EMPTY_SERVER_COMMAND, "Server command line is empty"},
		{ERR_SYSTEM_CHANNEL_CLOSED, "Channel to the server process is already closed"},
	},
	ERR_SYSTEM_MAX
};

struct ExecutorErrorDB executor_errdb =
{
	ERR_EXECUTOR_UNKNOWN,
	{
		{ERR_EXECUTOR_UNTERMINATED_QUOTE, "Unmatched quote"},
		{ERR_EXECUTOR_INVALID_ON_ERROR_POLICY, "Unknown on-error policy. Valid values are \"default\" and \"omit\"."},
		{ERR_EXECUTOR_NO_ABORT_TOKEN, "Abort requested but no abort token is established"},
		{ERR_EXECUTOR_ABORT_TOKEN_ALREADY_ESTABLISHED, "An abort token is already established for this run"},
	},
	ERR_EXECUTOR_MAX
};

} //END namespace Exceptions
} //END namespace grntestharness
