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
 * @file errdb.h
 *
 * @brief file containing error database definitions for
 * configuration, system and executor errors
 */

# ifndef GRNTEST_ERRDB_H
# define GRNTEST_ERRDB_H

# include <string>

namespace grntestharness
{
namespace Exceptions
{

/* core Error Database definition */
struct coreErrorDB
{
	int code;
	std::string msg;
};

/**
 ***** Configuration Errors *****
 */
enum config_errcodes
{
	ERR_CONFIG_UNKNOWN = -1,
	ERR_CONFIG_GROONGA_COMMAND_EMPTY,
	ERR_CONFIG_BASE_DIRECTORY_INVALID,
	ERR_CONFIG_TEMPORARY_DIRECTORY_EMPTY,
	ERR_CONFIG_INVALID_LOGDESTINATION,
	ERR_CONFIG_LOGFILE_EMPTY,
	ERR_CONFIG_INVALID_TIMEOUT,
	ERR_CONFIG_DIFF_COMMAND_EMPTY,
	ERR_CONFIG_MAX
};

/* Configuration errors database with min,max error code range */
struct ConfigErrorDB
{
	int errorcodeMin;
	struct coreErrorDB core[ERR_CONFIG_MAX];
	int errorcodeMax;
};

extern struct ConfigErrorDB config_errdb;

/* __________________________________________________________________________________ */
/**
 ******** System Errors *********
 */
enum system_errcodes
{
	ERR_SYSTEM_UNKNOWN = -1,
	ERR_SYSTEM_FILE_CREATION,
	ERR_SYSTEM_EMPTY_JOBLIST,
	ERR_SYSTEM_EMPTY_SERVER_COMMAND,
	ERR_SYSTEM_CHANNEL_CLOSED,
	ERR_SYSTEM_MAX
};

/* System errors database with min,max error code range */
struct SystemErrorDB
{
	int errorcodeMin;
	struct coreErrorDB core[ERR_SYSTEM_MAX];
	int errorcodeMax;
};

extern struct SystemErrorDB system_errdb;

/* __________________________________________________________________________________ */
/**
 ******** Executor Errors *********
 */

enum executor_errcodes
{
	ERR_EXECUTOR_UNKNOWN = -1,
	ERR_EXECUTOR_UNTERMINATED_QUOTE,
	ERR_EXECUTOR_INVALID_ON_ERROR_POLICY,
	ERR_EXECUTOR_NO_ABORT_TOKEN,
	ERR_EXECUTOR_ABORT_TOKEN_ALREADY_ESTABLISHED,
	ERR_EXECUTOR_MAX
};

struct ExecutorErrorDB
{
	int errorcodeMin;
	struct coreErrorDB core[ERR_EXECUTOR_MAX];
	int errorcodeMax;
};

extern struct ExecutorErrorDB executor_errdb;
} //END namespace Exceptions
} //END namespace grntestharness
# endif
