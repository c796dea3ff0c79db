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
 * @file outputnormalizer.h
 * @brief turns a result log into a string that can be compared between runs
 */

# ifndef GRNTEST_OUTPUTNORMALIZER_H
# define GRNTEST_OUTPUTNORMALIZER_H

# include <string>
# include <json/json.h>

# include "grntest/global.h"
# include "grntest/resultlog.h"

namespace grntestharness
{

class OutputNormalizer
{
	public :
		explicit OutputNormalizer (size_t maxColumns = MAX_N_COLUMNS) : _maxColumns(maxColumns) {}

		std::string normalizeResult (const ResultLog &result) const;

		/**
		 * normalizes one server response. A json response gets its status
		 * replaced by a timing free one and is pretty printed when its
		 * compact form is wider than maxColumns. Anything else is kept.
		 * The returned string is always newline terminated.
		 */
		std::string normalizeOutput (const std::string &content, OutputFormat format) const;

		/* [rc, start, elapsed, message, backtrace] -> [0,0.0,0.0] or [[rc,0.0,0.0],message] */
		static Json::Value normalizeStatus (const Json::Value &status);

		/**
		 * json writers keeping object members in the order they were parsed
		 * in and writing doubles with the shortest text that reads back
		 * to the same value
		 */
		static std::string generate (const Json::Value &value);
		static std::string prettyGenerate (const Json::Value &value);

		/* 0.1 -> "0.1", 1 -> "1.0", 1e-05 -> "1.0e-05" */
		static std::string formatDouble (double value);

		/* @return false when 'content' is not a json response with a numeric return code */
		static bool extractReturnCode (const std::string &content, int &returnCode);

	private :
		static void write (const Json::Value &value, bool pretty, const std::string &indent, std::string &out);

		size_t _maxColumns;
};

} //END namespace grntestharness
# endif
