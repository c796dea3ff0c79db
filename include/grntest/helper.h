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
 * @file helper.h
 * @brief file containing helper functions for general purpose
 */

# ifndef GRNTEST_HELPER_H
# define GRNTEST_HELPER_H

# include <sys/types.h>
# include <string>
# include <vector>

# include "grntest/global.h"

namespace grntestharness
{
/**
 * splits a command line into words following POSIX shell quoting rules.
 * Throws ExecutorError on an unmatched quote.
 */
int shellSplit (const std::string &line, std::vector<std::string> &words);

int remove_duplicates (std::vector <std::string> &strcollection);
int collectTestCases (const std::vector <std::string> &targets, std::vector <std::string> &tclist);
bool commandExists (const std::string &command);
long int sToi (const std::string str);
std::string iTos (long long int i);
std::string errnoMessage (int errnum);

int readBinaryFile (const std::string &path, std::string &content);
void writeBinaryFile (const std::string &path, const std::string &content);
std::string createTemporaryFile (const std::string &tmpdir, const std::string &prefix, const std::string &content);

/* runs argv[0] with the given arguments, returns its exit code or FAILURE */
int runCommand (const std::vector<std::string> &argv);

/**
 * replaces the extension of a test file, "a/b.test" -> "a/b.expected".
 * @return empty string when the file has no extension
 */
std::string relatedFilePath (const std::string &tcfile, const std::string &extension);

/**
 * (re)creates a directory on construction and removes it with its
 * contents on destruction
 */
class ScopedTemporaryDirectory
{
	public :
		explicit ScopedTemporaryDirectory (const std::string &path);
		~ScopedTemporaryDirectory ();
		const std::string &path (void) const { return _path; }

	private :
		ScopedTemporaryDirectory (const ScopedTemporaryDirectory &);
		ScopedTemporaryDirectory &operator= (const ScopedTemporaryDirectory &);

		std::string _path;
};
} //END namespace grntestharness

# endif
