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
 * @file helper.cpp
 */

# include <sys/types.h>
# include <sys/stat.h>
# include <sys/wait.h>
# include <fcntl.h>
# include <stdlib.h>
# include <limits.h>
# include <stdio.h>
# include <errno.h>
# include <string.h>
# include <unistd.h>
# include <iostream>
# include <vector>
# include <string>
# include <fstream>
# include <sstream>
# include <algorithm>
# include <log4cxx/logger.h>
# include <log4cxx/ndc.h>
# include <boost/tokenizer.hpp>
# include <boost/filesystem/operations.hpp>
# include <boost/system/error_code.hpp>

# include "grntest/errdb.h"
# include "grntest/Exceptions.h"
# include "grntest/helper.h"
# include "grntest/global.h"

# define LOGGER_TAG_HELPER  "[HELPER]"

using namespace std;
using namespace log4cxx;
using namespace grntestharness::Exceptions;
namespace bfs = boost :: filesystem;

namespace grntestharness
{

int shellSplit (const string &line, vector<string> &words)
{
	enum { OUTSIDE, UNQUOTED, SINGLE_QUOTED, DOUBLE_QUOTED } state = OUTSIDE;
	string word;

	for (string::size_type i = 0; i < line.length (); ++i)
	{
		char c = line[i];
		switch (state)
		{
			case OUTSIDE :
			case UNQUOTED :
				if (isspace (static_cast<unsigned char>(c)))
				{
					if (state == UNQUOTED)
					{
						words.push_back (word);
						word.clear ();
						state = OUTSIDE;
					}
				}
				else if (c == '\'')
					state = SINGLE_QUOTED;
				else if (c == '"')
					state = DOUBLE_QUOTED;
				else if (c == '\\')
				{
					state = UNQUOTED;
					if (i + 1 < line.length ())
					{
						++i;
						/* backslash-newline is a line continuation */
						if (line[i] != '\n')
							word += line[i];
					}
				}
				else
				{
					word += c;
					state = UNQUOTED;
				}
				break;

			case SINGLE_QUOTED :
				if (c == '\'')
					state = UNQUOTED;
				else
					word += c;
				break;

			case DOUBLE_QUOTED :
				if (c == '"')
					state = UNQUOTED;
				else if (c == '\\' && i + 1 < line.length () && strchr ("$`\"\\\n", line[i + 1]))
				{
					++i;
					if (line[i] != '\n')
						word += line[i];
				}
				else
					word += c;
				break;
		}
	}

	if (state == SINGLE_QUOTED || state == DOUBLE_QUOTED)
		throw ExecutorError (FILE_LINE_FUNCTION, ERR_EXECUTOR_UNTERMINATED_QUOTE);

	if (state == UNQUOTED)
		words.push_back (word);

	return words.size ();
}

int remove_duplicates (vector <string> &strcollection)
{
	if (strcollection.empty ())
		return 0;

	/* first sort all ids */
	sort (strcollection.begin (), strcollection.end ());

	/* remove duplicates */
	vector <string> :: iterator it = unique (strcollection.begin (), strcollection.end ());
	strcollection.resize (it - strcollection.begin());

	return strcollection.size ();
}

/* a directory contributes all non-empty .test files found under it,
 * a file is taken as it is */
int collectTestCases (const vector <string> &targets, vector <string> &tclist)
{
	LogString saved_context;
	LOGGER_PUSH_NDCTAG (LOGGER_TAG_HELPER);
	log4cxx :: LoggerPtr logger = log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME);

	for (vector<string>::const_iterator target = targets.begin (); target != targets.end (); ++target)
	{
		if (!bfs::exists (*target))
		{
			LOG4CXX_WARN (logger, "File or Directory [" << *target << "] does not exist. Hence ignoring it.");
			continue;
		}

		if (!bfs::is_directory (*target))
		{
			tclist.push_back (*target);
			continue;
		}

		bfs::recursive_directory_iterator end_iter;
		for (bfs::recursive_directory_iterator dir_iter (*target); dir_iter != end_iter; ++dir_iter)
		{
			bfs::path p (dir_iter->path ());

			/* it should be a regular file with ".test" as an extension */
			if (!bfs :: is_regular_file (p) || p.extension () != DEFAULT_TESTCASE_FILE_EXTENSION)
				continue;

			if (bfs::is_empty (p))
			{
				LOG4CXX_WARN (logger, "File [" << p.string () << "] is an empty file. Hence ignoring it.");
				continue;
			}
			tclist.push_back (p.string ());
		}
	}

	int n = remove_duplicates (tclist);
	LOG4CXX_INFO (logger, "Collected " << n << " test case(s).");

	LOGGER_POP_NDCTAG;
	return n;
}

bool commandExists (const string &command)
{
	if (command.empty ())
		return false;

	if (command.find ('/') != string::npos)
		return access (command.c_str (), X_OK) == 0;

	const char *path_env = getenv ("PATH");
	if (!path_env)
		return false;

	string path_list = path_env;
	boost::char_separator<char> sep (":");
	boost::tokenizer< boost::char_separator<char> > tokens (path_list, sep);
	for (boost::tokenizer< boost::char_separator<char> >::iterator dir = tokens.begin (); dir != tokens.end (); ++dir)
	{
		string candidate = *dir + "/" + command;
		if (access (candidate.c_str (), X_OK) == 0)
			return true;
	}
	return false;
}

long int sToi (const string str)
{
	char *endptr;
	long int val;

    errno = 0;    /* To distinguish success/failure after call */
    val = strtol (str.c_str (), &endptr, 10);

    /* Check for various possible errors */
    if ((errno == ERANGE && (val == LONG_MAX || val == LONG_MIN)) ||
        (errno != 0 && val == 0) ||
    	(endptr == str)          ||
		(*endptr != '\0'))
    {
        return -1;
    }

    return val;
}

string errnoMessage (int errnum)
{
	return boost::system::error_code (errnum, boost::system::system_category ()).message ();
}

string iTos (long long int i)
{
    string str;
    stringstream ss(stringstream::in | stringstream::out);
    ss << i;
    ss >> str;

	return str;
}

int readBinaryFile (const string &path, string &content)
{
	ifstream f (path.c_str (), ios::in | ios::binary);
	if (!f.is_open ())
		return FAILURE;

	stringstream ss;
	ss << f.rdbuf ();
	content = ss.str ();
	return SUCCESS;
}

void writeBinaryFile (const string &path, const string &content)
{
	ofstream f (path.c_str (), ios::out | ios::binary | ios::trunc);
	if (!f.is_open ())
		throw SystemError (FILE_LINE_FUNCTION, "Could not open file [" + path + "] for writing");

	f.write (content.data (), content.length ());
	if (!f)
		throw SystemError (FILE_LINE_FUNCTION, "Could not write to file [" + path + "]");
}

string createTemporaryFile (const string &tmpdir, const string &prefix, const string &content)
{
	string name_template = tmpdir + "/" + prefix + "XXXXXX";
	vector<char> name (name_template.begin (), name_template.end ());
	name.push_back ('\0');

	int fd = mkstemp (&name[0]);
	if (fd == -1)
	{
		throw SystemError (FILE_LINE_FUNCTION, errnoMessage (errno) + " [" + name_template + "]");
	}
	close (fd);

	string path (&name[0]);
	writeBinaryFile (path, content);
	return path;
}

int runCommand (const vector<string> &argv)
{
	LogString saved_context;
	LOGGER_PUSH_NDCTAG (LOGGER_TAG_HELPER);
	log4cxx :: LoggerPtr logger = log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME);

	if (argv.empty ())
	{
		LOGGER_POP_NDCTAG;
		throw SystemError (FILE_LINE_FUNCTION, ERR_SYSTEM_EMPTY_SERVER_COMMAND);
	}

	vector<char *> args;
	for (vector<string>::const_iterator it = argv.begin (); it != argv.end (); ++it)
		args.push_back (const_cast<char *>(it->c_str ()));
	args.push_back (0);

	LOG4CXX_DEBUG (logger, "Executing the command : " << argv[0]);

	/* the child shares our stdout */
	cout.flush ();
	fflush (stdout);

	pid_t pid = fork ();
	if (pid == -1)
	{
		string reason = errnoMessage (errno);
		LOGGER_POP_NDCTAG;
		throw SystemError (FILE_LINE_FUNCTION, reason);
	}

	if (pid == 0)
	{
		execvp (args[0], &args[0]);
		_exit (127);
	}

	int status;
	while (waitpid (pid, &status, 0) == -1)
	{
		if (errno != EINTR)
		{
			string reason = errnoMessage (errno);
			LOGGER_POP_NDCTAG;
			throw SystemError (FILE_LINE_FUNCTION, reason);
		}
	}

	int exit_code = FAILURE;
	if (WIFEXITED (status))
	{
		exit_code = WEXITSTATUS (status);
		LOG4CXX_DEBUG (logger, "Command exited with code " << exit_code << ".");
	}
	else
		LOG4CXX_INFO (logger, "Command could not exit normally.");

	LOGGER_POP_NDCTAG;
	return exit_code;
}

string relatedFilePath (const string &tcfile, const string &extension)
{
	bfs::path p (tcfile);
	if (!p.has_extension () || p.extension () == ".")
		return "";

	return p.replace_extension (extension).string ();
}

ScopedTemporaryDirectory :: ScopedTemporaryDirectory (const string &path) : _path(path)
{
	try
	{
		bfs::remove_all (_path);
		bfs::create_directories (_path);
	}
	catch (bfs::filesystem_error &e)
	{
		throw SystemError (FILE_LINE_FUNCTION, e.what ());
	}
}

ScopedTemporaryDirectory :: ~ScopedTemporaryDirectory ()
{
	boost::system::error_code ec;
	bfs::remove_all (_path, ec);
	if (ec)
	{
		log4cxx :: LoggerPtr logger = log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME);
		LOG4CXX_WARN (logger, "Could not remove directory [" << _path << "] : " << ec.message ());
	}
}

} //END namespace grntestharness
