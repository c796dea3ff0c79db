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
 * @file scriptinterpreter.cpp
 */

# include <string>
# include <vector>
# include <fstream>
# include <exception>
# include <log4cxx/logger.h>
# include <boost/filesystem/operations.hpp>
# include <boost/algorithm/string.hpp>
# include <boost/regex.hpp>

# include "grntest/global.h"
# include "grntest/errdb.h"
# include "grntest/Exceptions.h"
# include "grntest/helper.h"
# include "grntest/outputnormalizer.h"
# include "grntest/scriptinterpreter.h"

# define WHITESPACES           " \t\n\v\f\r"
# define CONTINUATION_MARKER   '\\'
# define LOAD_TERMINATOR       ']'
# define COMMAND_LOAD          "load"
# define COMMAND_DUMP          "dump"

using namespace std;
using namespace grntestharness::Exceptions;
namespace bfs = boost :: filesystem;
namespace harnessexceptions = grntestharness::Exceptions;

namespace grntestharness
{
namespace executors
{

namespace
{
/* position of 'marker' when it is the last character before an optional trailing newline */
bool endsWith (const string &line, char marker, string::size_type &pos)
{
	string::size_type len = line.length ();
	if (len > 0 && line[len - 1] == LINE_FEED)
		len--;

	if (len == 0 || line[len - 1] != marker)
		return false;

	pos = len - 1;
	return true;
}

string chomp (const string &line)
{
	string::size_type len = line.length ();
	if (len > 0 && line[len - 1] == '\n')
		len--;
	if (len > 0 && line[len - 1] == '\r')
		len--;
	return line.substr (0, len);
}

string resolveIncludePath (const string &baseDirectory, const string &path)
{
	bfs::path p (path);
	if (p.is_absolute () || baseDirectory.empty () || baseDirectory == ".")
		return path;

	return (bfs::path (baseDirectory) / p).string ();
}
}

ScriptInterpreter :: ScriptInterpreter (OutputChannel &channel, ExecutionContext &context) :
	_channel(channel),
	_context(context),
	_logger(log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME)),
	_loading(false)
{
}

ResultLog &ScriptInterpreter :: execute (const string &scriptPath)
{
	if (!bfs::exists (scriptPath))
		throw NotExist (FILE_LINE_FUNCTION, scriptPath);

	AbortScope abortScope (_context, _context.nestingDepth () == 0);
	NestingScope nestingScope (_context);

	LOG4CXX_INFO (_logger, "Executing script [" << scriptPath << "] at depth " << _context.nestingDepth ());

	ifstream script (scriptPath.c_str (), ios::in | ios::binary);
	if (!script.is_open ())
		throw SystemError (FILE_LINE_FUNCTION, "Could not open script [" + scriptPath + "]");

	string line;
	int lineno = 0;
	while (getline (script, line))
	{
		lineno++;
		if (!script.eof ())
			line += LINE_FEED;

		try
		{
			if (_loading)
				executeLineOnLoading (line);
			else
				executeLineWithContinuationLineSupport (line);
		}
		catch (harnessexceptions :: ERROR &e)
		{
			LOG4CXX_DEBUG (_logger, e.what ());
			logError (scriptPath + ":" + iTos (lineno) + ":" + chomp (line) + ": " + e.detail ());
			if (!_context.isTopLevel ())
				throw;
		}
		catch (std::exception &e)
		{
			logError (scriptPath + ":" + iTos (lineno) + ":" + chomp (line) + ": " + e.what ());
			if (!_context.isTopLevel ())
				throw;
		}

		if (_context.isAborted ())
		{
			LOG4CXX_INFO (_logger, "Run aborted at [" << scriptPath << ":" << lineno << "]");
			break;
		}
	}

	return _context.result ();
}

void ScriptInterpreter :: executeLineOnLoading (const string &line)
{
	logInput (line);
	_channel.write (line);

	string::size_type pos;
	if (endsWith (line, LOAD_TERMINATOR, pos))
	{
		string output = readOutput ();
		if (!output.empty ())
		{
			_loading = false;
			logOutput (output);
		}
	}
}

void ScriptInterpreter :: executeLineWithContinuationLineSupport (const string &line)
{
	string::size_type pos;
	if (endsWith (line, CONTINUATION_MARKER, pos))
	{
		_pendingCommand += line.substr (0, pos);
		return;
	}

	if (_pendingCommand.empty ())
		executeLine (line);
	else
	{
		_pendingCommand += line;
		string command;
		command.swap (_pendingCommand);
		executeLine (command);
	}
}

void ScriptInterpreter :: executeLine (const string &line)
{
	string::size_type first = line.find_first_not_of (WHITESPACES);

	/* blank line */
	if (first == string::npos)
		return;

	if (line[first] == '#')
		executeComment (line.substr (first + 1));
	else
		executeCommand (line);
}

void ScriptInterpreter :: executeComment (const string &content)
{
	static const boost::regex include_directive ("include\\s+(.*)");
	static const boost::regex on_error_directive ("on-error\\s+(.*)");

	string directive = boost::algorithm::trim_copy (content);
	boost::smatch what;

	if (directive == "disable-logging")
		_context.setLogging (false);
	else if (directive == "enable-logging")
		_context.setLogging (true);
	else if (directive == "omit")
		_context.omit ();
	else if (boost::regex_match (directive, what, include_directive))
	{
		string path = boost::algorithm::trim_copy (what[1].str ());
		if (path.empty ())
			return;
		executeScript (path);
	}
	else if (boost::regex_match (directive, what, on_error_directive))
	{
		string policy = boost::algorithm::trim_copy (what[1].str ());
		if (policy == "default")
			_context.setOnError (ON_ERROR_DEFAULT);
		else if (policy == "omit")
			_context.setOnError (ON_ERROR_OMIT);
		else
			throw ExecutorError (FILE_LINE_FUNCTION, ERR_EXECUTOR_INVALID_ON_ERROR_POLICY);
	}
}

void ScriptInterpreter :: executeScript (const string &path)
{
	ScriptInterpreter executor (_channel, _context);
	executor.execute (resolveIncludePath (_context.baseDirectory (), path));
}

void ScriptInterpreter :: executeCommand (const string &line)
{
	extractCommandInfo (line);
	if (_currentCommand == COMMAND_LOAD)
		_loading = true;

	LOG4CXX_DEBUG (_logger, "Sending command [" << _currentCommand << "] with output format [" << _outputFormat << "]");

	logInput (line);
	_channel.write (line);
	if (!_loading)
		logOutput (readOutput ());
}

void ScriptInterpreter :: extractCommandInfo (const string &line)
{
	static const boost::regex output_format_option ("--output_format(?:=(.+))?");

	vector<string> words;
	shellSplit (line, words);

	_currentCommand = words.empty () ? "" : words[0];
	if (_currentCommand == COMMAND_DUMP)
	{
		_outputFormat = OUTPUT_FORMAT_GROONGA_COMMAND;
		return;
	}

	_outputFormat = OUTPUT_FORMAT_JSON;
	for (vector<string>::size_type i = 1; i < words.size (); ++i)
	{
		boost::smatch what;
		if (boost::regex_match (words[i], what, output_format_option, boost::match_default | boost::match_not_dot_newline))
		{
			if (what[1].matched)
				_outputFormat = what[1].str ();
			else
				_outputFormat = i + 1 < words.size () ? words[i + 1] : "";
			break;
		}
	}
}

string ScriptInterpreter :: readOutput (void)
{
	return _channel.drain (_context.firstTimeout ());
}

void ScriptInterpreter :: logInput (const string &content)
{
	_context.log (ENTRY_INPUT, content);
}

void ScriptInterpreter :: logOutput (const string &content)
{
	OutputOptions options;
	options.command = _currentCommand;
	options.formatName = _outputFormat;
	options.format = toOutputFormat (_outputFormat);
	_context.log (ENTRY_OUTPUT, content, options);

	int returnCode;
	if (options.format == FORMAT_JSON &&
		OutputNormalizer :: extractReturnCode (content, returnCode) &&
		returnCode != 0)
	{
		LOG4CXX_DEBUG (_logger, "Command [" << _currentCommand << "] failed with return code " << returnCode);
		_context.error ();
	}
}

void ScriptInterpreter :: logError (const string &content)
{
	_context.logError (content);
}

} //END namespace executors
} //END namespace grntestharness
