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
 * @file executioncontext.h
 * @brief state shared by a top level script and every script it includes
 */

# ifndef GRNTEST_EXECUTIONCONTEXT_H
# define GRNTEST_EXECUTIONCONTEXT_H

# include <string>

# include "grntest/global.h"
# include "grntest/resultlog.h"

namespace grntestharness
{

enum OnErrorPolicy
{
	ON_ERROR_DEFAULT,
	ON_ERROR_OMIT
};

/**
 * cancellation token of one top level run. Interpreters check it after
 * every line and return early once it is triggered.
 */
class AbortToken
{
	public :
		AbortToken () : _triggered(false) {}
		void trigger (void) { _triggered = true; }
		bool triggered (void) const { return _triggered; }

	private :
		bool _triggered;
};

class ExecutionContext
{
	public :
		ExecutionContext ();

		/* records an input/output entry, skipped while logging is disabled or content is empty */
		void log (EntryTag tag, const std::string &content, const OutputOptions &options = OutputOptions ());

		/* records an error entry whatever the logging flag says */
		void logError (const std::string &content);

		bool isTopLevel (void) const { return _nNested == 1; }
		int nestingDepth (void) const { return _nNested; }

		/* consults the on-error policy */
		void error (void);
		void omit (void);
		void abort (void);
		bool isAborted (void) const { return _abortToken && _abortToken->triggered (); }
		bool hasAbortToken (void) const { return _abortToken != 0; }

		bool isLogging (void) const { return _logging; }
		void setLogging (bool logging) { _logging = logging; }

		bool isOmitted (void) const { return _omitted; }

		OnErrorPolicy onError (void) const { return _onError; }
		void setOnError (OnErrorPolicy policy) { _onError = policy; }

		const std::string &baseDirectory (void) const { return _baseDirectory; }
		void setBaseDirectory (const std::string &dir) { _baseDirectory = dir; }

		const std::string &temporaryDirectory (void) const { return _temporaryDirectory; }
		void setTemporaryDirectory (const std::string &dir) { _temporaryDirectory = dir; }

		const std::string &dbPath (void) const { return _dbPath; }
		void setDbPath (const std::string &path) { _dbPath = path; }

		int firstTimeout (void) const { return _firstTimeout; }
		void setFirstTimeout (int msec) { _firstTimeout = msec; }

		ResultLog &result (void) { return _result; }
		const ResultLog &result (void) const { return _result; }

	private :
		friend class NestingScope;
		friend class AbortScope;

		bool           _logging;
		std::string    _baseDirectory;
		std::string    _temporaryDirectory;
		std::string    _dbPath;
		int            _firstTimeout;
		int            _nNested;
		ResultLog      _result;
		OnErrorPolicy  _onError;
		bool           _omitted;
		AbortToken    *_abortToken;
};

/* keeps the nesting depth of a context raised for its lifetime */
class NestingScope
{
	public :
		explicit NestingScope (ExecutionContext &context) : _context(context) { _context._nNested++; }
		~NestingScope () { _context._nNested--; }

	private :
		NestingScope (const NestingScope &);
		NestingScope &operator= (const NestingScope &);

		ExecutionContext &_context;
};

/**
 * establishes the abort token of a run when 'establish' is true, and
 * withdraws it on destruction. Does nothing otherwise.
 */
class AbortScope
{
	public :
		AbortScope (ExecutionContext &context, bool establish);
		~AbortScope ();

	private :
		AbortScope (const AbortScope &);
		AbortScope &operator= (const AbortScope &);

		ExecutionContext &_context;
		AbortToken        _token;
		bool              _established;
};

} //END namespace grntestharness
# endif
