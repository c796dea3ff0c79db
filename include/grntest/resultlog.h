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
 * @file resultlog.h
 * @brief ordered record of what was sent to and received from the server
 */

# ifndef GRNTEST_RESULTLOG_H
# define GRNTEST_RESULTLOG_H

# include <string>
# include <vector>

namespace grntestharness
{

enum EntryTag
{
	ENTRY_INPUT,
	ENTRY_OUTPUT,
	ENTRY_ERROR
};

enum OutputFormat
{
	FORMAT_JSON,
	FORMAT_GROONGA_COMMAND,
	FORMAT_OTHER
};

OutputFormat toOutputFormat (const std::string &name);

/* metadata of an output entry */
struct OutputOptions
{
	OutputOptions () : format(FORMAT_JSON) {}

	std::string   command;
	std::string   formatName;
	OutputFormat  format;
};

struct ResultEntry
{
	ResultEntry (EntryTag t, const std::string &c, const OutputOptions &o = OutputOptions ()) :
		tag(t), content(c), options(o)
	{ }

	EntryTag       tag;
	std::string    content;
	OutputOptions  options;
};

class ResultLog
{
	public :
		typedef std::vector<ResultEntry>::const_iterator const_iterator;

		void append (const ResultEntry &entry) { _entries.push_back (entry); }
		void clear (void) { _entries.clear (); }

		size_t size (void) const { return _entries.size (); }
		bool empty (void) const { return _entries.empty (); }
		const_iterator begin (void) const { return _entries.begin (); }
		const_iterator end (void) const { return _entries.end (); }
		const ResultEntry &operator[] (size_t i) const { return _entries[i]; }

		/* number of entries carrying the given tag */
		size_t count (EntryTag tag) const;

	private :
		std::vector<ResultEntry> _entries;
};

} //END namespace grntestharness
# endif
