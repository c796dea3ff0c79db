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
 * @file xmlarchive.h
 * @brief file containing a concrete class which writes a report in the XML format to the report file.
 */

# ifndef GRNTEST_XMLARCHIVE_H
# define GRNTEST_XMLARCHIVE_H

# include <string>
# include <ostream>
# include <boost/archive/xml_oarchive.hpp>

# include "grntest/global.h"

# define XML_OPEN_ANGLE1  "<"
# define XML_OPEN_ANGLE2  "</"
# define XML_CLOSE_ANGLE  ">\n"
# define XML_MAKE_START_TAG(tagname) (std::string("") + XML_OPEN_ANGLE1 + tagname + XML_CLOSE_ANGLE)
# define XML_MAKE_END_TAG(tagname)   (std::string("") + XML_OPEN_ANGLE2 + tagname + XML_CLOSE_ANGLE)

# define XML_ROOT_TAG     "GrnTestReport"

namespace grntestharness
{

/**
 * This class writes a report in the XML format to the report file.
 * The document is
 *   GrnTestReport
 *     GrnTestEnv           options of the run
 *     TestResults          one IndividualTestResult per test file
 *     FinalStats           tallies
 */
class XMLArchive : public boost::archive::xml_oarchive
{
	public :
	XMLArchive (std::ostream &out) : boost::archive::xml_oarchive(out, boost::archive::no_header)
	{
		os << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\" ?>\n";
		os << "<!DOCTYPE boost_serialization>\n";
		os << "<boost_serialization signature=\"serialization::archive\" version=\"5\">\n";
		putStartTagNOIndent (XML_ROOT_TAG);
	}

	void save (const struct ExecutionStats &harness_es);
	void save (const struct TestcaseExecutionInfo &tei);
	void save (const struct HarnessCommandLineOptions &GrnTestEnv);

	/* closes the root element and the serialization envelope */
	void finish (void)
	{
		putEndTagNOIndent (XML_ROOT_TAG);
		putEndTagNOIndent ("boost_serialization");
		flush ();
	}

	void putEndTagNOIndent (const char *tagname)
	{
		os << XML_MAKE_END_TAG (tagname);
	}

	void putStartTagNOIndent (const char *tagname)
	{
		os << XML_MAKE_START_TAG (tagname);
	}

	void putEndTag (const char *tagname)
	{
		save_end (tagname);
	}

	void putStartTag (const char *tagname)
	{
		save_start (tagname);
	}

	void flush (void)
	{
		os.flush ();
	}

	~XMLArchive () {}
};
} //END namespace grntestharness

# endif
