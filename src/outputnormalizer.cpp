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
 * @file outputnormalizer.cpp
 */

# include <stdio.h>
# include <stdlib.h>
# include <cstddef>
# include <string>
# include <vector>
# include <utility>
# include <sstream>
# include <algorithm>
# include <json/json.h>
# include <log4cxx/logger.h>

# include "grntest/global.h"
# include "grntest/helper.h"
# include "grntest/outputnormalizer.h"

# define PRETTY_INDENT  "  "

using namespace std;

namespace grntestharness
{

namespace
{
bool parseResponse (const string &content, Json::Value &root)
{
	Json::Reader reader;
	if (!reader.parse (content, root, false))
		return false;

	return root.isArray () && root.size () > 0;
}

/* control characters, quote and backslash are escaped, other bytes are kept */
string quote (const string &s)
{
	string out = "\"";
	for (string::const_iterator it = s.begin (); it != s.end (); ++it)
	{
		unsigned char c = *it;
		switch (c)
		{
			case '"'  : out += "\\\""; break;
			case '\\' : out += "\\\\"; break;
			case '\b' : out += "\\b"; break;
			case '\f' : out += "\\f"; break;
			case '\n' : out += "\\n"; break;
			case '\r' : out += "\\r"; break;
			case '\t' : out += "\\t"; break;
			default :
				if (c < 0x20)
				{
					char buf[8];
					snprintf (buf, sizeof (buf), "\\u%04x", c);
					out += buf;
				}
				else
					out += c;
		}
	}
	return out + "\"";
}

bool earlierInSource (const pair<ptrdiff_t, string> &a, const pair<ptrdiff_t, string> &b)
{
	return a.first < b.first;
}

/* the reader records where every value starts, members follow that order */
Json::Value::Members membersInSourceOrder (const Json::Value &object)
{
	Json::Value::Members names = object.getMemberNames ();

	vector< pair<ptrdiff_t, string> > positioned;
	for (Json::Value::Members::const_iterator name = names.begin (); name != names.end (); ++name)
		positioned.push_back (make_pair (object[*name].getOffsetStart (), *name));
	stable_sort (positioned.begin (), positioned.end (), earlierInSource);

	Json::Value::Members ordered;
	for (vector< pair<ptrdiff_t, string> >::const_iterator it = positioned.begin (); it != positioned.end (); ++it)
		ordered.push_back (it->second);
	return ordered;
}
}

string OutputNormalizer :: normalizeResult (const ResultLog &result) const
{
	string normalized;
	for (ResultLog::const_iterator entry = result.begin (); entry != result.end (); ++entry)
	{
		switch (entry->tag)
		{
			case ENTRY_INPUT :
				normalized += entry->content;
				break;
			case ENTRY_OUTPUT :
				normalized += normalizeOutput (entry->content, entry->options.format);
				break;
			case ENTRY_ERROR :
				normalized += entry->content + LINE_FEED;
				break;
		}
	}
	return normalized;
}

string OutputNormalizer :: normalizeOutput (const string &content, OutputFormat format) const
{
	switch (format)
	{
		case FORMAT_JSON :
			{
				Json::Value root;
				if (!parseResponse (content, root))
				{
					log4cxx :: LoggerPtr logger = log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME);
					LOG4CXX_WARN (logger, "Response is not a json array. Keeping it as it is : " << content);
					break;
				}

				root[0u] = normalizeStatus (root[0u]);
				string output = generate (root);
				if (output.length () > _maxColumns)
					output = prettyGenerate (root);
				return output + LINE_FEED;
			}
		case FORMAT_GROONGA_COMMAND :
		case FORMAT_OTHER :
			break;
	}
	return content + LINE_FEED;
}

Json::Value OutputNormalizer :: normalizeStatus (const Json::Value &status)
{
	/* an already normalized status starts with an array and is kept */
	if (!status.isArray () || status.size () == 0 || !status[0u].isNumeric ())
		return status;

	Json::Value times (Json::arrayValue);
	times.append (Json::Value (0.0));
	times.append (Json::Value (0.0));

	Json::Value normalized (Json::arrayValue);
	if (status[0u].asDouble () == 0)
	{
		normalized.append (Json::Value (0));
		normalized.append (times[0u]);
		normalized.append (times[1u]);
		return normalized;
	}

	Json::Value code (Json::arrayValue);
	code.append (status[0u]);
	code.append (times[0u]);
	code.append (times[1u]);

	normalized.append (code);
	normalized.append (status.size () > 3 ? status[3u] : Json::Value ());
	return normalized;
}

string OutputNormalizer :: generate (const Json::Value &value)
{
	string out;
	write (value, false, "", out);
	return out;
}

string OutputNormalizer :: prettyGenerate (const Json::Value &value)
{
	string out;
	write (value, true, "", out);
	return out;
}

string OutputNormalizer :: formatDouble (double value)
{
	char buf[32];
	for (int precision = 15; precision <= 17; ++precision)
	{
		snprintf (buf, sizeof (buf), "%.*g", precision, value);
		if (strtod (buf, 0) == value)
			break;
	}

	/* keep it a float: "1" -> "1.0", "1e+20" -> "1.0e+20" */
	string text (buf);
	string::size_type e = text.find_first_of ("eE");
	if (text.substr (0, e).find_first_of (".ni") != string::npos)
		return text;

	text.insert (e == string::npos ? text.length () : e, ".0");
	return text;
}

void OutputNormalizer :: write (const Json::Value &value, bool pretty, const string &indent, string &out)
{
	string inner = indent + PRETTY_INDENT;

	switch (value.type ())
	{
		case Json::nullValue :
			out += "null";
			break;
		case Json::booleanValue :
			out += value.asBool () ? "true" : "false";
			break;
		case Json::intValue :
			out += iTos (value.asLargestInt ());
			break;
		case Json::uintValue :
			{
				ostringstream ss;
				ss << value.asLargestUInt ();
				out += ss.str ();
			}
			break;
		case Json::realValue :
			out += formatDouble (value.asDouble ());
			break;
		case Json::stringValue :
			out += quote (value.asString ());
			break;
		case Json::arrayValue :
			if (value.empty ())
			{
				out += "[]";
				break;
			}

			out += pretty ? "[\n" : "[";
			for (Json::ArrayIndex i = 0; i < value.size (); ++i)
			{
				if (i > 0)
					out += pretty ? ",\n" : ",";
				if (pretty)
					out += inner;
				write (value[i], pretty, inner, out);
			}
			out += pretty ? "\n" + indent + "]" : "]";
			break;
		case Json::objectValue :
			if (value.empty ())
			{
				out += "{}";
				break;
			}

			out += pretty ? "{\n" : "{";
			{
				Json::Value::Members keys = membersInSourceOrder (value);
				for (Json::Value::Members::const_iterator key = keys.begin (); key != keys.end (); ++key)
				{
					if (key != keys.begin ())
						out += pretty ? ",\n" : ",";
					if (pretty)
						out += inner;
					out += quote (*key) + (pretty ? ": " : ":");
					write (value[*key], pretty, inner, out);
				}
			}
			out += pretty ? "\n" + indent + "}" : "}";
			break;
	}
}

bool OutputNormalizer :: extractReturnCode (const string &content, int &returnCode)
{
	Json::Value root;
	if (!parseResponse (content, root))
		return false;

	const Json::Value &status = root[0u];
	if (!status.isArray () || status.size () == 0 || !status[0u].isInt ())
		return false;

	returnCode = status[0u].asInt ();
	return true;
}

} //END namespace grntestharness
