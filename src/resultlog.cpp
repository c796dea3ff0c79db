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
 * @file resultlog.cpp
 */

# include <string>
# include "grntest/global.h"
# include "grntest/resultlog.h"

using namespace std;

namespace grntestharness
{

OutputFormat toOutputFormat (const string &name)
{
	if (name == OUTPUT_FORMAT_JSON)
		return FORMAT_JSON;
	if (name == OUTPUT_FORMAT_GROONGA_COMMAND)
		return FORMAT_GROONGA_COMMAND;
	return FORMAT_OTHER;
}

size_t ResultLog :: count (EntryTag tag) const
{
	size_t n = 0;
	for (const_iterator it = _entries.begin (); it != _entries.end (); ++it)
	{
		if (it->tag == tag)
			n++;
	}
	return n;
}

} //END namespace grntestharness
