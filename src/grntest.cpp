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
 * @file grntest.cpp
 */

# include <cstdlib>
# include <csignal>
# include <iostream>
# include <exception>

# include "grntest/global.h"
# include "grntest/harness.h"
# include "grntest/interface.h"
# include "grntest/Exceptions.h"

using namespace std;
using namespace grntestharness;
namespace harnessexceptions = grntestharness::Exceptions;

int main (int argc, char** argv)
{
	/* a server that dies mid-script must not take the harness with it */
	signal (SIGPIPE, SIG_IGN);

	interface::Application *a = new grntestharness::GrnTestHarness ();
	int rv;

	try
	{
		if ((rv = a->run (argc, argv)) == FAILURE)
		{
			delete a;
			return EXIT_FAILURE;
		}
	}

	catch (harnessexceptions :: ERROR &e)
	{
		cerr << e.what () << endl;
		delete a;
		return EXIT_FAILURE;
	}

	catch (const std::exception& e)
	{
		cerr << e.what () << endl;
		delete a;
		return EXIT_FAILURE;
	}

	delete a;
	return EXIT_SUCCESS;
}
