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
 * @file interface.h
 * @brief file containing pure interfaces (i.e. abstract base classes)
 */

# ifndef GRNTEST_INTERFACE_H
# define GRNTEST_INTERFACE_H

# include "grntest/global.h"

namespace interface
{
/**
 * Interface for general applications
 */
class Application
{
	public :
		Application (void)
		{ }

		virtual ~Application (void)
		{ }

		/* parseCommandLine() returns EXIT when there is nothing left to do (--help, --version) */
		int run (int argc, char **argv)
		{
			int rv = parseCommandLine (argc, argv);
			if (rv == EXIT)
				return SUCCESS;

			if (rv == FAILURE || execute () == FAILURE)
				return FAILURE;

			return SUCCESS;
		}

	private :
		virtual int parseCommandLine (int argc, char **argv) = 0;
		virtual int execute (void) = 0;
};
} //END namespace interface

# endif
