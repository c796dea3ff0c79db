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
 * @file serverprocess.h
 * @brief child process whose stdin and stdout are connected to the harness
 */

# ifndef GRNTEST_SERVERPROCESS_H
# define GRNTEST_SERVERPROCESS_H

# include <sys/types.h>
# include <string>
# include <vector>
# include <boost/scoped_ptr.hpp>

# include "grntest/outputchannel.h"

namespace grntestharness
{

class ServerProcess
{
	public :
		/* starts argv[0] with the given arguments, throws SystemError when it cannot be run */
		explicit ServerProcess (const std::vector<std::string> &argv);
		~ServerProcess ();

		OutputChannel &getChannel (void) { return *_channel; }
		pid_t pid (void) const { return _pid; }

		/**
		 * closes the server's stdin and reaps it, killing it when it does
		 * not exit in time
		 * @return exit status of the server or FAILURE
		 */
		int close (void);

	private :
		ServerProcess (const ServerProcess &);
		ServerProcess &operator= (const ServerProcess &);

		pid_t _pid;
		int   _toServer;
		int   _fromServer;
		boost::scoped_ptr<FdChannel> _channel;
};

} //END namespace grntestharness
# endif
