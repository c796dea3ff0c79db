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
 * @file outputchannel.cpp
 */

# include <poll.h>
# include <unistd.h>
# include <errno.h>
# include <string>
# include <vector>
# include <log4cxx/logger.h>

# include "grntest/global.h"
# include "grntest/errdb.h"
# include "grntest/Exceptions.h"
# include "grntest/helper.h"
# include "grntest/outputchannel.h"

using namespace std;
using namespace grntestharness::Exceptions;

namespace grntestharness
{

void FdChannel :: write (const string &data)
{
	if (_writeFd < 0)
		throw SystemError (FILE_LINE_FUNCTION, ERR_SYSTEM_CHANNEL_CLOSED);

	const char *p = data.data ();
	size_t left = data.length ();
	while (left > 0)
	{
		ssize_t n = ::write (_writeFd, p, left);
		if (n == -1)
		{
			if (errno == EINTR)
				continue;
			throw SystemError (FILE_LINE_FUNCTION, "write() failed : " + errnoMessage (errno));
		}
		p += n;
		left -= n;
	}
}

bool FdChannel :: waitReadable (int timeoutMsec)
{
	struct pollfd pfd;
	pfd.fd = _readFd;
	pfd.events = POLLIN;
	pfd.revents = 0;

	int rv;
	while ((rv = poll (&pfd, 1, timeoutMsec)) == -1)
	{
		if (errno != EINTR)
			throw SystemError (FILE_LINE_FUNCTION, "poll() failed : " + errnoMessage (errno));
	}
	return rv > 0;
}

string FdChannel :: drain (int firstTimeoutMsec)
{
	if (_readFd < 0)
		throw SystemError (FILE_LINE_FUNCTION, ERR_SYSTEM_CHANNEL_CLOSED);

	log4cxx :: LoggerPtr logger = log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME);

	string output;
	vector<char> buf (READ_CHUNK_SIZE);
	int timeout = firstTimeoutMsec;

	while (waitReadable (timeout))
	{
		ssize_t n = ::read (_readFd, &buf[0], buf.size ());
		if (n == -1)
		{
			if (errno == EINTR)
				continue;
			throw SystemError (FILE_LINE_FUNCTION, "read() failed : " + errnoMessage (errno));
		}

		/* peer closed its end */
		if (n == 0)
		{
			LOG4CXX_DEBUG (logger, "End of stream reached while draining.");
			break;
		}

		output.append (&buf[0], n);
		timeout = 0;
	}

	LOG4CXX_TRACE (logger, "Drained " << output.length () << " byte(s).");
	return output;
}

} //END namespace grntestharness
