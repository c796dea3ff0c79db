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
 * @file outputchannel.h
 * @brief byte stream to and from the server process
 */

# ifndef GRNTEST_OUTPUTCHANNEL_H
# define GRNTEST_OUTPUTCHANNEL_H

# include <string>

# include "grntest/global.h"

namespace grntestharness
{

class OutputChannel
{
	public :
		/* sends the bytes to the peer without buffering */
		virtual void write (const std::string &data) = 0;

		/**
		 * waits up to 'firstTimeoutMsec' for the first bytes of a response,
		 * then keeps reading whatever is already available without waiting.
		 * @return everything read, empty when nothing arrived in time
		 */
		virtual std::string drain (int firstTimeoutMsec = DEFAULT_FIRST_TIMEOUT_MSEC) = 0;

		virtual ~OutputChannel () {}
};

/**
 * channel over a pair of file descriptors.
 * The descriptors stay owned by the caller.
 */
class FdChannel : public OutputChannel
{
	public :
		FdChannel (int readFd, int writeFd) : _readFd(readFd), _writeFd(writeFd) {}

		void write (const std::string &data);
		std::string drain (int firstTimeoutMsec = DEFAULT_FIRST_TIMEOUT_MSEC);

	private :
		/* @return true when the descriptor became readable or hung up within the timeout */
		bool waitReadable (int timeoutMsec);

		int _readFd;
		int _writeFd;
};

} //END namespace grntestharness
# endif
