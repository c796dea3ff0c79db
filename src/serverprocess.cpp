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
 * @file serverprocess.cpp
 */

# include <sys/types.h>
# include <sys/wait.h>
# include <fcntl.h>
# include <unistd.h>
# include <signal.h>
# include <errno.h>
# include <string>
# include <vector>
# include <log4cxx/logger.h>
# include <log4cxx/ndc.h>

# include "grntest/global.h"
# include "grntest/errdb.h"
# include "grntest/Exceptions.h"
# include "grntest/helper.h"
# include "grntest/serverprocess.h"

# define WAIT_INTERVAL_USEC  10000

using namespace std;
using namespace log4cxx;
using namespace grntestharness::Exceptions;

namespace grntestharness
{

namespace
{
void closeFd (int &fd)
{
	if (fd >= 0)
	{
		::close (fd);
		fd = -1;
	}
}

void closePipe (int fds[2])
{
	closeFd (fds[0]);
	closeFd (fds[1]);
}
}

ServerProcess :: ServerProcess (const vector<string> &argv) : _pid(-1), _toServer(-1), _fromServer(-1)
{
	log4cxx :: LoggerPtr logger = log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME);

	if (argv.empty ())
		throw SystemError (FILE_LINE_FUNCTION, ERR_SYSTEM_EMPTY_SERVER_COMMAND);

	vector<char *> args;
	for (vector<string>::const_iterator it = argv.begin (); it != argv.end (); ++it)
		args.push_back (const_cast<char *>(it->c_str ()));
	args.push_back (0);

	int in[2] = {-1, -1};
	int out[2] = {-1, -1};
	int status_pipe[2] = {-1, -1};

	if (pipe2 (in, O_CLOEXEC) == -1 || pipe2 (out, O_CLOEXEC) == -1 || pipe2 (status_pipe, O_CLOEXEC) == -1)
	{
		string reason = errnoMessage (errno);
		closePipe (in);
		closePipe (out);
		closePipe (status_pipe);
		throw SystemError (FILE_LINE_FUNCTION, "pipe() failed : " + reason);
	}

	pid_t pid = fork ();
	if (pid == -1)
	{
		string reason = errnoMessage (errno);
		closePipe (in);
		closePipe (out);
		closePipe (status_pipe);
		throw SystemError (FILE_LINE_FUNCTION, "fork() failed : " + reason);
	}

	if (pid == 0)
	{
		dup2 (in[0], STDIN_FILENO);
		dup2 (out[1], STDOUT_FILENO);
		signal (SIGPIPE, SIG_DFL);
		execvp (args[0], &args[0]);

		/* tell the parent why exec failed */
		int err = errno;
		ssize_t unused = ::write (status_pipe[1], &err, sizeof (err));
		(void) unused;
		_exit (127);
	}

	closeFd (in[0]);
	closeFd (out[1]);
	closeFd (status_pipe[1]);

	/* the status pipe is closed by a successful exec, or carries errno */
	int err = 0;
	ssize_t n;
	while ((n = ::read (status_pipe[0], &err, sizeof (err))) == -1 && errno == EINTR)
		;
	closeFd (status_pipe[0]);

	if (n > 0)
	{
		closeFd (in[1]);
		closeFd (out[0]);
		waitpid (pid, 0, 0);
		throw SystemError (FILE_LINE_FUNCTION, "Could not execute [" + argv[0] + "] : " + errnoMessage (err));
	}

	_pid = pid;
	_toServer = in[1];
	_fromServer = out[0];
	_channel.reset (new FdChannel (_fromServer, _toServer));

	LOG4CXX_DEBUG (logger, "Started server [" << argv[0] << "] with pid " << _pid << ".");
}

ServerProcess :: ~ServerProcess ()
{
	close ();
}

int ServerProcess :: close (void)
{
	if (_pid == -1)
		return FAILURE;

	log4cxx :: LoggerPtr logger = log4cxx :: Logger :: getLogger (HARNESS_LOGGER_NAME);

	_channel.reset ();

	/* the server exits once its input is closed */
	closeFd (_toServer);

	int status = 0;
	pid_t rv = 0;
	for (int waited = 0; waited < SERVER_SHUTDOWN_TIMEOUT_MSEC * 1000; waited += WAIT_INTERVAL_USEC)
	{
		rv = waitpid (_pid, &status, WNOHANG);
		if (rv != 0 && !(rv == -1 && errno == EINTR))
			break;
		usleep (WAIT_INTERVAL_USEC);
	}

	if (rv == 0)
	{
		LOG4CXX_WARN (logger, "Server with pid " << _pid << " did not exit in time. Killing it.");
		kill (_pid, SIGKILL);
		while ((rv = waitpid (_pid, &status, 0)) == -1 && errno == EINTR)
			;
	}

	closeFd (_fromServer);
	_pid = -1;

	if (rv == -1)
		return FAILURE;

	if (WIFEXITED (status))
	{
		LOG4CXX_DEBUG (logger, "Server exited with code " << WEXITSTATUS (status) << ".");
		return WEXITSTATUS (status);
	}

	return FAILURE;
}

} //END namespace grntestharness
