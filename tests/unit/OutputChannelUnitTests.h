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

#ifndef OUTPUT_CHANNEL_UNIT_TESTS
#define OUTPUT_CHANNEL_UNIT_TESTS

/****************************************************************************/

#include <unistd.h>
#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "grntest/Exceptions.h"
#include "grntest/outputchannel.h"
#include "grntest/serverprocess.h"

/****************************************************************************/
#define test CPPUNIT_ASSERT
/****************************************************************************/

using namespace grntestharness;

class OutputChannelTests : public CppUnit::TestFixture
{
 private:
            int               _fds[2];

            void              closeWriteEnd();
    static  long              elapsedMsec(const boost::posix_time::ptime&);

 public:
            void              setUp();
            void              tearDown();

            void              drainConcatenates();
            void              drainTimesOut();
            void              drainStopsAtEndOfStream();
            void              largeResponse();
            void              closedChannel();
            void              serverRoundTrip();
            void              serverCannotStart();

 public:
    CPPUNIT_TEST_SUITE(OutputChannelTests);
    CPPUNIT_TEST(drainConcatenates);
    CPPUNIT_TEST(drainTimesOut);
    CPPUNIT_TEST(drainStopsAtEndOfStream);
    CPPUNIT_TEST(largeResponse);
    CPPUNIT_TEST(closedChannel);
    CPPUNIT_TEST(serverRoundTrip);
    CPPUNIT_TEST(serverCannotStart);
    CPPUNIT_TEST_SUITE_END();
};

void OutputChannelTests::setUp()
{
    CPPUNIT_ASSERT(pipe(_fds) == 0);
}

void OutputChannelTests::tearDown()
{
    ::close(_fds[0]);
    closeWriteEnd();
}

void OutputChannelTests::closeWriteEnd()
{
    if (_fds[1] != -1)
    {
        ::close(_fds[1]);
        _fds[1] = -1;
    }
}

long OutputChannelTests::elapsedMsec(const boost::posix_time::ptime& start)
{
    return (boost::posix_time::microsec_clock::local_time() - start).total_milliseconds();
}

/**
 *  A channel reading its own writes: whatever is pending is returned as one
 *  string.
 */
void OutputChannelTests::drainConcatenates()
{
    FdChannel c(_fds[0],_fds[1]);
    c.write("[[0,1.0,2.0],");
    c.write("true]");
    test(c.drain(100) == "[[0,1.0,2.0],true]");
}

void OutputChannelTests::drainTimesOut()
{
    FdChannel c(_fds[0],_fds[1]);

    boost::posix_time::ptime start = boost::posix_time::microsec_clock::local_time();
    test(c.drain(200) == "");
    test(elapsedMsec(start) >= 150);
}

void OutputChannelTests::drainStopsAtEndOfStream()
{
    FdChannel c(_fds[0],-1);
    test(::write(_fds[1],"bye",3) == 3);
    closeWriteEnd();

    boost::posix_time::ptime start = boost::posix_time::microsec_clock::local_time();
    test(c.drain(5000) == "bye");
    test(c.drain(5000) == "");
    test(elapsedMsec(start) < 2500);
}

void OutputChannelTests::largeResponse()
{
    /* has to fit in the pipe buffer since nobody reads while writing */
    std::string big(60000,'x');
    FdChannel c(_fds[0],_fds[1]);
    c.write(big);
    test(c.drain(100) == big);
}

void OutputChannelTests::closedChannel()
{
    FdChannel c(-1,-1);
    CPPUNIT_ASSERT_THROW(c.write("status\n"),Exceptions::SystemError);
    CPPUNIT_ASSERT_THROW(c.drain(10),Exceptions::SystemError);
}

void OutputChannelTests::serverRoundTrip()
{
    std::vector<std::string> argv;
    argv.push_back("cat");

    ServerProcess s(argv);
    test(s.pid() > 0);

    s.getChannel().write("status\n");
    test(s.getChannel().drain(2000) == "status\n");

    s.getChannel().write("table_list\n");
    test(s.getChannel().drain(2000) == "table_list\n");

    test(s.close() == 0);
    test(s.pid() == -1);
    test(s.close() == FAILURE);                          // already closed
}

void OutputChannelTests::serverCannotStart()
{
    std::vector<std::string> argv;
    argv.push_back("grntest-no-such-server");
    argv.push_back("-n");
    argv.push_back("db");

    CPPUNIT_ASSERT_THROW(ServerProcess s(argv),Exceptions::SystemError);

    argv.clear();
    CPPUNIT_ASSERT_THROW(ServerProcess s(argv),Exceptions::SystemError);
}

/****************************************************************************/
#undef test
/****************************************************************************/

CPPUNIT_TEST_SUITE_REGISTRATION(OutputChannelTests);

/****************************************************************************/
#endif
/****************************************************************************/
