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

#ifndef RUNNER_UNIT_TESTS
#define RUNNER_UNIT_TESTS

/****************************************************************************/

#include <stdlib.h>
#include <sstream>
#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>
#include <boost/filesystem/operations.hpp>

#include "grntest/global.h"
#include "grntest/reporter.h"
#include "grntest/runner.h"
#include "ScratchDirectory.h"

/****************************************************************************/
#define test CPPUNIT_ASSERT
/****************************************************************************/

using namespace grntestharness;

/**
 *  Runs scripts against a shell script that answers every line with a
 *  successful json response, the way groonga would.
 */
class RunnerTests : public CppUnit::TestFixture
{
 private:
            ScratchDirectory*         _dir;
            HarnessCommandLineOptions _options;
            std::ostringstream        _console;

            Result            run(const std::string& tcfile);

 public:
            void              setUp();
            void              tearDown();

            void              notChecked();
            void              pass();
            void              fail();
            void              omitted();
            void              missingScript();
            void              serverCannotStart();
            void              noExtension();
            void              summary();
            void              xmlReport();
            void              diffCannotRun();
            void              diffFilesRemoved();

 public:
    CPPUNIT_TEST_SUITE(RunnerTests);
    CPPUNIT_TEST(notChecked);
    CPPUNIT_TEST(pass);
    CPPUNIT_TEST(fail);
    CPPUNIT_TEST(omitted);
    CPPUNIT_TEST(missingScript);
    CPPUNIT_TEST(serverCannotStart);
    CPPUNIT_TEST(noExtension);
    CPPUNIT_TEST(summary);
    CPPUNIT_TEST(xmlReport);
    CPPUNIT_TEST(diffCannotRun);
    CPPUNIT_TEST(diffFilesRemoved);
    CPPUNIT_TEST_SUITE_END();
};

void RunnerTests::setUp()
{
    _dir = new ScratchDirectory();

    std::string server = _dir->write("fake-groonga",
                                     "#!/bin/sh\n"
                                     "while read line; do\n"
                                     "  echo '[[0,1337566253.89858,0.000355720520019531],true]'\n"
                                     "done\n");
    boost::filesystem::permissions(server,boost::filesystem::owner_all);

    _options.groonga            = server;
    _options.baseDirectory      = _dir->path();
    _options.temporaryDirectory = _dir->path("tmp");
    _options.diff               = "true";
    _options.firstTimeout       = 2000;
    _options.parallelTestCases  = 1;
    _options.debugLevel         = DEFAULT_DEBUGLEVEL;

    setenv("COLUMNS","40",1);
}

void RunnerTests::tearDown()
{
    unsetenv("COLUMNS");
    delete _dir;
}

Result RunnerTests::run(const std::string& tcfile)
{
    REPORTER r(_options,_console);
    Runner runner(_options,tcfile,3);
    return runner.run(r);
}

void RunnerTests::notChecked()
{
    std::string t = _dir->write("status.test","status\n");

    test(run(t) == RESULT_NOT_CHECKED);
    test(_dir->read("status.actual") == "status\n[[0,0.0,0.0],true]\n");
    test(!_dir->exists("status.reject"));
    test(!_dir->exists("tmp/3"));                        // scratch directory removed
    test(_console.str().find("[not checked]") != std::string::npos);
    test(_console.str().find("[[0,0.0,0.0],true]\n") != std::string::npos);
}

void RunnerTests::pass()
{
    std::string t = _dir->write("status.test","status\n");
    _dir->write("status.expected","status\n[[0,0.0,0.0],true]\n");
    _dir->write("status.reject","left over from an earlier run\n");

    test(run(t) == RESULT_PASS);
    test(!_dir->exists("status.reject"));
    test(!_dir->exists("status.actual"));
    test(_console.str() == "  status.test" + std::string(40 - 13 - 7,' ') + " [pass]\n");
}

void RunnerTests::fail()
{
    std::string t = _dir->write("status.test","status\n");
    _dir->write("status.expected","status\n[[0,0.0,0.0],false]\n");

    test(run(t) == RESULT_FAIL);
    test(_dir->read("status.reject") == "status\n[[0,0.0,0.0],true]\n");
    test(_dir->read("status.expected") == "status\n[[0,0.0,0.0],false]\n");
    test(_console.str().find("[fail]") != std::string::npos);
    test(_console.str().find(std::string(40,'=')) != std::string::npos);
}

void RunnerTests::omitted()
{
    std::string t = _dir->write("omit.test","status\n# omit\nstatus\n");

    test(run(t) == RESULT_OMITTED);
    test(!_dir->exists("omit.actual"));
    test(!_dir->exists("omit.reject"));
    test(_console.str().find("[omitted]") != std::string::npos);
}

void RunnerTests::missingScript()
{
    test(run(_dir->path("missing.test")) == RESULT_FAIL);
    test(!_dir->exists("missing.actual"));
    test(_console.str().find("[fail]") != std::string::npos);
    test(_console.str().find("doesn't exist.") != std::string::npos);
}

void RunnerTests::serverCannotStart()
{
    std::string t = _dir->write("status.test","status\n");
    _options.groonga = _dir->path("no-such-groonga");

    test(run(t) == RESULT_FAIL);
    test(!_dir->exists("status.actual"));
    test(_console.str().find("Could not execute") != std::string::npos);
}

void RunnerTests::noExtension()
{
    std::string t = _dir->write("plain","status\n");

    test(run(t) == RESULT_NOT_CHECKED);
    test(!_dir->exists("plain.actual"));
    test(!_dir->exists("plain.reject"));
}

void RunnerTests::summary()
{
    std::string t = _dir->write("status.test","status\n");
    _dir->write("status.expected","status\n[[0,0.0,0.0],true]\n");
    std::string o = _dir->write("omit.test","# omit\n");
    std::string n = _dir->write("new.test","status\n");

    REPORTER r(_options,_console);
    r.start();
    Runner(_options,t).run(r);
    Runner(_options,o).run(r);
    Runner(_options,n).run(r);
    r.finish();

    ExecutionStats es = r.getExecutionStats();
    test(es.testcasesTotal == 3);
    test(es.testcasesPassed == 1);
    test(es.testcasesFailed == 0);
    test(es.testcasesNotChecked == 1);
    test(es.testcasesOmitted == 1);

    std::string out = _console.str();
    test(out.find("\n3 tests, 1 passes, 0 failures.\n1 omissions.\n33.33% passed.\n") != std::string::npos);
}

void RunnerTests::xmlReport()
{
    std::string t = _dir->write("status.test","status\n");
    _dir->write("status.expected","status\n[[0,0.0,0.0],true]\n");
    _options.reportFilename = _dir->path("report.xml");

    {
        REPORTER r(_options,_console);
        r.start();
        Runner(_options,t).run(r);
        r.finish();
    }

    std::string xml = _dir->read("report.xml");
    test(xml.find("<GrnTestReport>") != std::string::npos);
    test(xml.find("<GrnTestEnv>") != std::string::npos);
    test(xml.find("<TestcaseFile>" + t + "</TestcaseFile>") != std::string::npos);
    test(xml.find("<TestcaseResult>PASS</TestcaseResult>") != std::string::npos);
    test(xml.find("<TotalTestCases>1</TotalTestCases>") != std::string::npos);
    test(xml.find("</GrnTestReport>") != std::string::npos);
}

/**
 *  A failing diff set-up still counts the test and prints the reason.
 */
void RunnerTests::diffCannotRun()
{
    const char* saved = getenv("TMPDIR");
    std::string tmpdir = saved ? saved : "";
    setenv("TMPDIR",_dir->path("no-such-directory").c_str(),1);

    TestcaseExecutionInfo info;
    info.tcfile = _dir->path("status.test");
    info.result = RESULT_FAIL;

    REPORTER r(_options,_console);
    r.failTest(info,"expected\n","actual\n");

    if (saved) setenv("TMPDIR",tmpdir.c_str(),1); else unsetenv("TMPDIR");

    ExecutionStats es = r.getExecutionStats();
    test(es.testcasesTotal == 1);
    test(es.testcasesFailed == 1);
    test(_console.str().find("[fail]") != std::string::npos);
}

void RunnerTests::diffFilesRemoved()
{
    const char* saved = getenv("TMPDIR");
    std::string tmpdir = saved ? saved : "";
    boost::filesystem::create_directories(_dir->path("difftmp"));
    setenv("TMPDIR",_dir->path("difftmp").c_str(),1);

    TestcaseExecutionInfo info;
    info.tcfile = _dir->path("status.test");
    info.result = RESULT_FAIL;

    REPORTER r(_options,_console);
    r.failTest(info,"expected\n","actual\n");

    if (saved) setenv("TMPDIR",tmpdir.c_str(),1); else unsetenv("TMPDIR");

    test(r.getExecutionStats().testcasesFailed == 1);
    test(boost::filesystem::is_empty(_dir->path("difftmp")));
}

/****************************************************************************/
#undef test
/****************************************************************************/

CPPUNIT_TEST_SUITE_REGISTRATION(RunnerTests);

/****************************************************************************/
#endif
/****************************************************************************/
