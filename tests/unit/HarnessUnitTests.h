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

#ifndef HARNESS_UNIT_TESTS
#define HARNESS_UNIT_TESTS

/****************************************************************************/

#include <vector>
#include <string>
#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include "grntest/global.h"
#include "grntest/Exceptions.h"
#include "grntest/harness.h"

/****************************************************************************/
#define test CPPUNIT_ASSERT
/****************************************************************************/

using namespace grntestharness;

/**
 *  Command line handling of the grntest executable.  Everything logs to
 *  the console so no log file is left behind.
 */
class HarnessTest : public CppUnit::TestFixture
{
 private:
    static  int               parse(GrnTestHarness&,const char* const* args,int n);

 public:
            void              defaults();
            void              versionAndHelp();
            void              diffCommand();
            void              timeout();
            void              invalidValues();
            void              unknownOption();

 public:
    CPPUNIT_TEST_SUITE(HarnessTest);
    CPPUNIT_TEST(defaults);
    CPPUNIT_TEST(versionAndHelp);
    CPPUNIT_TEST(diffCommand);
    CPPUNIT_TEST(timeout);
    CPPUNIT_TEST(invalidValues);
    CPPUNIT_TEST(unknownOption);
    CPPUNIT_TEST_SUITE_END();
};

int HarnessTest::parse(GrnTestHarness& h,const char* const* args,int n)
{
    bool destination = false, debug = false;
    for (int i = 0; i < n; ++i)
    {
        destination = destination || std::string(args[i]) == "--log-destination";
        debug       = debug       || std::string(args[i]) == "--debug";
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("grntest"));
    if (!destination)
    {
        argv.push_back(const_cast<char*>("--log-destination"));
        argv.push_back(const_cast<char*>("console"));
    }
    if (!debug)
    {
        argv.push_back(const_cast<char*>("--debug"));
        argv.push_back(const_cast<char*>("1"));
    }
    for (int i = 0; i < n; ++i)
        argv.push_back(const_cast<char*>(args[i]));
    argv.push_back(0);
    return h.parseCommandLine(int(argv.size()) - 1,&argv[0]);
}

void HarnessTest::defaults()
{
    GrnTestHarness h;
    const char* args[] = {"suite", "single.test"};
    test(parse(h,args,2) == SUCCESS);

    const HarnessCommandLineOptions& c = h.options();
    test(c.groonga == "groonga");
    test(c.baseDirectory == ".");
    test(c.temporaryDirectory == "tmp");
    test(c.firstTimeout == 1000);
    test(c.parallelTestCases == 1);
    test(c.reportFilename.empty());
    test(c.targets.size() == 2);
    test(c.targets[0] == "suite");
    test(c.targets[1] == "single.test");

    if (c.diff == "cut-diff")
    {
        test(c.diffOptions.size() == 2);
        test(c.diffOptions[0] == "--context-lines");
        test(c.diffOptions[1] == "10");
    }
    else
    {
        test(c.diff == "diff");
        test(c.diffOptions.size() == 1);
        test(c.diffOptions[0] == "-u");
    }
}

void HarnessTest::versionAndHelp()
{
    GrnTestHarness v;
    const char* version[] = {"--version"};
    test(parse(v,version,1) == EXIT);

    GrnTestHarness h;
    const char* help[] = {"-h"};
    test(parse(h,help,1) == EXIT);
}

void HarnessTest::diffCommand()
{
    GrnTestHarness plain;
    const char* a1[] = {"--diff", "colordiff"};
    test(parse(plain,a1,2) == SUCCESS);
    test(plain.options().diff == "colordiff");
    test(plain.options().diffOptions.empty());

    GrnTestHarness withOptions;
    const char* a2[] = {"--diff", "diff", "--diff-option", "-u", "--diff-option", "-b"};
    test(parse(withOptions,a2,6) == SUCCESS);
    test(withOptions.options().diffOptions.size() == 2);
    test(withOptions.options().diffOptions[0] == "-u");
    test(withOptions.options().diffOptions[1] == "-b");

    /* options without a command replace the default options */
    GrnTestHarness onlyOptions;
    const char* a3[] = {"--diff-option=-w"};
    test(parse(onlyOptions,a3,1) == SUCCESS);
    test(onlyOptions.options().diffOptions.size() == 1);
    test(onlyOptions.options().diffOptions[0] == "-w");
}

void HarnessTest::timeout()
{
    GrnTestHarness h;
    const char* args[] = {"--timeout", "2.5", "--parallel", "4", "--groonga", "/opt/bin/groonga"};
    test(parse(h,args,6) == SUCCESS);
    test(h.options().firstTimeout == 2500);
    test(h.options().parallelTestCases == 4);
    test(h.options().groonga == "/opt/bin/groonga");
}

void HarnessTest::invalidValues()
{
    {
        GrnTestHarness h;
        const char* args[] = {"--parallel", "51"};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
    {
        GrnTestHarness h;
        const char* args[] = {"--parallel", "0"};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
    {
        GrnTestHarness h;
        const char* args[] = {"--debug", "9"};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
    {
        GrnTestHarness h;
        const char* args[] = {"--timeout", "0"};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
    {
        GrnTestHarness h;
        const char* args[] = {"--timeout", "1e10"};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
    {
        GrnTestHarness h;
        const char* args[] = {"--timeout", "nan"};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
    {
        GrnTestHarness h;
        const char* args[] = {"--timeout", "0.0001"};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
    {
        GrnTestHarness h;
        const char* args[] = {"--groonga", ""};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
    {
        GrnTestHarness h;
        const char* args[] = {"--base-directory", "/grntest/no/such/directory"};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
    {
        GrnTestHarness h;
        const char* args[] = {"--log-destination", "syslog"};
        CPPUNIT_ASSERT_THROW(parse(h,args,2),Exceptions::ConfigError);
    }
}

void HarnessTest::unknownOption()
{
    GrnTestHarness h;
    const char* args[] = {"--no-such-option"};
    test(parse(h,args,1) == FAILURE);
}

/****************************************************************************/
#undef test
/****************************************************************************/

CPPUNIT_TEST_SUITE_REGISTRATION(HarnessTest);

/****************************************************************************/
#endif
/****************************************************************************/
