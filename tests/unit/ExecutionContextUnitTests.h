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

#ifndef EXECUTION_CONTEXT_UNIT_TESTS
#define EXECUTION_CONTEXT_UNIT_TESTS

/****************************************************************************/

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include "grntest/Exceptions.h"
#include "grntest/executioncontext.h"
#include "grntest/resultlog.h"

/****************************************************************************/
#define test CPPUNIT_ASSERT
/****************************************************************************/

using namespace grntestharness;

class ExecutionContextTests : public CppUnit::TestFixture
{
 public:
            void              logging();
            void              errorsAreAlwaysLogged();
            void              nesting();
            void              abortNeedsToken();
            void              omitTriggersToken();
            void              onErrorPolicy();
            void              singleTokenPerRun();
            void              tokenReleasedOnScopeExit();

 public:
    CPPUNIT_TEST_SUITE(ExecutionContextTests);
    CPPUNIT_TEST(logging);
    CPPUNIT_TEST(errorsAreAlwaysLogged);
    CPPUNIT_TEST(nesting);
    CPPUNIT_TEST(abortNeedsToken);
    CPPUNIT_TEST(omitTriggersToken);
    CPPUNIT_TEST(onErrorPolicy);
    CPPUNIT_TEST(singleTokenPerRun);
    CPPUNIT_TEST(tokenReleasedOnScopeExit);
    CPPUNIT_TEST_SUITE_END();
};

void ExecutionContextTests::logging()
{
    ExecutionContext c;

    test(c.isLogging());
    test(c.baseDirectory() == ".");

    c.log(ENTRY_INPUT,"status\n");
    c.log(ENTRY_INPUT,"");                               // empty, dropped
    test(c.result().size() == 1);

    c.setLogging(false);
    c.log(ENTRY_INPUT,"table_create A\n");
    c.log(ENTRY_OUTPUT,"[[0,0.0,0.0],true]");
    test(c.result().size() == 1);

    c.setLogging(true);
    OutputOptions o;
    o.command = "select";
    c.log(ENTRY_OUTPUT,"[[0,0.0,0.0],true]",o);
    test(c.result().size() == 2);
    test(c.result()[1].tag == ENTRY_OUTPUT);
    test(c.result()[1].options.command == "select");
    test(c.result()[1].options.format == FORMAT_JSON);
}

void ExecutionContextTests::errorsAreAlwaysLogged()
{
    ExecutionContext c;
    c.setLogging(false);
    c.logError("a.test:1:x: broken");
    test(c.result().size() == 1);
    test(c.result().count(ENTRY_ERROR) == 1);
    test(c.result()[0].content == "a.test:1:x: broken");
}

void ExecutionContextTests::nesting()
{
    ExecutionContext c;
    test(c.nestingDepth() == 0);
    test(!c.isTopLevel());
    {
        NestingScope outer(c);
        test(c.isTopLevel());
        {
            NestingScope inner(c);
            test(c.nestingDepth() == 2);
            test(!c.isTopLevel());
        }
        test(c.isTopLevel());
    }
    test(c.nestingDepth() == 0);
}

void ExecutionContextTests::abortNeedsToken()
{
    ExecutionContext c;
    test(!c.hasAbortToken());
    CPPUNIT_ASSERT_THROW(c.abort(),Exceptions::ExecutorError);
    CPPUNIT_ASSERT_THROW(c.omit(),Exceptions::ExecutorError);
}

void ExecutionContextTests::omitTriggersToken()
{
    ExecutionContext c;
    AbortScope s(c,true);
    test(c.hasAbortToken());
    test(!c.isAborted());

    c.omit();
    test(c.isOmitted());
    test(c.isAborted());
}

void ExecutionContextTests::onErrorPolicy()
{
    ExecutionContext c;
    AbortScope s(c,true);

    test(c.onError() == ON_ERROR_DEFAULT);
    c.error();
    test(!c.isAborted());
    test(!c.isOmitted());

    c.setOnError(ON_ERROR_OMIT);
    c.error();
    test(c.isAborted());
    test(c.isOmitted());
}

void ExecutionContextTests::singleTokenPerRun()
{
    ExecutionContext c;
    AbortScope s(c,true);
    CPPUNIT_ASSERT_THROW(AbortScope(c,true),Exceptions::ExecutorError);

    AbortScope nested(c,false);                          // does not establish
    test(c.hasAbortToken());
}

void ExecutionContextTests::tokenReleasedOnScopeExit()
{
    ExecutionContext c;
    {
        AbortScope s(c,true);
        c.abort();
        test(c.isAborted());
        test(!c.isOmitted());
    }
    test(!c.hasAbortToken());
    test(!c.isAborted());
}

/****************************************************************************/
#undef test
/****************************************************************************/

CPPUNIT_TEST_SUITE_REGISTRATION(ExecutionContextTests);

/****************************************************************************/
#endif
/****************************************************************************/
