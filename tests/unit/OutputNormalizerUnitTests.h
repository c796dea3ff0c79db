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

#ifndef OUTPUT_NORMALIZER_UNIT_TESTS
#define OUTPUT_NORMALIZER_UNIT_TESTS

/****************************************************************************/

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include "grntest/outputnormalizer.h"
#include "grntest/resultlog.h"

/****************************************************************************/
#define test CPPUNIT_ASSERT
/****************************************************************************/

using namespace grntestharness;

class OutputNormalizerTests : public CppUnit::TestFixture
{
 private:
    static  std::string       json(const std::string& s) {return OutputNormalizer().normalizeOutput(s,FORMAT_JSON);}

 public:
            void              successStatus();
            void              failureStatus();
            void              fixedPoint();
            void              wideOutput();
            void              doubleValues();
            void              memberOrder();
            void              otherFormats();
            void              notJson();
            void              wholeResult();
            void              returnCode();

 public:
    CPPUNIT_TEST_SUITE(OutputNormalizerTests);
    CPPUNIT_TEST(successStatus);
    CPPUNIT_TEST(failureStatus);
    CPPUNIT_TEST(fixedPoint);
    CPPUNIT_TEST(wideOutput);
    CPPUNIT_TEST(doubleValues);
    CPPUNIT_TEST(memberOrder);
    CPPUNIT_TEST(otherFormats);
    CPPUNIT_TEST(notJson);
    CPPUNIT_TEST(wholeResult);
    CPPUNIT_TEST(returnCode);
    CPPUNIT_TEST_SUITE_END();
};

void OutputNormalizerTests::successStatus()
{
    test(json("[[0,1337566253.89858,0.000355720520019531],true]") == "[[0,0.0,0.0],true]\n");
    test(json("[[0,1.5,0.25]]")                                    == "[[0,0.0,0.0]]\n");
}

/**
 *  The times are zeroed, the message is kept and the backtrace dropped.
 */
void OutputNormalizerTests::failureStatus()
{
    test(json("[[-22,1337566253.89858,0.0003,\"invalid table name\",[[\"grn_ctx\",\"ctx.c\",10]]],false]")
         == "[[[-22,0.0,0.0],\"invalid table name\"],false]\n");

    test(json("[[-63,1.0,2.0]]") == "[[[-63,0.0,0.0],null]]\n");
}

void OutputNormalizerTests::fixedPoint()
{
    std::string once  = json("[[-22,1.0,2.0,\"invalid\"],false]");
    std::string again = json(once.substr(0,once.length() - 1));
    test(once == again);

    once  = json("[[0,1.0,2.0],[[[1],[[\"_id\",\"UInt32\"]],[1]]]]");
    again = json(once.substr(0,once.length() - 1));
    test(once == again);
}

void OutputNormalizerTests::wideOutput()
{
    std::string a(80,'a');

    test(json("[[0,1.0,2.0],[\"" + a + "\"]]") ==
         "[\n"
         "  [\n"
         "    0,\n"
         "    0.0,\n"
         "    0.0\n"
         "  ],\n"
         "  [\n"
         "    \"" + a + "\"\n"
         "  ]\n"
         "]\n");

    test(json("[[0,1.0,2.0],{\"name\":\"" + a + "\",\"tags\":[],\"extra\":{}}]") ==
         "[\n"
         "  [\n"
         "    0,\n"
         "    0.0,\n"
         "    0.0\n"
         "  ],\n"
         "  {\n"
         "    \"name\": \"" + a + "\",\n"
         "    \"tags\": [],\n"
         "    \"extra\": {}\n"
         "  }\n"
         "]\n");

    /* exactly at the limit stays on one line */
    std::string fits(79 - std::string("[[0,0.0,0.0],[\"\"]]").length(),'b');
    test(json("[[0,1.0,2.0],[\"" + fits + "\"]]") == "[[0,0.0,0.0],[\"" + fits + "\"]]\n");

    /* a narrower normalizer pretty prints sooner */
    test(OutputNormalizer(10).normalizeOutput("[[0,1.0,2.0],true]",FORMAT_JSON) ==
         "[\n  [\n    0,\n    0.0,\n    0.0\n  ],\n  true\n]\n");
}

/**
 *  Values other than the status times are written back unchanged.
 */
void OutputNormalizerTests::doubleValues()
{
    test(json("[[0,1,2],0.30000000000000004]") == "[[0,0.0,0.0],0.30000000000000004]\n");
    test(json("[[0,1,2],[0.12345678901234568,0.12345678901234566]]")
         == "[[0,0.0,0.0],[0.12345678901234568,0.12345678901234566]]\n");
    test(json("[[0,1,2],[0.1,1.0,-2.5,100.0,29]]") == "[[0,0.0,0.0],[0.1,1.0,-2.5,100.0,29]]\n");

    test(OutputNormalizer::formatDouble(0.1)    == "0.1");
    test(OutputNormalizer::formatDouble(3.0)    == "3.0");
    test(OutputNormalizer::formatDouble(1e-05)  == "1.0e-05");
    test(OutputNormalizer::formatDouble(1.5e20) == "1.5e+20");
}

void OutputNormalizerTests::memberOrder()
{
    test(json("[[0,1.0,2.0],{\"version\":\"1\",\"alloc_count\":3}]")
         == "[[0,0.0,0.0],{\"version\":\"1\",\"alloc_count\":3}]\n");

    test(json("[[0,1.0,2.0],{\"z\":{\"b\":1,\"a\":2},\"m\":[{\"y\":true,\"x\":null}]}]")
         == "[[0,0.0,0.0],{\"z\":{\"b\":1,\"a\":2},\"m\":[{\"y\":true,\"x\":null}]}]\n");

    test(OutputNormalizer(10).normalizeOutput("[[0,1.0,2.0],{\"b\":1,\"a\":\"x\\ny\"}]",FORMAT_JSON) ==
         "[\n  [\n    0,\n    0.0,\n    0.0\n  ],\n  {\n    \"b\": 1,\n    \"a\": \"x\\ny\"\n  }\n]\n");
}

void OutputNormalizerTests::otherFormats()
{
    OutputNormalizer n;
    test(n.normalizeOutput("table_create Users TABLE_HASH_KEY ShortText",FORMAT_GROONGA_COMMAND)
         == "table_create Users TABLE_HASH_KEY ShortText\n");
    test(n.normalizeOutput("<RESULT CODE=\"0\" UP=\"1.0\" ELAPSED=\"2.0\"/>",FORMAT_OTHER)
         == "<RESULT CODE=\"0\" UP=\"1.0\" ELAPSED=\"2.0\"/>\n");
}

void OutputNormalizerTests::notJson()
{
    test(json("not json at all") == "not json at all\n");
    test(json("{\"a\":1}")       == "{\"a\":1}\n");
    test(json("[]")              == "[]\n");
}

void OutputNormalizerTests::wholeResult()
{
    ResultLog r;
    OutputOptions defaults, xml;
    xml.formatName = "xml";
    xml.format     = FORMAT_OTHER;

    r.append(ResultEntry(ENTRY_INPUT,"table_create Users\n"));
    r.append(ResultEntry(ENTRY_OUTPUT,"[[0,1.0,2.0],true]",defaults));
    r.append(ResultEntry(ENTRY_INPUT,"status --output_format xml\n"));
    r.append(ResultEntry(ENTRY_OUTPUT,"<RESULT/>",xml));
    r.append(ResultEntry(ENTRY_ERROR,"a.test:3:select 'x: Unmatched quote"));

    test(OutputNormalizer().normalizeResult(r) ==
         "table_create Users\n"
         "[[0,0.0,0.0],true]\n"
         "status --output_format xml\n"
         "<RESULT/>\n"
         "a.test:3:select 'x: Unmatched quote\n");

    test(OutputNormalizer().normalizeResult(ResultLog()).empty());
}

void OutputNormalizerTests::returnCode()
{
    int rc = 1;
    test(OutputNormalizer::extractReturnCode("[[0,1.0,2.0],true]",rc));
    test(rc == 0);
    test(OutputNormalizer::extractReturnCode("[[-22,1.0,2.0,\"invalid\"],false]",rc));
    test(rc == -22);
    test(!OutputNormalizer::extractReturnCode("<RESULT/>",rc));
    test(!OutputNormalizer::extractReturnCode("[[[-22,0.0,0.0],\"invalid\"]]",rc));
}

/****************************************************************************/
#undef test
/****************************************************************************/

CPPUNIT_TEST_SUITE_REGISTRATION(OutputNormalizerTests);

/****************************************************************************/
#endif
/****************************************************************************/
