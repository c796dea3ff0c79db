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
 * @file xmlarchive.cpp
 */

# include <ctime>
# include <string>
# include <boost/config.hpp>
# include <boost/lexical_cast.hpp>
# include <boost/serialization/nvp.hpp>
# include <boost/serialization/string.hpp>

# include "grntest/global.h"
# include "grntest/helper.h"
# include "grntest/xmlarchive.h"

using namespace std;

namespace grntestharness
{

namespace
{
string timeString (long int msec)
{
	time_t t = msec / 1000;
	char buf[64];
	string s = ctime_r (&t, buf) ? buf : "";
	return s.substr (0, s.find ('\n'));
}
}

void XMLArchive :: save (const struct ExecutionStats &harness_es)
{
	unsigned int TotalTestCases = harness_es.testcasesTotal;
	(*this) << BOOST_SERIALIZATION_NVP(TotalTestCases);

	unsigned int TotalTestsPassed = harness_es.testcasesPassed;
	(*this) << BOOST_SERIALIZATION_NVP(TotalTestsPassed);

	unsigned int TotalTestsFailed = harness_es.testcasesFailed;
	(*this) << BOOST_SERIALIZATION_NVP(TotalTestsFailed);

	unsigned int TotalTestsNotChecked = harness_es.testcasesNotChecked;
	(*this) << BOOST_SERIALIZATION_NVP(TotalTestsNotChecked);

	unsigned int TotalTestsOmitted = harness_es.testcasesOmitted;
	(*this) << BOOST_SERIALIZATION_NVP(TotalTestsOmitted);
}

void XMLArchive :: save (const struct TestcaseExecutionInfo &tei)
{
	string TestID = tei.testID;
	(*this) << BOOST_SERIALIZATION_NVP(TestID);

	string TestcaseFile = tei.tcfile;
	(*this) << BOOST_SERIALIZATION_NVP(TestcaseFile);

	string TestStartTime = timeString (tei.sTime);
	(*this) << BOOST_SERIALIZATION_NVP(TestStartTime);

	string TestEndTime = timeString (tei.eTime);
	(*this) << BOOST_SERIALIZATION_NVP(TestEndTime);

	string TestTotalExeTime = boost::lexical_cast<std::string> (double (tei.eTime - tei.sTime) / 1000);
	(*this) << BOOST_SERIALIZATION_NVP(TestTotalExeTime);

	string TestcaseResult;
	switch (tei.result)
	{
		case RESULT_PASS        : TestcaseResult = "PASS";         break;
		case RESULT_FAIL        : TestcaseResult = "FAIL";         break;
		case RESULT_NOT_CHECKED : TestcaseResult = "NOT_CHECKED";  break;
		case RESULT_OMITTED     : TestcaseResult = "OMITTED";      break;
	}
	(*this) << BOOST_SERIALIZATION_NVP(TestcaseResult);

	string TestcaseFailureReason = tei.failureReason;
	(*this) << BOOST_SERIALIZATION_NVP(TestcaseFailureReason);
}

void XMLArchive :: save (const struct HarnessCommandLineOptions &GrnTestEnv)
{
	string groonga = GrnTestEnv.groonga;
	(*this) << BOOST_SERIALIZATION_NVP(groonga);

	string baseDirectory = GrnTestEnv.baseDirectory;
	(*this) << BOOST_SERIALIZATION_NVP(baseDirectory);

	string temporaryDirectory = GrnTestEnv.temporaryDirectory;
	(*this) << BOOST_SERIALIZATION_NVP(temporaryDirectory);

	string diff = GrnTestEnv.diff;
	(*this) << BOOST_SERIALIZATION_NVP(diff);

	int timeout = GrnTestEnv.firstTimeout;
	(*this) << BOOST_SERIALIZATION_NVP(timeout);

	int parallelTestCases = GrnTestEnv.parallelTestCases;
	(*this) << BOOST_SERIALIZATION_NVP(parallelTestCases);

	string reportFilename = GrnTestEnv.reportFilename;
	(*this) << BOOST_SERIALIZATION_NVP(reportFilename);

	int debugLevel = GrnTestEnv.debugLevel;
	(*this) << BOOST_SERIALIZATION_NVP(debugLevel);
}
} //END namespace grntestharness
