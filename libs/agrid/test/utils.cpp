/***************************************************************************
 * MIT License                                                             *
 *                                                                         *
 * Copyright (C) by ETHZ/SED                                               *
 *                                                                         *
 * Permission is hereby granted, free of charge, to any person obtaining a *
 * copy of this software and associated documentation files (the           *
 * “Software”), to deal in the Software without restriction, including     *
 * without limitation the rights to use, copy, modify, merge, publish,     *
 * distribute, sublicense, and/or sell copies of the Software, and to      *
 * permit persons to whom the Software is furnished to do so, subject to   *
 * the following conditions:                                               *
 *                                                                         *
 * The above copyright notice and this permission notice shall be          *
 * included in all copies or substantial portions of the Software.         *
 *                                                                         *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND,         *
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF      *
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.  *
 * IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY    *
 * CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,    *
 * TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE       *
 * SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.                  *
 *                                                                         *
 *   Developed by Luca Scarabello <luca.scarabello@sed.ethz.ch>            *
 ***************************************************************************/

#define BOOST_TEST_MODULE libagrid
#include <boost/test/included/unit_test.hpp>

#include "agrid/log.h"
#include "agrid/utils.h"

#include "common.ipp"

using namespace std;
using namespace AGRID;

BOOST_AUTO_TEST_CASE(test_strf)
{
  BOOST_CHECK_EQUAL(strf("row %llu col %d %s %.2f", 12ULL, 3, "abc", 1.5),
                    "row 12 col 3 abc 1.50");

  // longer than the internal static buffer
  string longStr(1000, 'x');
  BOOST_CHECK_EQUAL(strf("%s-%s", longStr.c_str(), longStr.c_str()),
                    longStr + "-" + longStr);
}

BOOST_AUTO_TEST_CASE(test_split_blanks)
{
  vector<string> tokens = splitBlanks("  ncols \t 4\r");
  BOOST_REQUIRE_EQUAL(tokens.size(), 2);
  BOOST_CHECK_EQUAL(tokens[0], "ncols");
  BOOST_CHECK_EQUAL(tokens[1], "4");

  BOOST_CHECK(splitBlanks("").empty());
  BOOST_CHECK(splitBlanks(" \t\r").empty());
  BOOST_CHECK_EQUAL(splitBlanks("1 2 3 4").size(), 4);
}

BOOST_AUTO_TEST_CASE(test_parse_numbers)
{
  double d = 0;
  BOOST_CHECK(parseDouble("12.5", d));
  BOOST_CHECK_EQUAL(d, 12.5);
  BOOST_CHECK(parseDouble("-9999", d));
  BOOST_CHECK_EQUAL(d, -9999);
  BOOST_CHECK(parseDouble("1e-3", d));
  BOOST_CHECK_EQUAL(d, 1e-3);
  BOOST_CHECK(!parseDouble("", d));
  BOOST_CHECK(!parseDouble("abc", d));
  BOOST_CHECK(!parseDouble("12.5.3", d));
  BOOST_CHECK(!parseDouble("1e999", d));
  BOOST_CHECK(!parseDouble("-1e999", d));
  BOOST_CHECK(!parseDouble(" 1", d));
  BOOST_CHECK_EQUAL(d, 1e-3); // untouched on failure
  // underflow gives a subnormal number or zero, not an error
  BOOST_CHECK(parseDouble("1e-310", d));
  BOOST_CHECK_EQUAL(d, 1e-310);
  BOOST_CHECK(parseDouble("-1e-400", d));
  BOOST_CHECK_EQUAL(d, 0);

  unsigned long long u = 0;
  BOOST_CHECK(parseUnsigned("4000", u));
  BOOST_CHECK_EQUAL(u, 4000);
  BOOST_CHECK(!parseUnsigned("-4", u));
  BOOST_CHECK(!parseUnsigned("4.0", u));
  BOOST_CHECK(!parseUnsigned("+4", u));
  BOOST_CHECK(!parseUnsigned("99999999999999999999999", u));
  BOOST_CHECK_EQUAL(u, 4000);
}

BOOST_AUTO_TEST_CASE(test_exceptions)
{
  // all errors can be handled as AGRID::Exception
  BOOST_CHECK_THROW(throw HeaderError("h"), Exception);
  BOOST_CHECK_THROW(throw OutOfBounds("o"), Exception);
  BOOST_CHECK_THROW(throw ParseError("p"), Exception);
  BOOST_CHECK_THROW(throw IoError("i"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_path_exists)
{
  BOOST_CHECK(pathExists("./data/sample.asc"));
  BOOST_CHECK(!pathExists("./data/missing.asc"));
}

BOOST_AUTO_TEST_CASE(test_logger)
{
  {
    LogCapture capture;
    logError("e");
    logWarningF("w %d", 1);
    logInfo(string("i"));
    logDebugF("d %s", "x");
    log(Logger::Level::warning, "w2");

    BOOST_REQUIRE_EQUAL(capture.errors.size(), 1);
    BOOST_CHECK_EQUAL(capture.errors[0], "e");
    BOOST_REQUIRE_EQUAL(capture.warnings.size(), 2);
    BOOST_CHECK_EQUAL(capture.warnings[0], "w 1");
    BOOST_CHECK_EQUAL(capture.warnings[1], "w2");
    BOOST_REQUIRE_EQUAL(capture.infos.size(), 1);
    BOOST_CHECK_EQUAL(capture.infos[0], "i");
    BOOST_REQUIRE_EQUAL(capture.debugs.size(), 1);
    BOOST_CHECK_EQUAL(capture.debugs[0], "d x");
  }

  // no handlers: nothing happens
  BOOST_CHECK_NO_THROW(logError("nobody listens"));
}
