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

#include "agrid/log.h"
#include "agrid/reader.h"
#include "agrid/utils.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

/*
 * 4 columns x 6 rows, cells of 50x50 with the lower left corner in (0,0):
 * the grid covers x 0..200 y 0..300. Row 0 is the northern one.
 */
const std::string sampleGrid = "ncols         4\n"
                               "nrows         6\n"
                               "xllcorner     0.0\n"
                               "yllcorner     0.0\n"
                               "cellsize      50.0\n"
                               "NODATA_value  -9999\n"
                               "-9999 -9999 5 2\n"
                               "-9999 20 100 36\n"
                               "3 8 35 10\n"
                               "32 42 50 6\n"
                               "88 75 27 9\n"
                               "13 5 1 -9999\n";

const std::vector<std::vector<double>> sampleValues = {
    {-9999, -9999, 5, 2}, {-9999, 20, 100, 36}, {3, 8, 35, 10},
    {32, 42, 50, 6},      {88, 75, 27, 9},      {13, 5, 1, -9999}};

const double sampleNoData   = -9999;
const double sampleCellSize = 50;

const std::string sampleHeader = "ncols 4\n"
                                 "nrows 6\n"
                                 "xllcorner 0.0\n"
                                 "yllcorner 0.0\n"
                                 "cellsize 50.0\n"
                                 "NODATA_value -9999\n";

std::unique_ptr<std::istream> makeStream(const std::string &content)
{
  return std::unique_ptr<std::istream>(new std::istringstream(content));
}

AGRID::Reader makeReader(const std::string &content)
{
  return AGRID::Reader(makeStream(content));
}

AGRID::Reader makeReader(const std::string &content,
                         const AGRID::Reader::Options &options)
{
  return AGRID::Reader(makeStream(content), options);
}

/*
 * Grid with a recognizable value for each cell: row * 1000 + col
 */
std::string makeLargeGrid(unsigned long long numRows,
                          unsigned long long numCols)
{
  std::ostringstream out;
  out << "ncols " << numCols << "\n"
      << "nrows " << numRows << "\n"
      << "xllcorner 1000\n"
      << "yllcorner 2000\n"
      << "cellsize 10\n";
  for (unsigned long long row = 0; row < numRows; row++)
  {
    for (unsigned long long col = 0; col < numCols; col++)
    {
      out << (col == 0 ? "" : " ") << row * 1000 + col;
    }
    out << "\n";
  }
  return out.str();
}

/*
 * Collect the log messages for the lifetime of the object
 */
struct LogCapture
{
  std::vector<std::string> errors, warnings, infos, debugs;

  LogCapture()
  {
    AGRID::Logger::registerLoggers(
        [this](const std::string &s) { errors.push_back(s); },
        [this](const std::string &s) { warnings.push_back(s); },
        [this](const std::string &s) { infos.push_back(s); },
        [this](const std::string &s) { debugs.push_back(s); });
  }
  ~LogCapture() { AGRID::Logger::unregisterLoggers(); }

  LogCapture(const LogCapture &)   = delete;
  void operator=(const LogCapture &) = delete;
};

} // namespace
