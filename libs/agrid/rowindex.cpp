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

#include "rowindex.h"
#include "log.h"
#include "utils.h"

#include <cctype>
#include <limits>

using namespace std;

namespace {

/*
 * Move past blanks and empty lines. Return the next character without
 * extracting it (EOF at the end of the stream)
 */
int skipWhitespaces(std::istream &in)
{
  int c;
  while ((c = in.peek()) != std::char_traits<char>::eof() &&
         std::isspace(static_cast<unsigned char>(c)))
  {
    in.get();
  }
  return c;
}

} // namespace

namespace AGRID {

RowIndex::RowIndex(unsigned long long numRows,
                   std::streamoff dataStart,
                   const std::string &sourceName)
    : _numRows(numRows), _offsets{dataStart}, _sourceName(sourceName)
{}

std::streamoff RowIndex::offsetOf(std::istream &in, unsigned long long row)
{
  if (row >= _numRows)
  {
    throw OutOfBounds(strf("Row %llu is out of grid boundaries (nrows %llu)",
                           row, _numRows));
  }

  if (row >= _offsets.size())
  {
    logDebugF("Grid %s: scanning rows %llu..%llu", _sourceName.c_str(),
              static_cast<unsigned long long>(_offsets.size()), row);
  }

  while (row >= _offsets.size())
  {
    locateNextRow(in);
  }
  return _offsets[row];
}

unsigned long long RowIndex::build(std::istream &in)
{
  const unsigned long long before = _offsets.size();
  while (!complete())
  {
    locateNextRow(in);
  }
  checkTrailingData(in);

  const unsigned long long added = _offsets.size() - before;
  logDebugF("Grid %s: indexed %llu rows (%llu were already known)",
            _sourceName.c_str(), added, before);
  return added;
}

/*
 * Start from the last known row, skip its line and any empty line
 * following it: what comes next is the first token of the following row.
 * Nothing is recorded unless the row is found, so a failure leaves the
 * index consistent
 */
void RowIndex::locateNextRow(std::istream &in)
{
  const unsigned long long lastRow = _offsets.size() - 1;

  in.clear();
  in.seekg(_offsets.back());
  if (in.fail())
  {
    throw IoError(strf("Cannot seek to row %llu of grid %s (offset %lld)",
                       lastRow, _sourceName.c_str(),
                       static_cast<long long>(_offsets.back())));
  }

  in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
  int next = skipWhitespaces(in);

  if (in.bad())
  {
    throw IoError(strf("Error while reading row %llu of grid %s", lastRow,
                       _sourceName.c_str()));
  }

  if (next == std::char_traits<char>::eof())
  {
    throw ParseError(strf("Grid %s is truncated: found %llu rows, the "
                          "header declares %llu",
                          _sourceName.c_str(), lastRow + 1, _numRows));
  }

  std::streampos pos = in.tellg();
  if (pos == std::streampos(-1))
  {
    throw IoError(strf("Cannot get the position of row %llu of grid %s",
                       lastRow + 1, _sourceName.c_str()));
  }
  _offsets.push_back(pos);
}

void RowIndex::checkTrailingData(std::istream &in)
{
  if (_trailingDataChecked) return;

  in.clear();
  in.seekg(_offsets.back());
  if (in.fail())
  {
    throw IoError(strf("Cannot seek to row %llu of grid %s",
                       static_cast<unsigned long long>(_offsets.size() - 1),
                       _sourceName.c_str()));
  }
  in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
  int next = skipWhitespaces(in);
  if (in.bad())
  {
    throw IoError(strf("Error while reading grid %s", _sourceName.c_str()));
  }

  if (next != std::char_traits<char>::eof())
  {
    logWarningF("Grid %s contains data after the last row (nrows %llu)",
                _sourceName.c_str(), _numRows);
  }
  _trailingDataChecked = true;
}

} // namespace AGRID
