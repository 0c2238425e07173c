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

#ifndef __AGRID_SCANNER_H__
#define __AGRID_SCANNER_H__

#include "header.h"
#include "reader.h"

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace AGRID {

struct Cell
{
  unsigned long long row;
  unsigned long long col;
  double value;
};

/*
 * Single pass over all the grid cells in row-major order (row 0 first,
 * column 0 first within a row), reading the data section forward once.
 * The row index is not used.
 *
 * The scanner takes over the reader stream, so the reader cannot be used
 * anymore. To scan the grid again create a new Reader.
 *
 * E.g.

  CellScanner scanner(std::move(reader));
  Cell cell;
  while (scanner.next(cell))
  {
    ...
  }

 */
class CellScanner
{
public:
  explicit CellScanner(Reader &&reader);
  ~CellScanner() = default;

  CellScanner(const CellScanner &)            = delete;
  CellScanner &operator=(const CellScanner &) = delete;

  /*
   * Fetch the next cell, return false when all the cells have been read.
   * Throws ParseError or IoError: after an error the scanner cannot
   * continue and any further call throws ParseError
   */
  bool next(Cell &cell);

  const Header &header() const { return _header; }

  // rows fully or partially returned so far
  unsigned long long rowsRead() const { return _rowsRead; }

private:
  void readRow();

  std::unique_ptr<std::istream> _in;
  const Header _header;
  const std::string _sourceName;
  const size_t _maxTokenLength;
  const std::streamoff _dataStart;

  std::vector<std::string> _row;
  std::string _token;
  unsigned long long _rowsRead = 0;
  unsigned long long _col      = 0;
  bool _started                = false;
  bool _failed                 = false;
};

} // namespace AGRID

#endif
