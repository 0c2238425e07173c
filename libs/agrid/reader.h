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

#ifndef __AGRID_READER_H__
#define __AGRID_READER_H__

#include "header.h"
#include "rowindex.h"
#include "utils.h"

#include <istream>
#include <memory>
#include <string>

namespace AGRID {

class CellScanner;

/*
 * Random access to the values of an ESRI ASCII grid, without loading the
 * grid in memory.
 *
 * The reader owns the stream: concurrent use of the same Reader from
 * multiple threads is not supported. After any call the stream position is
 * unspecified.
 */
class Reader
{
public:
  struct Options
  {
    // locate all the rows at construction time instead of lazily
    bool eagerIndex;
    // longest accepted data token, in characters
    size_t maxTokenLength;
    // name of the grid used in log and error messages
    std::string sourceName;

    Options() : eagerIndex(false), maxTokenLength(500), sourceName("<stream>")
    {}
  };

  /*
   * Parse the header from the current stream position. Throws HeaderError
   * (or IoError)
   */
  Reader(std::unique_ptr<std::istream> in);
  Reader(std::unique_ptr<std::istream> in, const Options &options);

  /*
   * Open the grid file. Options::sourceName is replaced by the file path.
   * Throws IoError if the file cannot be opened, HeaderError
   */
  Reader(const std::string &filePath);
  Reader(const std::string &filePath, const Options &options);

  ~Reader() = default;

  Reader(const Reader &)            = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&)                 = default;
  Reader &operator=(Reader &&)      = default;

  const Header &header() const { return _header; }
  const Options &options() const { return _options; }

  unsigned long long numRows() const { return _header.numRows; }
  unsigned long long numCols() const { return _header.numCols; }
  double cellSize() const { return _header.cellSize; }
  double minX() const { return _header.minX(); }
  double minY() const { return _header.minY(); }
  double maxX() const { return _header.maxX(); }
  double maxY() const { return _header.maxY(); }
  bool hasNoDataValue() const { return _header.hasNoDataValue; }
  double noDataValue() const { return _header.noDataValue; }
  bool isNoData(double value) const { return _header.isNoData(value); }

  void positionOf(unsigned long long row,
                  unsigned long long col,
                  double &x,
                  double &y) const
  {
    _header.positionOf(row, col, x, y);
  }

  void indexOf(double x,
               double y,
               unsigned long long &row,
               unsigned long long &col) const
  {
    _header.indexOf(x, y, row, col);
  }

  // number of rows whose position in the stream is already known
  unsigned long long indexedRows() const { return _index.size(); }

  /*
   * Locate all the rows, so that any following access costs a single seek.
   * Returns the number of rows that were not indexed yet
   */
  unsigned long long buildIndex();

  /*
   * Value of the cell. Throws OutOfBounds, ParseError, IoError
   */
  double getValueAtIndex(unsigned long long row, unsigned long long col);

  /*
   * Value of the cell containing the location. Throws OutOfBounds,
   * ParseError, IoError
   */
  double getValue(double x, double y);

  /*
   * Interpolated value at the location, where the cell values are
   * considered to be at the cell centers:
   *  - bilinear interpolation between the 4 surrounding centers
   *  - linear interpolation along one axis in the half cell margin between
   *    the outermost centers and the grid edge
   *  - nearest value in the 4 corners of the margin
   * If any cell taking part in the interpolation is no-data, the no-data
   * value is returned.
   * Throws OutOfBounds (outside [minX,maxX] x [minY,maxY]), ParseError,
   * IoError
   */
  double getInterpolatedValue(double x, double y);

private:
  friend class CellScanner;

  std::istream &stream();

  Options _options;
  std::unique_ptr<std::istream> _in;
  Header _header;
  std::streamoff _dataStart;
  RowIndex _index;
};

} // namespace AGRID

#endif
