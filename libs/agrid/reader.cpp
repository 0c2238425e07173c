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

#include "reader.h"
#include "log.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <fstream>

using namespace std;

namespace {

using namespace AGRID;

std::unique_ptr<std::istream> openGridFile(const std::string &filePath)
{
  if (!pathExists(filePath))
  {
    throw IoError(strf("Cannot find grid file %s", filePath.c_str()));
  }

  // binary mode: stream offsets must be byte offsets
  std::unique_ptr<std::ifstream> file(
      new std::ifstream(filePath, std::ios::binary | std::ios::in));
  if (!file->is_open())
  {
    throw IoError(strf("Cannot open grid file %s", filePath.c_str()));
  }
  return std::unique_ptr<std::istream>(file.release());
}

Reader::Options namedAfter(const Reader::Options &options,
                           const std::string &filePath)
{
  Reader::Options named(options);
  named.sourceName = filePath;
  return named;
}

Header parseHeader(std::istream *in, const std::string &sourceName)
{
  if (!in)
  {
    throw IoError(strf("No input stream for grid %s", sourceName.c_str()));
  }
  return Header::parse(*in, sourceName);
}

std::streamoff currentOffset(std::istream &in, const std::string &sourceName)
{
  std::streampos pos = in.tellg();
  if (pos == std::streampos(-1))
  {
    throw IoError(strf("Cannot get the position of the data section of %s",
                       sourceName.c_str()));
  }
  return pos;
}

/*
 * function to find value inside a square using Lagrange interpolation
 * 0.0 <= xdiff/zdiff <= 1.0
 * returns interp value at(xdiff, zdiff)
 */
double interpolateSquareLagrange(double xdiff,
                                 double zdiff,
                                 double vval00,
                                 double vval01,
                                 double vval10,
                                 double vval11)
{
  return vval00 * (1.0 - xdiff) * (1.0 - zdiff) +
         vval01 * (1.0 - xdiff) * zdiff + vval10 * xdiff * (1.0 - zdiff) +
         vval11 * xdiff * zdiff;
}

/*
 * Position along one axis, expressed as the two cell centers enclosing it
 * (i0, i1) and the fractional distance from i0 (diff). Outside the
 * outermost centers (the half cell margin at the grid edges) or when the
 * axis has a single cell, both i0 and i1 are the nearest center and diff
 * is 0
 */
struct AxisLocation
{
  unsigned long long i0, i1;
  double diff;
};

// off: location in units of cells, where the cell centers lie on integers
AxisLocation locateOnAxis(double off, unsigned long long numCells)
{
  // a location on a cell center must weight that cell only, whatever the
  // rounding error of the coordinate to offset conversion
  const double nearestOff = std::round(off);
  if (std::abs(off - nearestOff) <=
      1e-9 * std::max(1.0, std::abs(nearestOff)))
  {
    off = nearestOff;
  }

  if (numCells > 1 && off >= 0 && off <= numCells - 1)
  {
    double floorOff       = std::floor(off);
    unsigned long long i0 = floorOff >= numCells - 1
                                ? numCells - 2
                                : static_cast<unsigned long long>(floorOff);
    return {i0, i0 + 1, off - i0};
  }
  unsigned long long nearest = off < 0 ? 0 : numCells - 1;
  return {nearest, nearest, 0.0};
}

} // namespace

namespace AGRID {

Reader::Reader(std::unique_ptr<std::istream> in)
    : Reader(std::move(in), Options())
{}

Reader::Reader(std::unique_ptr<std::istream> in, const Options &options)
    : _options(options), _in(std::move(in)),
      _header(parseHeader(_in.get(), _options.sourceName)),
      _dataStart(currentOffset(*_in, _options.sourceName)),
      _index(_header.numRows, _dataStart, _options.sourceName)
{
  if (_options.eagerIndex)
  {
    buildIndex();
  }
}

Reader::Reader(const std::string &filePath) : Reader(filePath, Options()) {}

Reader::Reader(const std::string &filePath, const Options &options)
    : Reader(openGridFile(filePath), namedAfter(options, filePath))
{}

std::istream &Reader::stream()
{
  if (!_in)
  {
    throw IoError(strf("Grid %s: the reader has been consumed",
                       _options.sourceName.c_str()));
  }
  return *_in;
}

unsigned long long Reader::buildIndex() { return _index.build(stream()); }

/*
 * This is the function that reads the data from the grid files. The row
 * position comes from the row index, then the row is tokenized up to the
 * requested column.
 */
double Reader::getValueAtIndex(unsigned long long row, unsigned long long col)
{
  if (!_header.isIndexInside(row, col))
  {
    throw OutOfBounds(strf("Requested index row %llu col %llu is out of grid "
                           "boundaries (nrows %llu ncols %llu)",
                           row, col, _header.numRows, _header.numCols));
  }

  std::istream &in      = stream();
  std::streamoff offset = _index.offsetOf(in, row);

  in.clear();
  in.seekg(offset);
  if (in.fail())
  {
    throw IoError(strf("Cannot seek to row %llu of grid %s", row,
                       _options.sourceName.c_str()));
  }

  std::string token;
  for (unsigned long long i = 0; i <= col; ++i)
  {
    if (!readLineToken(in, token, _options.maxTokenLength,
                       _options.sourceName))
    {
      throw ParseError(strf("Row %llu of grid %s has %llu values, expected "
                            "%llu",
                            row, _options.sourceName.c_str(), i,
                            _header.numCols));
    }
  }

  double value;
  if (!parseDouble(token, value))
  {
    throw ParseError(strf("Invalid value '%s' at row %llu col %llu of grid %s",
                          token.c_str(), row, col,
                          _options.sourceName.c_str()));
  }
  return value;
}

double Reader::getValue(double x, double y)
{
  unsigned long long row, col;
  _header.indexOf(x, y, row, col);
  return getValueAtIndex(row, col);
}

double Reader::getInterpolatedValue(double x, double y)
{
  if (!_header.isLocationInside(x, y))
  {
    throw OutOfBounds(strf("Requested location x %g y %g is out of grid "
                           "boundaries (grid %s x %g..%g y %g..%g)",
                           x, y, _options.sourceName.c_str(), minX(), maxX(),
                           minY(), maxY()));
  }

  // cell centers lie on integer offsets, rows grow southward
  const double xoff = (x - minX()) / cellSize() - 0.5;
  const double yoff = (maxY() - y) / cellSize() - 0.5;

  const AxisLocation colLoc = locateOnAxis(xoff, numCols());
  const AxisLocation rowLoc = locateOnAxis(yoff, numRows());

  const double rdiff = rowLoc.diff;
  const double cdiff = colLoc.diff;

  // fetch only the vertices contributing to the result: this avoids
  // useless reads and prevents a no-data vertex with zero weight from
  // spoiling the result (e.g. exactly on a cell center)
  bool noData = false;
  auto fetch  = [&](unsigned long long row, unsigned long long col,
                   double weight) -> double {
    if (weight == 0) return 0;
    double value = getValueAtIndex(row, col);
    if (isNoData(value)) noData = true;
    return value;
  };

  double vval00 = fetch(rowLoc.i0, colLoc.i0, (1 - rdiff) * (1 - cdiff));
  double vval01 = fetch(rowLoc.i0, colLoc.i1, (1 - rdiff) * cdiff);
  double vval10 = fetch(rowLoc.i1, colLoc.i0, rdiff * (1 - cdiff));
  double vval11 = fetch(rowLoc.i1, colLoc.i1, rdiff * cdiff);

  if (noData)
  {
    return noDataValue();
  }

  return interpolateSquareLagrange(rdiff, cdiff, vval00, vval01, vval10,
                                   vval11);
}

} // namespace AGRID
