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

#ifndef __AGRID_HEADER_H__
#define __AGRID_HEADER_H__

#include <istream>
#include <string>

namespace AGRID {

/*
 * Geometry of an ESRI ASCII grid as declared by the file header:

 ncols         4
 nrows         6
 xllcorner     0.0
 yllcorner     0.0
 cellsize      50.0
 NODATA_value  -9999

 * Keys are case insensitive and can appear in any order. NODATA_value is
 * optional. xllcenter/yllcenter can be used in place of
 * xllcorner/yllcorner, in which case they refer to the center of the
 * lower left cell.
 *
 * Rows are numbered from the top (northern edge, first data row in the
 * file) to the bottom, so the row index grows while y decreases. Columns
 * grow with x.
 */
struct Header
{
  enum class CornerType
  {
    corner,
    center
  };

  unsigned long long numCols = 0;
  unsigned long long numRows = 0;
  double lowerLeftX          = 0; // lower left corner of the grid, always
  double lowerLeftY          = 0; // (whatever the cornerType)
  double cellSize            = 0;
  CornerType cornerType      = CornerType::corner; // as declared in the file
  bool hasNoDataValue        = false;
  double noDataValue         = 0;

  /*
   * Parse the header from the current position of the stream. On success
   * the stream is left at the beginning of the first data line.
   * Throws HeaderError (or IoError if the stream itself fails)
   */
  static Header parse(std::istream &in, const std::string &sourceName);

  double minX() const { return lowerLeftX; }
  double minY() const { return lowerLeftY; }
  double maxX() const { return lowerLeftX + numCols * cellSize; }
  double maxY() const { return lowerLeftY + numRows * cellSize; }

  bool isIndexInside(unsigned long long row, unsigned long long col) const
  {
    return row < numRows && col < numCols;
  }

  // the closed extent [minX, maxX] x [minY, maxY]
  bool isLocationInside(double x, double y) const
  {
    return x >= minX() && x <= maxX() && y >= minY() && y <= maxY();
  }

  bool isNoData(double value) const
  {
    return hasNoDataValue && value == noDataValue;
  }

  /*
   * Index of the cell containing (x, y). Points lying exactly on the
   * eastern or northern edge belong to the last column / first row.
   * Throws OutOfBounds
   */
  void indexOf(double x,
               double y,
               unsigned long long &row,
               unsigned long long &col) const;

  /*
   * Location of the center of the cell. Throws OutOfBounds
   */
  void positionOf(unsigned long long row,
                  unsigned long long col,
                  double &x,
                  double &y) const;
};

} // namespace AGRID

#endif
