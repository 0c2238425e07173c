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

#include "header.h"
#include "log.h"
#include "utils.h"

#include <cctype>
#include <cmath>
#include <unordered_map>
#include <vector>

using namespace std;

namespace {

using namespace AGRID;

enum class Key
{
  ncols,
  nrows,
  xll,
  yll,
  cellsize,
  nodata
};

struct KeyInfo
{
  Key key;
  Header::CornerType cornerType;
};

bool lookupKey(const string &token, KeyInfo &info)
{
  static const unordered_map<string, KeyInfo> keys = {
      {"ncols", {Key::ncols, Header::CornerType::corner}},
      {"nrows", {Key::nrows, Header::CornerType::corner}},
      {"xllcorner", {Key::xll, Header::CornerType::corner}},
      {"xllcenter", {Key::xll, Header::CornerType::center}},
      {"yllcorner", {Key::yll, Header::CornerType::corner}},
      {"yllcenter", {Key::yll, Header::CornerType::center}},
      {"cellsize", {Key::cellsize, Header::CornerType::corner}},
      {"nodata_value", {Key::nodata, Header::CornerType::corner}},
  };

  string lower(token);
  for (char &c : lower) c = std::tolower(static_cast<unsigned char>(c));

  auto it = keys.find(lower);
  if (it == keys.end()) return false;
  info = it->second;
  return true;
}

struct KeyHash
{
  size_t operator()(Key k) const { return static_cast<size_t>(k); }
};

} // namespace

namespace AGRID {

Header Header::parse(std::istream &in, const std::string &sourceName)
{
  unordered_map<Key, string, KeyHash> values;
  Header::CornerType xCorner = Header::CornerType::corner;
  Header::CornerType yCorner = Header::CornerType::corner;
  bool dataFound             = false;

  // read one line at a time, until the first line that is not a header key
  while (!in.eof())
  {
    std::streampos lineStart = in.tellg();
    if (lineStart == std::streampos(-1))
    {
      throw IoError(
          strf("Cannot read grid header of %s", sourceName.c_str()));
    }

    string line;
    std::getline(in, line);
    if (in.bad())
    {
      throw IoError(
          strf("Error while reading grid header of %s", sourceName.c_str()));
    }
    if (in.fail()) break; // nothing left to read

    std::vector<std::string> tokens(splitBlanks(line));

    // skip empty lines
    if (tokens.empty()) continue;

    KeyInfo info;
    if (!lookupKey(tokens.at(0), info))
    {
      // this is the first data line, rewind to its beginning
      in.clear();
      in.seekg(lineStart);
      if (in.fail())
      {
        throw IoError(strf("Cannot seek to the data section of %s",
                           sourceName.c_str()));
      }
      dataFound = true;
      break;
    }

    if (tokens.size() != 2)
    {
      throw HeaderError(strf("Grid header line '%s' of %s: expected "
                             "a key followed by a single value",
                             line.c_str(), sourceName.c_str()));
    }

    if (values.count(info.key) != 0)
    {
      throw HeaderError(strf("Grid header key %s is repeated in %s",
                             tokens.at(0).c_str(), sourceName.c_str()));
    }
    values[info.key] = tokens.at(1);

    if (info.key == Key::xll) xCorner = info.cornerType;
    if (info.key == Key::yll) yCorner = info.cornerType;
  }

  auto required = [&](Key key, const char *name) -> const string & {
    auto it = values.find(key);
    if (it == values.end())
    {
      throw HeaderError(strf("Grid header of %s is missing the %s key",
                             sourceName.c_str(), name));
    }
    return it->second;
  };

  auto toUnsigned = [&](Key key, const char *name) {
    unsigned long long value;
    const string &token = required(key, name);
    if (!parseUnsigned(token, value) || value == 0)
    {
      throw HeaderError(strf("Grid header of %s: %s must be a positive "
                             "integer (found '%s')",
                             sourceName.c_str(), name, token.c_str()));
    }
    return value;
  };

  auto toDouble = [&](Key key, const char *name) {
    double value;
    const string &token = required(key, name);
    if (!parseDouble(token, value))
    {
      throw HeaderError(strf("Grid header of %s: %s is not a number "
                             "(found '%s')",
                             sourceName.c_str(), name, token.c_str()));
    }
    return value;
  };

  Header hdr;
  hdr.numCols  = toUnsigned(Key::ncols, "ncols");
  hdr.numRows  = toUnsigned(Key::nrows, "nrows");
  double xll   = toDouble(Key::xll, "xllcorner/xllcenter");
  double yll   = toDouble(Key::yll, "yllcorner/yllcenter");
  hdr.cellSize = toDouble(Key::cellsize, "cellsize");

  if (!(hdr.cellSize > 0) || !std::isfinite(hdr.cellSize))
  {
    throw HeaderError(strf("Grid header of %s: cellsize must be positive "
                           "(found %g)",
                           sourceName.c_str(), hdr.cellSize));
  }

  if (xCorner != yCorner)
  {
    throw HeaderError(strf("Grid header of %s: xll and yll disagree on "
                           "corner/center reference",
                           sourceName.c_str()));
  }
  hdr.cornerType = xCorner;

  // keep everything relative to the lower left corner
  if (hdr.cornerType == CornerType::center)
  {
    xll -= hdr.cellSize / 2;
    yll -= hdr.cellSize / 2;
  }
  hdr.lowerLeftX = xll;
  hdr.lowerLeftY = yll;

  if (values.count(Key::nodata) != 0)
  {
    hdr.noDataValue    = toDouble(Key::nodata, "NODATA_value");
    hdr.hasNoDataValue = true;
  }

  if (!dataFound)
  {
    throw HeaderError(
        strf("Grid %s has no data section after the header",
             sourceName.c_str()));
  }

  logDebugF("Grid %s: ncols %llu nrows %llu xll %g yll %g cellsize %g%s",
            sourceName.c_str(), hdr.numCols, hdr.numRows, hdr.lowerLeftX,
            hdr.lowerLeftY, hdr.cellSize,
            hdr.hasNoDataValue
                ? strf(" nodata %g", hdr.noDataValue).c_str()
                : "");

  return hdr;
}

void Header::indexOf(double x,
                     double y,
                     unsigned long long &row,
                     unsigned long long &col) const
{
  if (!isLocationInside(x, y))
  {
    throw OutOfBounds(strf("Location x %g y %g is out of grid boundaries "
                           "(x %g..%g y %g..%g)",
                           x, y, minX(), maxX(), minY(), maxY()));
  }

  double xoff = std::floor((x - minX()) / cellSize);
  double yoff = std::floor((y - minY()) / cellSize);

  // the eastern and northern edges belong to the outermost cells
  col = xoff >= numCols ? numCols - 1 : static_cast<unsigned long long>(xoff);
  unsigned long long fromBottom =
      yoff >= numRows ? numRows - 1 : static_cast<unsigned long long>(yoff);
  row = (numRows - 1) - fromBottom;
}

void Header::positionOf(unsigned long long row,
                        unsigned long long col,
                        double &x,
                        double &y) const
{
  if (!isIndexInside(row, col))
  {
    throw OutOfBounds(strf("Index row %llu col %llu is out of grid "
                           "boundaries (nrows %llu ncols %llu)",
                           row, col, numRows, numCols));
  }
  x = minX() + (col + 0.5) * cellSize;
  y = minY() + (numRows - 1 - row + 0.5) * cellSize;
}

} // namespace AGRID
