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

#ifndef __AGRID_ROWINDEX_H__
#define __AGRID_ROWINDEX_H__

#include <istream>
#include <string>
#include <vector>

namespace AGRID {

/*
 * Byte offsets of the grid rows within the data stream.
 *
 * The grid files can be much larger than the available memory, so the rows
 * are not loaded: only their position in the stream is remembered. The
 * index is filled lazily and always forward: to locate row N the stream is
 * scanned from the last known row up to N, recording every row passed on the
 * way. Accessing a far, not yet indexed row costs a linear scan, while
 * accessing an already indexed row is just a lookup. build() indexes all
 * the rows in one pass, for workloads with many random accesses.
 *
 * The stream is assumed not to change during the index lifetime, so the
 * entries are never invalidated.
 */
class RowIndex
{
public:
  /*
   * dataStart is the offset of the first data row, as left by
   * Header::parse()
   */
  RowIndex(unsigned long long numRows,
           std::streamoff dataStart,
           const std::string &sourceName);

  ~RowIndex() = default;

  /*
   * Offset of the first token of the row (row 0 might point to leading
   * blanks instead). Throws OutOfBounds, ParseError (the stream contains
   * less rows than declared) or IoError
   */
  std::streamoff offsetOf(std::istream &in, unsigned long long row);

  /*
   * Index all the rows not indexed yet. Returns the number of rows added
   */
  unsigned long long build(std::istream &in);

  // number of rows whose offset is known (they are always the first ones)
  unsigned long long size() const { return _offsets.size(); }

  bool complete() const { return _offsets.size() == _numRows; }

private:
  void locateNextRow(std::istream &in);
  void checkTrailingData(std::istream &in);

  unsigned long long _numRows;
  std::vector<std::streamoff> _offsets;
  std::string _sourceName;
  bool _trailingDataChecked = false;
};

} // namespace AGRID

#endif
