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

#include "scanner.h"
#include "log.h"
#include "utils.h"

using namespace std;

namespace AGRID {

CellScanner::CellScanner(Reader &&reader)
    : _in(std::move(reader._in)), _header(reader._header),
      _sourceName(reader._options.sourceName),
      _maxTokenLength(reader._options.maxTokenLength),
      _dataStart(reader._dataStart), _row(reader._header.numCols)
{
  if (!_in)
  {
    throw IoError(strf("Grid %s: the reader has been consumed",
                       _sourceName.c_str()));
  }
}

bool CellScanner::next(Cell &cell)
{
  if (_failed)
  {
    throw ParseError(strf("Grid %s: cannot continue scanning after an error",
                          _sourceName.c_str()));
  }

  try
  {
    if (!_started)
    {
      _in->clear();
      _in->seekg(_dataStart);
      if (_in->fail())
      {
        throw IoError(strf("Cannot seek to the data section of grid %s",
                           _sourceName.c_str()));
      }
      _started = true;
      logDebugF("Grid %s: scanning %llu cells", _sourceName.c_str(),
                _header.numRows * _header.numCols);
    }

    if (_rowsRead == 0 || _col == _header.numCols)
    {
      if (_rowsRead == _header.numRows) return false; // done
      readRow();
      _col = 0;
    }

    const std::string &token = _row[_col];
    double value;
    if (!parseDouble(token, value))
    {
      throw ParseError(strf("Invalid value '%s' at row %llu col %llu of "
                            "grid %s",
                            token.c_str(), _rowsRead - 1, _col,
                            _sourceName.c_str()));
    }

    cell.row   = _rowsRead - 1;
    cell.col   = _col;
    cell.value = value;
    ++_col;
    return true;
  }
  catch (const Exception &)
  {
    _failed = true;
    throw;
  }
}

void CellScanner::readRow()
{
  const int eof = std::char_traits<char>::eof();

  // skip empty lines
  int c;
  while ((c = _in->peek()) != eof && (isBlank(c) || c == '\n')) _in->get();

  if (c == eof)
  {
    if (_in->bad())
    {
      throw IoError(strf("Error while reading row %llu of grid %s",
                         _rowsRead, _sourceName.c_str()));
    }
    throw ParseError(strf("Grid %s is truncated: found %llu rows, the "
                          "header declares %llu",
                          _sourceName.c_str(), _rowsRead, _header.numRows));
  }

  // the whole row is validated before any of its cells is returned
  unsigned long long count = 0;
  while (readLineToken(*_in, _token, _maxTokenLength, _sourceName))
  {
    if (count == _header.numCols)
    {
      throw ParseError(strf("Row %llu of grid %s has more than %llu values",
                            _rowsRead, _sourceName.c_str(),
                            _header.numCols));
    }
    _row[count++].swap(_token);
  }

  if (count != _header.numCols)
  {
    throw ParseError(strf("Row %llu of grid %s has %llu values, expected %llu",
                          _rowsRead, _sourceName.c_str(), count,
                          _header.numCols));
  }

  if (_in->peek() == '\n') _in->get();
  ++_rowsRead;
}

} // namespace AGRID
