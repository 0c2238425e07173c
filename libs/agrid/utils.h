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

#ifndef __AGRID_UTILS_H__
#define __AGRID_UTILS_H__

#include <cmath>
#include <cstdarg>
#include <istream>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace AGRID {

class Exception : public std::runtime_error
{
public:
  Exception(const std::string &message) : std::runtime_error(message) {}
};

/*
 * Malformed or incomplete grid header. Thrown during Reader construction
 */
class HeaderError : public Exception
{
public:
  HeaderError(const std::string &message) : Exception(message) {}
};

/*
 * A row/column index or a x/y location outside the grid
 */
class OutOfBounds : public Exception
{
public:
  OutOfBounds(const std::string &message) : Exception(message) {}
};

/*
 * The data section doesn't match the header (invalid numeric token,
 * short row, missing rows)
 */
class ParseError : public Exception
{
public:
  ParseError(const std::string &message) : Exception(message) {}
};

/*
 * The underlying stream failed to open, seek or read
 */
class IoError : public Exception
{
public:
  IoError(const std::string &message) : Exception(message) {}
};

std::string strf(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
std::string vstrf(const char *fmt, va_list ap);

std::vector<std::string> splitString(const std::string &str,
                                     const std::regex &regex);

/*
 * Split a line on blanks, dropping the empty token produced by leading
 * blanks. Trailing '\r' (windows end-of-line) is treated as a blank
 */
std::vector<std::string> splitBlanks(const std::string &line);

/*
 * Strict number parsing: the whole token must be consumed. Return false
 * on failure instead of throwing
 */
bool parseDouble(const std::string &token, double &value);
bool parseUnsigned(const std::string &token, unsigned long long &value);

inline bool isBlank(int c)
{
  return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

/*
 * Read the next blank separated token of the current line. Return false
 * when the line ends (newline, left unread, or end of stream) before a token
 * is found. Throws ParseError if the token exceeds maxTokenLength
 * characters, IoError on stream failure
 */
bool readLineToken(std::istream &in,
                   std::string &token,
                   size_t maxTokenLength,
                   const std::string &sourceName);

bool pathExists(const std::string &path);

} // namespace AGRID

#endif
