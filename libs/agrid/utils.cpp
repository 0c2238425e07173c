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

#include "utils.h"
#include "log.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>

#ifdef USE_BOOST_FS
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;
#else
#include <filesystem>
namespace fs = std::filesystem;
#endif

using namespace std;

namespace AGRID {

// Eventually this can be replaced with C++20 std::format
std::string strf(const char *fmt, ...)
{
  va_list params;
  va_start(params, fmt);
  std::string ret = vstrf(fmt, params);
  va_end(params);
  return ret;
}

std::string vstrf(const char *fmt, va_list ap)
{
  // A static buffer that hopefully covers 99% of all use cases
  char staticBuffer[128];

  // The dynamic buffer that will be used if the static buffer is
  // not large enough
  unique_ptr<char[]> dynamicBuffer = nullptr;

  // The buffer actually written to
  char *buffer = staticBuffer;
  size_t size  = sizeof(staticBuffer);
  int maxIterations = 10;

  va_list params;
  va_copy(params, ap);
  int r = vsnprintf(buffer, size, fmt, params);
  va_end(params);
  if (r < 0)
  {
    Logger::logError("strf error");
    return std::string();
  }

  size_t requiredSize = size_t(r) + 1; // +1 for \0

  while (requiredSize > size && // create dynamic buffer with more space
         (--maxIterations >= 0))
  {
    dynamicBuffer = unique_ptr<char[]>(new char[requiredSize]);
    size          = requiredSize;
    buffer        = dynamicBuffer.get();
    *buffer       = '\0';

    va_copy(params, ap);
    r = vsnprintf(buffer, size, fmt, params);
    va_end(params);
    if (r < 0)
    {
      Logger::logError("strf error");
      break;
    }

    requiredSize = size_t(r) + 1; // +1 for \0
  }

  if (maxIterations < 0)
  {
    Logger::logError(
        "strf failed after 10 iterations: buffer still not large enough");
  }
  return std::string(buffer);
}

std::vector<std::string> splitString(const std::string &str,
                                     const std::regex &regex)
{
  return {std::sregex_token_iterator{str.begin(), str.end(), regex, -1},
          std::sregex_token_iterator()};
}

std::vector<std::string> splitBlanks(const std::string &line)
{
  static const std::regex regex(R"([\s]+)", std::regex::optimize);
  std::vector<std::string> tokens(splitString(line, regex));

  // remove the first empty element if the line start with spaces
  if (!tokens.empty() && tokens.front().empty()) tokens.erase(tokens.begin());
  // sregex_token_iterator doesn't produce a trailing empty token, but be
  // tolerant of it anyway
  if (!tokens.empty() && tokens.back().empty()) tokens.pop_back();
  return tokens;
}

bool parseDouble(const std::string &token, double &value)
{
  if (token.empty() || std::isspace(static_cast<unsigned char>(token[0])))
    return false;
  const char *begin = token.c_str();
  char *end;
  errno      = 0;
  double tmp = std::strtod(begin, &end);
  if (end != begin + token.size()) return false;
  // underflow yields a denormal or zero, which is fine
  if (errno == ERANGE && std::isinf(tmp)) return false;
  value = tmp;
  return true;
}

bool parseUnsigned(const std::string &token, unsigned long long &value)
{
  // stoull silently accepts and wraps negative numbers
  if (token.empty() || !std::isdigit(static_cast<unsigned char>(token[0])))
    return false;
  try
  {
    size_t parsed;
    unsigned long long tmp = std::stoull(token, &parsed);
    if (parsed != token.size()) return false;
    value = tmp;
    return true;
  }
  catch (const std::invalid_argument &)
  {
    return false;
  }
  catch (const std::out_of_range &)
  {
    return false;
  }
}

bool readLineToken(std::istream &in,
                   std::string &token,
                   size_t maxTokenLength,
                   const std::string &sourceName)
{
  const int eof = std::char_traits<char>::eof();

  int c;
  while ((c = in.peek()) != eof && isBlank(c)) in.get();

  if (c == eof || c == '\n')
  {
    if (in.bad())
    {
      throw IoError(strf("Error while reading grid %s", sourceName.c_str()));
    }
    return false;
  }

  token.clear();
  while ((c = in.peek()) != eof && c != '\n' && !isBlank(c))
  {
    if (token.size() == maxTokenLength)
    {
      throw ParseError(strf("Grid %s: token too long (more than %zu "
                            "characters)",
                            sourceName.c_str(), maxTokenLength));
    }
    token.push_back(static_cast<char>(in.get()));
  }

  if (in.bad())
  {
    throw IoError(strf("Error while reading grid %s", sourceName.c_str()));
  }
  return true;
}

bool pathExists(const std::string &path)
{
  try
  {
    return fs::exists(path);
  }
  catch (exception &e)
  {
    logErrorF("%s", e.what());
    return false;
  }
}

} // namespace AGRID
