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

#ifndef __AGRID_LOG_H__
#define __AGRID_LOG_H__

#include "utils.h"

#include <cstdarg>
#include <functional>
#include <string>

namespace AGRID {

/*
 * The library doesn't write anywhere by itself: the application decides
 * where the messages go by registering its own handlers
 */
class Logger
{
public:
  enum class Level
  {
    debug,
    info,
    warning,
    error,
  };

  Logger()                       = delete;
  Logger(const Logger &)         = delete;
  void operator=(const Logger &) = delete;

  static void registerLoggers(std::function<void(const std::string &)> error,
                              std::function<void(const std::string &)> warning,
                              std::function<void(const std::string &)> info,
                              std::function<void(const std::string &)> debug)
  {
    _error   = error;
    _warning = warning;
    _info    = info;
    _debug   = debug;
  }

  // restore the default no-op handlers
  static void unregisterLoggers();

  static void logError(const std::string &s) { _error(s); }
  static void logWarning(const std::string &s) { _warning(s); }
  static void logInfo(const std::string &s) { _info(s); }
  static void logDebug(const std::string &s) { _debug(s); }

  static void log(const Level l, const std::string &s)
  {
    if (l == Level::error)
      logError(s);
    else if (l == Level::warning)
      logWarning(s);
    else if (l == Level::info)
      logInfo(s);
    else if (l == Level::debug)
      logDebug(s);
  }

private:
  static std::function<void(const std::string &)> _error;
  static std::function<void(const std::string &)> _warning;
  static std::function<void(const std::string &)> _info;
  static std::function<void(const std::string &)> _debug;
};

inline void log(const Logger::Level l, const char *s) { Logger::log(l, s); }
inline void log(const Logger::Level l, const std::string &s)
{
  Logger::log(l, s);
}

inline void logDebug(const char *s) { Logger::logDebug(s); }
inline void logDebug(const std::string &s) { Logger::logDebug(s); }

__attribute__((format(printf, 1, 2))) inline void logDebugF(const char *fmt,
                                                            ...)
{
  va_list ap;
  va_start(ap, fmt);
  std::string s = vstrf(fmt, ap);
  va_end(ap);
  Logger::logDebug(s);
}

inline void logInfo(const char *s) { Logger::logInfo(s); }
inline void logInfo(const std::string &s) { Logger::logInfo(s); }

__attribute__((format(printf, 1, 2))) inline void logInfoF(const char *fmt, ...)
{
  va_list ap;
  va_start(ap, fmt);
  std::string s = vstrf(fmt, ap);
  va_end(ap);
  Logger::logInfo(s);
}

inline void logWarning(const char *s) { Logger::logWarning(s); }
inline void logWarning(const std::string &s) { Logger::logWarning(s); }

__attribute__((format(printf, 1, 2))) inline void logWarningF(const char *fmt,
                                                              ...)
{
  va_list ap;
  va_start(ap, fmt);
  std::string s = vstrf(fmt, ap);
  va_end(ap);
  Logger::logWarning(s);
}

inline void logError(const char *s) { Logger::logError(s); }
inline void logError(const std::string &s) { Logger::logError(s); }

__attribute__((format(printf, 1, 2))) inline void logErrorF(const char *fmt,
                                                            ...)
{
  va_list ap;
  va_start(ap, fmt);
  std::string s = vstrf(fmt, ap);
  va_end(ap);
  Logger::logError(s);
}

} // namespace AGRID

#endif
