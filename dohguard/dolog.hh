/*
 * This file is part of PowerDNS or dnsdist.
 * Copyright -- PowerDNS.COM B.V. and its contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of version 2 of the GNU General Public License as
 * published by the Free Software Foundation.
 *
 * In addition, for the avoidance of any doubt, permission is granted to
 * link this program with OpenSSL and to (re)distribute the binaries
 * produced as the result of such linking.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#pragma once
#include <array>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <syslog.h>

/* Rapid, easy to use logging to the console and syslog.

   Usage:
          vinfolog("Blocked %s (type %d)", qname, qtype);
          infolog("Loaded %d entries from %s", count, path);
          warnlog("Upstream %s failed: %s", url, e.what());
          errlog("Deferred task failed: %s", e.what());

   Every '%' followed by any character is replaced by the next argument,
   streamed with operator<<. '%%' prints a single '%'. vinfolog is a
   no-op unless verbose logging has been enabled.
*/
namespace dohguard
{
template <typename O>
inline void dolog(O& outputStream, const char* str)
{
  outputStream << str;
}

template <typename O, typename T, typename... Args>
void dolog(O& outputStream, const char* formatStr, T value, const Args&... args)
{
  while (*formatStr) {
    if (*formatStr == '%') {
      if (*(formatStr + 1) == '%') {
        ++formatStr;
      }
      else {
        outputStream << value;
        formatStr += 2;
        dolog(outputStream, formatStr, args...);
        return;
      }
    }
    outputStream << *formatStr++;
  }
}

namespace logging
{
class LoggingConfiguration
{
public:
  static void setSyslog(bool value = true)
  {
    s_syslog = value;
  }
  static void setLogTimestamps(bool value = true)
  {
    s_logTimestamps = value;
  }
  static void setVerbose(bool value = true)
  {
    s_verbose = value;
  }
  static bool getSyslog()
  {
    return s_syslog;
  }
  static bool getLogTimestamps()
  {
    return s_logTimestamps;
  }
  static bool getVerbose()
  {
    return s_verbose;
  }

private:
  static bool s_syslog;
  static bool s_logTimestamps;
  static bool s_verbose;
};

void logTime(std::ostream& stream);
void setSyslogFacility(int facility);
}

template <typename... Args>
void genlog(std::ostream& stream, int level, bool skipSyslog, const char* formatStr, const Args&... args)
{
  std::ostringstream str;
  dolog(str, formatStr, args...);

  auto output = str.str();

  if (!skipSyslog && logging::LoggingConfiguration::getSyslog()) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg): syslog is what it is
    syslog(level, "%s", output.c_str());
  }

  if (logging::LoggingConfiguration::getLogTimestamps()) {
    logging::logTime(stream);
  }

  stream << output << std::endl;
}

template <typename... Args>
void verboselog(const char* formatStr, const Args&... args)
{
  genlog(std::cout, LOG_DEBUG, false, formatStr, args...);
}

#define vinfolog                                                \
  if (dohguard::logging::LoggingConfiguration::getVerbose()) \
  dohguard::verboselog

template <typename... Args>
void infolog(const char* formatStr, const Args&... args)
{
  genlog(std::cout, LOG_INFO, false, formatStr, args...);
}

template <typename... Args>
void warnlog(const char* formatStr, const Args&... args)
{
  genlog(std::cout, LOG_WARNING, false, formatStr, args...);
}

template <typename... Args>
void errlog(const char* formatStr, const Args&... args)
{
  genlog(std::cout, LOG_ERR, false, formatStr, args...);
}
}
