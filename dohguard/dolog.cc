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
#include <ctime>

#include "dolog.hh"

namespace dohguard::logging
{
bool LoggingConfiguration::s_syslog{false};
bool LoggingConfiguration::s_logTimestamps{false};
bool LoggingConfiguration::s_verbose{false};

void logTime(std::ostream& stream)
{
  time_t now = time(nullptr);
  struct tm tm;
  localtime_r(&now, &tm);
  std::array<char, 64> buffer{};
  if (strftime(buffer.data(), buffer.size(), "%b %d %H:%M:%S ", &tm) > 0) {
    stream << buffer.data();
  }
}

void setSyslogFacility(int facility)
{
  /* we always call openlog() right away at startup */
  closelog();
  openlog("dohguard", LOG_PID | LOG_NDELAY, facility);
}
}
