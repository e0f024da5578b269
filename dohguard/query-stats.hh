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
#include <ctime>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <boost/noncopyable.hpp>

#include "lock.hh"
#include "stat_t.hh"

namespace dohguard
{
struct StatsSnapshot
{
  uint64_t totalQueries{0};
  uint64_t blockedQueries{0};
  uint64_t allowedQueries{0};
  uint64_t cacheHits{0};
  uint64_t cacheMisses{0};
  uint64_t upstreamFailures{0};
  double blockRatePercent{0.0};
  uint64_t uptimeSeconds{0};
  std::vector<std::pair<std::string, uint64_t>> topBlocked;

  //! block rate with two decimals, "0.00" when nothing was seen yet
  std::string blockRateToString() const;
};

/* Process-wide query counters plus a bounded table of the most blocked
   names. Counters are atomics, the table sits behind its own mutex. Once
   the table grows past s_maxTrackedDomains it is sorted by count and cut
   back to that size, so rarely blocked names are dropped for good. */
class StatsTracker : boost::noncopyable
{
public:
  static constexpr size_t s_maxTrackedDomains = 100;
  static constexpr size_t s_topReported = 10;

  StatsTracker();
  explicit StatsTracker(time_t startTime);

  void recordTotal()
  {
    ++d_totalQueries;
  }
  void recordAllowed()
  {
    ++d_allowedQueries;
  }
  void recordCacheHit()
  {
    ++d_cacheHits;
  }
  void recordCacheMiss()
  {
    ++d_cacheMisses;
  }
  void recordUpstreamFailure()
  {
    ++d_upstreamFailures;
  }
  void recordBlocked(const std::string& qname);

  StatsSnapshot snapshot() const;
  StatsSnapshot snapshot(time_t now) const;

  //! copy of the blocked-names table, most blocked first
  std::vector<std::pair<std::string, uint64_t>> getTopBlocked(size_t count) const;
  size_t getTrackedDomainsCount() const;

private:
  using DomainCounts = std::unordered_map<std::string, uint64_t>;

  static std::vector<std::pair<std::string, uint64_t>> sortedByCount(const DomainCounts& counts);
  static void trim(DomainCounts& counts);

  mutable LockGuarded<DomainCounts> d_topBlocked;
  const time_t d_startTime;

  stat_t d_totalQueries{0};
  stat_t d_blockedQueries{0};
  stat_t d_allowedQueries{0};
  stat_t d_cacheHits{0};
  stat_t d_cacheMisses{0};
  stat_t d_upstreamFailures{0};
};
}
