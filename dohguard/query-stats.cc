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
#include <algorithm>
#include <boost/format.hpp>

#include "query-stats.hh"

namespace dohguard
{
std::string StatsSnapshot::blockRateToString() const
{
  return boost::str(boost::format("%.2f") % blockRatePercent);
}

StatsTracker::StatsTracker() :
  StatsTracker(time(nullptr))
{
}

StatsTracker::StatsTracker(time_t startTime) :
  d_startTime(startTime)
{
}

void StatsTracker::recordBlocked(const std::string& qname)
{
  ++d_blockedQueries;

  auto counts = d_topBlocked.lock();
  ++(*counts)[qname];
  if (counts->size() > s_maxTrackedDomains) {
    trim(*counts);
  }
}

std::vector<std::pair<std::string, uint64_t>> StatsTracker::sortedByCount(const DomainCounts& counts)
{
  std::vector<std::pair<std::string, uint64_t>> result(counts.begin(), counts.end());
  /* ties are broken on the name, so that the outcome does not depend
     on the hash order */
  std::sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.second != rhs.second) {
      return lhs.second > rhs.second;
    }
    return lhs.first < rhs.first;
  });
  return result;
}

void StatsTracker::trim(DomainCounts& counts)
{
  auto sorted = sortedByCount(counts);
  sorted.resize(std::min(sorted.size(), s_maxTrackedDomains));
  counts = DomainCounts(sorted.begin(), sorted.end());
}

std::vector<std::pair<std::string, uint64_t>> StatsTracker::getTopBlocked(size_t count) const
{
  DomainCounts copy = *d_topBlocked.lock();
  auto sorted = sortedByCount(copy);
  if (sorted.size() > count) {
    sorted.resize(count);
  }
  return sorted;
}

size_t StatsTracker::getTrackedDomainsCount() const
{
  return d_topBlocked.lock()->size();
}

StatsSnapshot StatsTracker::snapshot() const
{
  return snapshot(time(nullptr));
}

StatsSnapshot StatsTracker::snapshot(time_t now) const
{
  StatsSnapshot snap;
  snap.totalQueries = d_totalQueries;
  snap.blockedQueries = d_blockedQueries;
  snap.allowedQueries = d_allowedQueries;
  snap.cacheHits = d_cacheHits;
  snap.cacheMisses = d_cacheMisses;
  snap.upstreamFailures = d_upstreamFailures;
  if (snap.totalQueries > 0) {
    snap.blockRatePercent = static_cast<double>(snap.blockedQueries) * 100.0 / static_cast<double>(snap.totalQueries);
  }
  snap.uptimeSeconds = now > d_startTime ? static_cast<uint64_t>(now - d_startTime) : 0;
  snap.topBlocked = getTopBlocked(s_topReported);
  return snap;
}
}
