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
#include <string>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include "blocked-response.hh"
#include "classifier.hh"
#include "deferred-work.hh"
#include "query-stats.hh"
#include "resolution-cache.hh"
#include "upstream.hh"

namespace dohguard
{
/* Everything shared between concurrently processed queries. Built once at
   startup and handed to whoever processes queries; it has to outlive
   them, and any deferred task they scheduled. */
struct FilterContext : boost::noncopyable
{
  FilterContext(size_t cacheSize = 1000, uint32_t cacheShards = 1) :
    cache(cacheSize, cacheShards)
  {
  }

  FilterRules rules;
  ResolutionCache cache;
  StatsTracker stats;
};

enum class QueryOutcome : uint8_t
{
  Blocked,
  CacheHit,
  CacheMiss,
  Fallback,
  Bypass,
  UpstreamFailure
};

//! the X-Cache value for forwarded answers, "BLOCKED" and "ERROR" otherwise
const char* outcomeToString(QueryOutcome outcome);

struct QueryResult
{
  PacketBuffer response;
  std::string qname;
  //! the rule that blocked the query, if any
  std::string matchedRule;
  //! why the upstreams failed, for UpstreamFailure only
  std::string error;
  uint16_t qtype{QType::A};
  QueryOutcome outcome{QueryOutcome::Bypass};
};

struct QueryProcessorOptions
{
  uint32_t cacheTTL{300};
  BlockedResponsePolicy blockedPolicy{BlockedResponsePolicy::NXDomain};
};

/* Takes a raw query through extraction, classification, then either the
   blocked answer or the cache and the upstream resolver.

   - a query we cannot parse is forwarded untouched, never classified
     nor cached
   - a blocked query never touches the cache
   - an allowed query is answered from the cache when possible, otherwise
     from upstream; the upstream answer is cached for cacheTTL seconds,
     through the deferred runner when one is set
   - any cache failure is treated as a miss */
class QueryProcessor
{
public:
  QueryProcessor(FilterContext& context, UpstreamResolver& upstream, QueryProcessorOptions options = QueryProcessorOptions(), DeferredTaskRunner runner = nullptr);

  QueryResult process(const PacketBuffer& query);

  const QueryProcessorOptions& getOptions() const
  {
    return d_options;
  }

private:
  boost::optional<PacketBuffer> lookupCache(const std::string& key);
  void storeInCache(const std::string& key, const PacketBuffer& response);
  bool forward(const PacketBuffer& query, QueryResult& result);

  FilterContext& d_context;
  UpstreamResolver& d_upstream;
  Classifier d_classifier;
  const QueryProcessorOptions d_options;
  DeferredTaskRunner d_runner;
};
}
