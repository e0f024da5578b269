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

#include "query-processor.hh"
#include "dohguardexception.hh"
#include "dolog.hh"
#include "qname-extractor.hh"

namespace dohguard
{
const char* outcomeToString(QueryOutcome outcome)
{
  switch (outcome) {
  case QueryOutcome::Blocked:
    return "BLOCKED";
  case QueryOutcome::CacheHit:
    return "HIT";
  case QueryOutcome::CacheMiss:
    return "MISS";
  case QueryOutcome::Fallback:
    return "FALLBACK";
  case QueryOutcome::Bypass:
    return "BYPASS";
  case QueryOutcome::UpstreamFailure:
    return "ERROR";
  }
  return "UNKNOWN";
}

QueryProcessor::QueryProcessor(FilterContext& context, UpstreamResolver& upstream, QueryProcessorOptions options, DeferredTaskRunner runner) :
  d_context(context), d_upstream(upstream), d_classifier(context.rules), d_options(options), d_runner(std::move(runner))
{
}

boost::optional<PacketBuffer> QueryProcessor::lookupCache(const std::string& key)
{
  try {
    return d_context.cache.get(key);
  }
  catch (const std::exception& e) {
    warnlog("Cache lookup for %s failed, treating as a miss: %s", key, e.what());
  }
  return boost::none;
}

void QueryProcessor::storeInCache(const std::string& key, const PacketBuffer& response)
{
  auto* cache = &d_context.cache;
  DeferredTask task = [cache, key, response, ttl = d_options.cacheTTL]() {
    cache->insert(key, response, ttl);
  };

  if (d_runner) {
    d_runner(std::move(task));
  }
  else {
    runDeferredTask(task);
  }
}

bool QueryProcessor::forward(const PacketBuffer& query, QueryResult& result)
{
  try {
    auto answer = d_upstream.resolve(query);
    result.response = std::move(answer.response);
    return answer.fromFallback;
  }
  catch (const DohGuardException& e) {
    result.error = e.reason;
  }
  catch (const std::exception& e) {
    result.error = e.what();
  }

  d_context.stats.recordUpstreamFailure();
  errlog("Unable to resolve %s through %s: %s", result.qname.empty() ? std::string("unparsable query") : result.qname, d_upstream.getName(), result.error);
  result.outcome = QueryOutcome::UpstreamFailure;
  result.response.clear();
  return false;
}

QueryResult QueryProcessor::process(const PacketBuffer& query)
{
  QueryResult result;
  d_context.stats.recordTotal();

  auto question = extractQuestion(query);
  result.qname = question.qname;
  result.qtype = question.qtype;

  if (result.qname.empty()) {
    /* nothing to classify nor to key a cache entry on, pass it along */
    d_context.stats.recordAllowed();
    result.outcome = QueryOutcome::Bypass;
    forward(query, result);
    return result;
  }

  if (d_classifier.classify(result.qname, &result.matchedRule) == Verdict::Block) {
    result.response = makeBlockedResponse(query, d_options.blockedPolicy);
    result.outcome = QueryOutcome::Blocked;
    d_context.stats.recordBlocked(result.qname);
    vinfolog("Blocked %s|%s (%s)", result.qname, QType::toString(result.qtype), result.matchedRule);
    return result;
  }

  d_context.stats.recordAllowed();
  const auto key = makeCacheKey(result.qname, result.qtype);

  if (auto cached = lookupCache(key)) {
    d_context.stats.recordCacheHit();
    result.response = std::move(*cached);
    /* the cached answer carries the ID of the query that filled the cache */
    if (query.size() >= 2 && result.response.size() >= 2) {
      std::copy(query.begin(), query.begin() + 2, result.response.begin());
    }
    result.outcome = QueryOutcome::CacheHit;
    return result;
  }

  d_context.stats.recordCacheMiss();
  result.outcome = QueryOutcome::CacheMiss;
  bool fromFallback = forward(query, result);
  if (result.outcome == QueryOutcome::UpstreamFailure) {
    return result;
  }

  if (fromFallback) {
    result.outcome = QueryOutcome::Fallback;
  }
  storeInCache(key, result.response);
  return result;
}
}
