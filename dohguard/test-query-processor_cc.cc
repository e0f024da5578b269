#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <memory>
#include <vector>
#include <boost/test/unit_test.hpp>

#include "dnswriter.hh"
#include "query-processor.hh"
#include "test-fake-upstream.hh"

using namespace dohguard;

BOOST_AUTO_TEST_SUITE(test_query_processor_cc)

BOOST_AUTO_TEST_CASE(test_blocked_query)
{
  FilterContext context;
  context.rules.blocklist.add("doubleclick.net");
  FakeUpstream upstream;
  QueryProcessor processor(context, upstream);

  auto query = makeDNSQuery("ad.doubleclick.net", QType::A, 0x1234);
  auto result = processor.process(query);

  BOOST_CHECK(result.outcome == QueryOutcome::Blocked);
  BOOST_CHECK_EQUAL(result.qname, "ad.doubleclick.net");
  BOOST_CHECK_EQUAL(result.matchedRule, "block:doubleclick.net");
  BOOST_CHECK_EQUAL(readUInt16(result.response, DNSHeaderOffsets::id), 0x1234);
  BOOST_CHECK_EQUAL(result.response.at(DNSHeaderOffsets::flags2) & DNSFlags::RCodeMask, RCode::NXDomain);
  BOOST_CHECK_EQUAL(readUInt16(result.response, DNSHeaderOffsets::ancount), 0U);

  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 0U);
  BOOST_CHECK_EQUAL(context.cache.getSize(), 0U);

  auto snap = context.stats.snapshot();
  BOOST_CHECK_EQUAL(snap.totalQueries, 1U);
  BOOST_CHECK_EQUAL(snap.blockedQueries, 1U);
  BOOST_CHECK_EQUAL(snap.allowedQueries, 0U);
  BOOST_REQUIRE_EQUAL(snap.topBlocked.size(), 1U);
  BOOST_CHECK_EQUAL(snap.topBlocked.at(0).first, "ad.doubleclick.net");
}

BOOST_AUTO_TEST_CASE(test_nodata_policy)
{
  FilterContext context;
  context.rules.patterns.addRegex(R"(^telemetry\.)");
  FakeUpstream upstream;
  QueryProcessorOptions options;
  options.blockedPolicy = BlockedResponsePolicy::NoData;
  QueryProcessor processor(context, upstream, options);

  auto result = processor.process(makeDNSQuery("telemetry.example.org", QType::AAAA));
  BOOST_CHECK(result.outcome == QueryOutcome::Blocked);
  BOOST_CHECK_EQUAL(result.matchedRule, "pattern:^telemetry\\.");
  BOOST_CHECK_EQUAL(result.response.at(DNSHeaderOffsets::flags2) & DNSFlags::RCodeMask, RCode::NoError);
}

BOOST_AUTO_TEST_CASE(test_miss_then_hit)
{
  FilterContext context;
  context.rules.blocklist.add("doubleclick.net");
  FakeUpstream upstream;
  QueryProcessor processor(context, upstream);

  auto query = makeDNSQuery("example.com", QType::A, 1);
  auto first = processor.process(query);
  BOOST_CHECK(first.outcome == QueryOutcome::CacheMiss);
  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 1U);
  BOOST_CHECK(first.response.size() > query.size());
  BOOST_CHECK(context.cache.get("example.com:1"));

  auto second = processor.process(query);
  BOOST_CHECK(second.outcome == QueryOutcome::CacheHit);
  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 1U);
  BOOST_CHECK(second.response == first.response);

  /* a different type is a different entry */
  auto aaaa = processor.process(makeDNSQuery("example.com", QType::AAAA, 2));
  BOOST_CHECK(aaaa.outcome == QueryOutcome::CacheMiss);
  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 2U);

  auto snap = context.stats.snapshot();
  BOOST_CHECK_EQUAL(snap.totalQueries, 3U);
  BOOST_CHECK_EQUAL(snap.allowedQueries, 3U);
  BOOST_CHECK_EQUAL(snap.cacheHits, 1U);
  BOOST_CHECK_EQUAL(snap.cacheMisses, 2U);
  BOOST_CHECK_EQUAL(snap.blockRateToString(), "0.00");
}

BOOST_AUTO_TEST_CASE(test_hit_gets_the_query_id)
{
  FilterContext context;
  FakeUpstream upstream;
  QueryProcessor processor(context, upstream);

  processor.process(makeDNSQuery("www.powerdns.com", QType::A, 0x1111));
  auto result = processor.process(makeDNSQuery("www.powerdns.com", QType::A, 0x2222));
  BOOST_CHECK(result.outcome == QueryOutcome::CacheHit);
  BOOST_CHECK_EQUAL(readUInt16(result.response, DNSHeaderOffsets::id), 0x2222);
}

BOOST_AUTO_TEST_CASE(test_unparsable_query_is_forwarded)
{
  FilterContext context;
  context.rules.patterns.addRegex(".*");
  FakeUpstream upstream;
  QueryProcessor processor(context, upstream);

  PacketBuffer garbage{0x00, 0x01, 0x02};
  auto result = processor.process(garbage);
  BOOST_CHECK(result.outcome == QueryOutcome::Bypass);
  BOOST_CHECK(result.qname.empty());
  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 1U);
  BOOST_CHECK(!result.response.empty());
  BOOST_CHECK_EQUAL(context.cache.getSize(), 0U);

  auto snap = context.stats.snapshot();
  BOOST_CHECK_EQUAL(snap.blockedQueries, 0U);
  BOOST_CHECK_EQUAL(snap.cacheMisses, 0U);
}

BOOST_AUTO_TEST_CASE(test_upstream_failure)
{
  FilterContext context;
  FakeUpstream upstream;
  upstream.d_fail = true;
  QueryProcessor processor(context, upstream);

  auto result = processor.process(makeDNSQuery("example.com", QType::A));
  BOOST_CHECK(result.outcome == QueryOutcome::UpstreamFailure);
  BOOST_CHECK(result.response.empty());
  BOOST_CHECK(!result.error.empty());
  BOOST_CHECK_EQUAL(context.cache.getSize(), 0U);
  BOOST_CHECK_EQUAL(context.stats.snapshot().upstreamFailures, 1U);

  /* the next query tries again */
  upstream.d_fail = false;
  result = processor.process(makeDNSQuery("example.com", QType::A));
  BOOST_CHECK(result.outcome == QueryOutcome::CacheMiss);
  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 2U);
}

BOOST_AUTO_TEST_CASE(test_fallback)
{
  FilterContext context;
  FakeUpstream primary("primary");
  FakeUpstream fallback("fallback");
  FailoverResolver resolver(std::make_unique<FakeUpstreamProxy>(primary), std::make_unique<FakeUpstreamProxy>(fallback));
  QueryProcessor processor(context, resolver);

  primary.d_fail = true;
  auto result = processor.process(makeDNSQuery("example.net", QType::A));
  BOOST_CHECK(result.outcome == QueryOutcome::Fallback);
  BOOST_CHECK_EQUAL(primary.d_calls.load(), 1U);
  BOOST_CHECK_EQUAL(fallback.d_calls.load(), 1U);
  BOOST_CHECK(context.cache.get("example.net:1"));

  fallback.d_fail = true;
  result = processor.process(makeDNSQuery("example.org", QType::A));
  BOOST_CHECK(result.outcome == QueryOutcome::UpstreamFailure);
  BOOST_CHECK_EQUAL(primary.d_calls.load(), 2U);
  BOOST_CHECK_EQUAL(fallback.d_calls.load(), 2U);
  BOOST_CHECK(!context.cache.get("example.org:1"));

  primary.d_fail = false;
  result = processor.process(makeDNSQuery("example.org", QType::A));
  BOOST_CHECK(result.outcome == QueryOutcome::CacheMiss);
  BOOST_CHECK_EQUAL(fallback.d_calls.load(), 2U);
}

BOOST_AUTO_TEST_CASE(test_failover_without_fallback)
{
  FakeUpstream primary;
  primary.d_fail = true;
  FailoverResolver resolver(std::make_unique<FakeUpstreamProxy>(primary), nullptr);
  BOOST_CHECK_THROW(resolver.resolve(makeDNSQuery("example.com", QType::A)), UpstreamException);
  BOOST_CHECK_THROW(FailoverResolver(nullptr, nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_deferred_cache_write)
{
  FilterContext context;
  FakeUpstream upstream;
  std::vector<DeferredTask> pending;
  QueryProcessor processor(context, upstream, QueryProcessorOptions(), [&pending](DeferredTask task) {
    pending.push_back(std::move(task));
  });

  auto query = makeDNSQuery("example.com", QType::A);
  auto result = processor.process(query);
  BOOST_CHECK(result.outcome == QueryOutcome::CacheMiss);
  /* the answer is already there, the cache write is not */
  BOOST_CHECK(!result.response.empty());
  BOOST_REQUIRE_EQUAL(pending.size(), 1U);
  BOOST_CHECK_EQUAL(context.cache.getSize(), 0U);

  for (const auto& task : pending) {
    runDeferredTask(task);
  }
  pending.clear();

  result = processor.process(query);
  BOOST_CHECK(result.outcome == QueryOutcome::CacheHit);
  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 1U);
  BOOST_CHECK(pending.empty());
}

BOOST_AUTO_TEST_CASE(test_work_queue_cache_write)
{
  FilterContext context(10);
  FakeUpstream upstream;
  DeferredWorkQueue queue;
  QueryProcessor processor(context, upstream, QueryProcessorOptions(), queue.getRunner());

  for (size_t idx = 0; idx < 20; ++idx) {
    processor.process(makeDNSQuery("host" + std::to_string(idx) + ".example", QType::A));
  }
  queue.drain();

  BOOST_CHECK_EQUAL(context.cache.getSize(), 10U);
  BOOST_CHECK(context.cache.get("host19.example:1"));
  BOOST_CHECK(!context.cache.get("host0.example:1"));
}

BOOST_AUTO_TEST_CASE(test_outcome_names)
{
  BOOST_CHECK_EQUAL(outcomeToString(QueryOutcome::CacheHit), "HIT");
  BOOST_CHECK_EQUAL(outcomeToString(QueryOutcome::CacheMiss), "MISS");
  BOOST_CHECK_EQUAL(outcomeToString(QueryOutcome::Fallback), "FALLBACK");
  BOOST_CHECK_EQUAL(outcomeToString(QueryOutcome::Bypass), "BYPASS");
}

BOOST_AUTO_TEST_SUITE_END()
