#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <boost/test/unit_test.hpp>

#include "query-stats.hh"

using namespace dohguard;

BOOST_AUTO_TEST_SUITE(test_query_stats_cc)

BOOST_AUTO_TEST_CASE(test_empty)
{
  StatsTracker stats(1000);
  auto snap = stats.snapshot(1000);
  BOOST_CHECK_EQUAL(snap.totalQueries, 0U);
  BOOST_CHECK_EQUAL(snap.blockRateToString(), "0.00");
  BOOST_CHECK_EQUAL(snap.uptimeSeconds, 0U);
  BOOST_CHECK(snap.topBlocked.empty());
}

BOOST_AUTO_TEST_CASE(test_counters)
{
  StatsTracker stats(1000);
  for (size_t idx = 0; idx < 3; ++idx) {
    stats.recordTotal();
    stats.recordAllowed();
  }
  stats.recordTotal();
  stats.recordBlocked("doubleclick.net");
  stats.recordCacheHit();
  stats.recordCacheMiss();
  stats.recordCacheMiss();
  stats.recordUpstreamFailure();

  auto snap = stats.snapshot(1042);
  BOOST_CHECK_EQUAL(snap.totalQueries, 4U);
  BOOST_CHECK_EQUAL(snap.blockedQueries, 1U);
  BOOST_CHECK_EQUAL(snap.allowedQueries, 3U);
  BOOST_CHECK_EQUAL(snap.cacheHits, 1U);
  BOOST_CHECK_EQUAL(snap.cacheMisses, 2U);
  BOOST_CHECK_EQUAL(snap.upstreamFailures, 1U);
  BOOST_CHECK_EQUAL(snap.blockRateToString(), "25.00");
  BOOST_CHECK_EQUAL(snap.uptimeSeconds, 42U);

  stats.recordTotal();
  stats.recordTotal();
  BOOST_CHECK_EQUAL(stats.snapshot(1042).blockRateToString(), "16.67");
}

BOOST_AUTO_TEST_CASE(test_top_blocked)
{
  StatsTracker stats;
  for (size_t idx = 0; idx < 15; ++idx) {
    auto name = "ads" + std::to_string(idx) + ".example";
    for (size_t count = 0; count <= idx; ++count) {
      stats.recordBlocked(name);
    }
  }

  auto snap = stats.snapshot();
  BOOST_REQUIRE_EQUAL(snap.topBlocked.size(), StatsTracker::s_topReported);
  BOOST_CHECK_EQUAL(snap.topBlocked.at(0).first, "ads14.example");
  BOOST_CHECK_EQUAL(snap.topBlocked.at(0).second, 15U);
  BOOST_CHECK_EQUAL(snap.topBlocked.at(9).first, "ads5.example");
  for (size_t idx = 1; idx < snap.topBlocked.size(); ++idx) {
    BOOST_CHECK_GE(snap.topBlocked.at(idx - 1).second, snap.topBlocked.at(idx).second);
  }

  /* ties are ordered by name */
  StatsTracker ties;
  ties.recordBlocked("b.example");
  ties.recordBlocked("a.example");
  auto top = ties.getTopBlocked(2);
  BOOST_REQUIRE_EQUAL(top.size(), 2U);
  BOOST_CHECK_EQUAL(top.at(0).first, "a.example");
}

BOOST_AUTO_TEST_CASE(test_tracked_domains_are_bounded)
{
  StatsTracker stats;
  for (size_t count = 0; count < 3; ++count) {
    stats.recordBlocked("popular.example");
  }
  for (size_t idx = 0; idx < StatsTracker::s_maxTrackedDomains; ++idx) {
    stats.recordBlocked("rare" + std::to_string(idx) + ".example");
  }

  BOOST_CHECK_EQUAL(stats.getTrackedDomainsCount(), StatsTracker::s_maxTrackedDomains);
  auto top = stats.getTopBlocked(1);
  BOOST_REQUIRE_EQUAL(top.size(), 1U);
  BOOST_CHECK_EQUAL(top.at(0).first, "popular.example");
  BOOST_CHECK_EQUAL(top.at(0).second, 3U);

  for (size_t idx = 0; idx < 500; ++idx) {
    stats.recordBlocked("more" + std::to_string(idx) + ".example");
    BOOST_CHECK_LE(stats.getTrackedDomainsCount(), StatsTracker::s_maxTrackedDomains);
  }
  BOOST_CHECK_EQUAL(stats.getTopBlocked(1).at(0).first, "popular.example");
  BOOST_CHECK_EQUAL(stats.snapshot().blockedQueries, 603U);
}

BOOST_AUTO_TEST_SUITE_END()
