#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <stdexcept>
#include <thread>
#include <vector>
#include <boost/test/unit_test.hpp>

#include "dnswriter.hh"
#include "resolution-cache.hh"

using namespace dohguard;

BOOST_AUTO_TEST_SUITE(test_resolution_cache_cc)

BOOST_AUTO_TEST_CASE(test_cache_keys)
{
  BOOST_CHECK_EQUAL(makeCacheKey("example.com", QType::A), "example.com:1");
  BOOST_CHECK_EQUAL(makeCacheKey("example.com", QType::AAAA), "example.com:28");
  BOOST_CHECK_EQUAL(makeCacheKey("example.com", QType::A, QueryFormat::JSON), "json:example.com:1");
  BOOST_CHECK_NE(makeCacheKey("example.com", QType::A), makeCacheKey("example.com", QType::AAAA));
  BOOST_CHECK_NE(makeCacheKey("example.com", QType::A), makeCacheKey("example.com", QType::A, QueryFormat::JSON));
}

BOOST_AUTO_TEST_CASE(test_invalid_sizes)
{
  BOOST_CHECK_THROW(ResolutionCache(10, 0), std::invalid_argument);
  BOOST_CHECK_THROW(ResolutionCache(2, 4), std::invalid_argument);
  BOOST_CHECK_NO_THROW(ResolutionCache(4, 4));
}

BOOST_AUTO_TEST_CASE(test_insert_get)
{
  ResolutionCache cache(10);
  const time_t now = 1000;
  auto response = makeDNSQuery("example.com", QType::A, 1);

  BOOST_CHECK(!cache.get("example.com:1", now));
  cache.insert("example.com:1", response, 300, now);
  BOOST_CHECK_EQUAL(cache.getSize(), 1U);

  auto found = cache.get("example.com:1", now);
  BOOST_REQUIRE(found);
  BOOST_CHECK(*found == response);
  BOOST_CHECK(!cache.get("example.com:28", now));

  BOOST_CHECK_EQUAL(cache.getHits(), 1U);
  BOOST_CHECK_EQUAL(cache.getMisses(), 2U);
}

BOOST_AUTO_TEST_CASE(test_oldest_insertion_is_evicted)
{
  const size_t maxEntries = 50;
  ResolutionCache cache(maxEntries);
  const time_t now = 1000;
  PacketBuffer value{0x42};

  for (size_t idx = 0; idx <= maxEntries; ++idx) {
    cache.insert("key" + std::to_string(idx), value, 300, now);
  }

  BOOST_CHECK_EQUAL(cache.getSize(), maxEntries);
  BOOST_CHECK_EQUAL(cache.getEvictions(), 1U);
  BOOST_CHECK(!cache.get("key0", now));
  for (size_t idx = 1; idx <= maxEntries; ++idx) {
    BOOST_CHECK(cache.get("key" + std::to_string(idx), now));
  }
}

BOOST_AUTO_TEST_CASE(test_reads_do_not_reorder)
{
  ResolutionCache cache(2);
  const time_t now = 1000;
  PacketBuffer value{0x01};

  cache.insert("a", value, 300, now);
  cache.insert("b", value, 300, now);
  /* reading "a" does not protect it from eviction */
  BOOST_CHECK(cache.get("a", now));
  cache.insert("c", value, 300, now);

  BOOST_CHECK(!cache.get("a", now));
  BOOST_CHECK(cache.get("b", now));
  BOOST_CHECK(cache.get("c", now));
}

BOOST_AUTO_TEST_CASE(test_update_in_place)
{
  ResolutionCache cache(2);
  const time_t now = 1000;

  cache.insert("a", PacketBuffer{0x01}, 300, now);
  cache.insert("b", PacketBuffer{0x02}, 300, now);
  cache.insert("a", PacketBuffer{0x03}, 300, now);
  BOOST_CHECK_EQUAL(cache.getSize(), 2U);
  BOOST_CHECK_EQUAL(cache.getEvictions(), 0U);

  auto found = cache.get("a", now);
  BOOST_REQUIRE(found);
  BOOST_CHECK(*found == PacketBuffer{0x03});

  /* "a" kept its original position, so it goes first */
  cache.insert("c", PacketBuffer{0x04}, 300, now);
  BOOST_CHECK(!cache.get("a", now));
  BOOST_CHECK(cache.get("b", now));
}

BOOST_AUTO_TEST_CASE(test_expiry)
{
  ResolutionCache cache(10);
  const time_t now = 1000;
  const uint32_t ttl = 10;

  cache.insert("example.com:1", PacketBuffer{0x01}, ttl, now);
  BOOST_CHECK(cache.get("example.com:1", now + ttl - 1));
  BOOST_CHECK(!cache.get("example.com:1", now + ttl));
  /* removed on lookup */
  BOOST_CHECK_EQUAL(cache.getSize(), 0U);
  BOOST_CHECK_EQUAL(cache.getExpired(), 1U);

  cache.insert("a", PacketBuffer{0x01}, 5, now);
  cache.insert("b", PacketBuffer{0x01}, 50, now);
  BOOST_CHECK_EQUAL(cache.purgeExpired(now + 10), 1U);
  BOOST_CHECK_EQUAL(cache.getSize(), 1U);
  BOOST_CHECK(cache.get("b", now + 10));

  /* the purged entry no longer takes room */
  cache.insert("c", PacketBuffer{0x01}, 50, now);
  BOOST_CHECK_EQUAL(cache.getSize(), 2U);
}

BOOST_AUTO_TEST_CASE(test_expunge)
{
  ResolutionCache cache(100, 4);
  for (size_t idx = 0; idx < 40; ++idx) {
    cache.insert("key" + std::to_string(idx), PacketBuffer{0x01}, 300);
  }
  BOOST_CHECK_EQUAL(cache.getSize(), 40U);
  BOOST_CHECK_EQUAL(cache.expunge(), 40U);
  BOOST_CHECK_EQUAL(cache.getSize(), 0U);
}

BOOST_AUTO_TEST_CASE(test_concurrent_access)
{
  const size_t maxEntries = 100;
  ResolutionCache cache(maxEntries, 4);
  std::vector<std::thread> threads;

  for (size_t thread = 0; thread < 4; ++thread) {
    threads.emplace_back([&cache, thread]() {
      for (size_t idx = 0; idx < 1000; ++idx) {
        auto key = "t" + std::to_string(thread) + "-" + std::to_string(idx);
        cache.insert(key, PacketBuffer{0x01, 0x02}, 300);
        auto found = cache.get(key);
        if (found) {
          BOOST_CHECK_EQUAL(found->size(), 2U);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  BOOST_CHECK_LE(cache.getSize(), maxEntries);
}

BOOST_AUTO_TEST_SUITE_END()
