#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <boost/algorithm/string.hpp>
#include <boost/test/unit_test.hpp>

#include "base64.hh"
#include "dnswriter.hh"
#include "doh-frontend.hh"
#include "qname-extractor.hh"
#include "test-fake-upstream.hh"

using namespace dohguard;

struct FrontendFixture
{
  FrontendFixture() :
    processor(context, upstream), frontend(processor, context)
  {
    context.rules.blocklist.add("doubleclick.net");
  }

  static DoHRequest makeGET(const std::string& qname, uint16_t qtype)
  {
    auto query = makeDNSQuery(qname, qtype);
    DoHRequest request;
    request.method = "GET";
    request.path = s_dohPath;
    request.getvars["dns"] = base64UrlEncode(std::string(query.begin(), query.end()));
    return request;
  }

  static DoHRequest makePOST(const std::string& qname, uint16_t qtype)
  {
    auto query = makeDNSQuery(qname, qtype, 0x4242);
    DoHRequest request;
    request.method = "POST";
    request.path = s_dohPath;
    request.headers["content-type"] = s_dnsMessageContentType;
    request.body.assign(query.begin(), query.end());
    return request;
  }

  FilterContext context;
  FakeUpstream upstream;
  QueryProcessor processor;
  DoHFrontend frontend;
};

BOOST_FIXTURE_TEST_SUITE(test_doh_frontend_cc, FrontendFixture)

BOOST_AUTO_TEST_CASE(test_get_query)
{
  auto response = frontend.handle(makeGET("example.com", QType::A));
  BOOST_CHECK_EQUAL(response.status, 200);
  BOOST_CHECK_EQUAL(response.headers["Content-Type"], s_dnsMessageContentType);
  BOOST_CHECK_EQUAL(response.headers["X-Cache"], "MISS");
  BOOST_CHECK_EQUAL(response.headers["Cache-Control"], "max-age=300");
  BOOST_CHECK_EQUAL(response.headers["Access-Control-Allow-Origin"], "*");

  PacketBuffer answer(response.body.begin(), response.body.end());
  BOOST_CHECK_EQUAL(readUInt16(answer, DNSHeaderOffsets::ancount), 1U);
  BOOST_CHECK_EQUAL(extractQuestion(answer).qname, "example.com");

  response = frontend.handle(makeGET("example.com", QType::A));
  BOOST_CHECK_EQUAL(response.headers["X-Cache"], "HIT");
  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 1U);
}

BOOST_AUTO_TEST_CASE(test_padded_get_query)
{
  auto request = makeGET("example.com", QType::AAAA);
  /* the same query with its padding */
  request.getvars["dns"] = Base64Encode(base64UrlDecode(request.getvars["dns"]));
  BOOST_REQUIRE(boost::ends_with(request.getvars["dns"], "="));

  auto response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 200);
  BOOST_CHECK_EQUAL(response.headers["X-Cache"], "MISS");
  BOOST_CHECK(context.cache.get("example.com:28"));
}

BOOST_AUTO_TEST_CASE(test_post_blocked_query)
{
  auto response = frontend.handle(makePOST("stats.doubleclick.net", QType::A));
  BOOST_CHECK_EQUAL(response.status, 200);
  BOOST_CHECK_EQUAL(response.headers["X-Blocked-Domain"], "stats.doubleclick.net");
  BOOST_CHECK_EQUAL(response.headers["Cache-Control"], "max-age=300");
  BOOST_CHECK(response.headers.count("X-Cache") == 0);

  PacketBuffer answer(response.body.begin(), response.body.end());
  BOOST_CHECK_EQUAL(readUInt16(answer, DNSHeaderOffsets::id), 0x4242);
  BOOST_CHECK_EQUAL(answer.at(DNSHeaderOffsets::flags2) & DNSFlags::RCodeMask, RCode::NXDomain);
  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 0U);
}

BOOST_AUTO_TEST_CASE(test_unsupported_content_type)
{
  auto request = makePOST("example.com", QType::A);
  request.headers["Content-Type"] = "application/json";
  auto response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 415);
  BOOST_CHECK_EQUAL(upstream.d_calls.load(), 0U);
  BOOST_CHECK_EQUAL(context.stats.snapshot().totalQueries, 0U);
}

BOOST_AUTO_TEST_CASE(test_unsupported_method)
{
  auto request = makePOST("example.com", QType::A);
  request.method = "PUT";
  auto response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 405);
  BOOST_CHECK_EQUAL(response.headers["Allow"], "GET, POST, OPTIONS");
}

BOOST_AUTO_TEST_CASE(test_preflight)
{
  DoHRequest request;
  request.method = "OPTIONS";
  request.path = s_dohPath;
  auto response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 204);
  BOOST_CHECK(response.body.empty());
  BOOST_CHECK_EQUAL(response.headers["Access-Control-Allow-Origin"], "*");
  BOOST_CHECK_EQUAL(response.headers["Access-Control-Allow-Methods"], "GET, POST, OPTIONS");
  BOOST_CHECK_EQUAL(response.headers["Access-Control-Allow-Headers"], "Content-Type");
}

BOOST_AUTO_TEST_CASE(test_upstream_failure)
{
  upstream.d_fail = true;
  auto response = frontend.handle(makePOST("example.com", QType::A));
  BOOST_CHECK_EQUAL(response.status, 502);
  BOOST_CHECK_EQUAL(context.stats.snapshot().upstreamFailures, 1U);
}

BOOST_AUTO_TEST_CASE(test_lists)
{
  DoHRequest request;
  request.method = "POST";
  request.path = "/blocklist";
  request.body = "# some trackers\nads.example.com\ntracker.example.org, doubleclick.net\n";
  auto response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 200);
  BOOST_CHECK_EQUAL(response.body, "added 2\n");

  request.method = "GET";
  response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.body, "doubleclick.net\nads.example.com\ntracker.example.org\n");

  response = frontend.handle(makeGET("www.ads.example.com", QType::A));
  BOOST_CHECK_EQUAL(response.headers["X-Blocked-Domain"], "www.ads.example.com");

  request.method = "POST";
  request.path = "/allowlist";
  request.body = "ads.example.com";
  response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.body, "added 1\n");
  response = frontend.handle(makeGET("www.ads.example.com", QType::A));
  BOOST_CHECK_EQUAL(response.headers["X-Cache"], "MISS");
}

BOOST_AUTO_TEST_CASE(test_patterns)
{
  DoHRequest request;
  request.method = "POST";
  request.path = "/patterns";
  request.body = R"(^metrics\.)";
  auto response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 200);
  BOOST_CHECK_EQUAL(response.body, "added 1\n");

  request.body = "(broken";
  response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 400);
  BOOST_CHECK_EQUAL(context.rules.patterns.size(), 1U);

  request.method = "GET";
  response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.body, "^metrics\\.\n");

  response = frontend.handle(makeGET("metrics.example.com", QType::A));
  BOOST_CHECK_EQUAL(response.headers["X-Blocked-Domain"], "metrics.example.com");
}

BOOST_AUTO_TEST_CASE(test_patterns_all_or_nothing)
{
  DoHRequest request;
  request.method = "POST";
  request.path = "/patterns";
  request.body = "^good\\.\n(bad\n";
  auto response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 400);
  BOOST_CHECK_EQUAL(context.rules.patterns.size(), 0U);

  response = frontend.handle(makeGET("good.example.com", QType::A));
  BOOST_CHECK(response.headers.count("X-Blocked-Domain") == 0);

  request.body = "^good\\.\n^better\\.\n";
  response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 200);
  BOOST_CHECK_EQUAL(response.body, "added 2\n");
  BOOST_CHECK_EQUAL(context.rules.patterns.size(), 2U);
}

BOOST_AUTO_TEST_CASE(test_stats_and_banner)
{
  frontend.handle(makeGET("doubleclick.net", QType::A));
  frontend.handle(makeGET("example.com", QType::A));

  DoHRequest request;
  request.method = "GET";
  request.path = "/stats";
  auto response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 200);
  BOOST_CHECK(response.body.find("total-queries      2\n") != std::string::npos);
  BOOST_CHECK(response.body.find("block-rate         50.00%\n") != std::string::npos);
  BOOST_CHECK(response.body.find("doubleclick.net") != std::string::npos);

  request.path = "/";
  response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 200);
  BOOST_CHECK_EQUAL(response.body, "DNS Ad Blocker Active");

  request.path = "/nowhere";
  response = frontend.handle(request);
  BOOST_CHECK_EQUAL(response.status, 404);
}

BOOST_AUTO_TEST_SUITE_END()
