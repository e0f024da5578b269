#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <boost/test/unit_test.hpp>

#include "blocked-response.hh"
#include "classifier.hh"
#include "dnswriter.hh"
#include "qname-extractor.hh"

using namespace dohguard;

BOOST_AUTO_TEST_SUITE(test_blocked_response_cc)

BOOST_AUTO_TEST_CASE(test_blocked_doubleclick)
{
  FilterRules rules;
  rules.blocklist.add("doubleclick.net");
  Classifier classifier(rules);

  auto query = makeDNSQuery("doubleclick.net", QType::A, 0x1234);
  auto question = extractQuestion(query);
  BOOST_REQUIRE(classifier.classify(question.qname) == Verdict::Block);

  auto response = makeBlockedResponse(query);
  BOOST_REQUIRE_GE(response.size(), query.size());

  BOOST_CHECK_EQUAL(readUInt16(response, DNSHeaderOffsets::id), 0x1234);
  BOOST_CHECK(response.at(DNSHeaderOffsets::flags1) & DNSFlags::QR);
  BOOST_CHECK(response.at(DNSHeaderOffsets::flags1) & DNSFlags::RD);
  BOOST_CHECK(response.at(DNSHeaderOffsets::flags2) & DNSFlags::RA);
  BOOST_CHECK_EQUAL(response.at(DNSHeaderOffsets::flags2) & DNSFlags::RCodeMask, RCode::NXDomain);
  BOOST_CHECK_EQUAL(readUInt16(response, DNSHeaderOffsets::qdcount), 1U);
  BOOST_CHECK_EQUAL(readUInt16(response, DNSHeaderOffsets::ancount), 0U);

  /* the question is echoed */
  BOOST_CHECK(std::equal(query.begin() + s_dnsHeaderSize, query.end(), response.begin() + s_dnsHeaderSize));
  auto echoed = extractQuestion(response);
  BOOST_CHECK_EQUAL(echoed.qname, "doubleclick.net");
  BOOST_CHECK_EQUAL(echoed.qtype, QType::A);
}

BOOST_AUTO_TEST_CASE(test_nodata_policy)
{
  auto query = makeDNSQuery("ads.example.com", QType::AAAA, 7, false);
  auto response = makeBlockedResponse(query, BlockedResponsePolicy::NoData);

  BOOST_CHECK(response.at(DNSHeaderOffsets::flags1) & DNSFlags::QR);
  BOOST_CHECK(!(response.at(DNSHeaderOffsets::flags1) & DNSFlags::RD));
  BOOST_CHECK_EQUAL(response.at(DNSHeaderOffsets::flags2) & DNSFlags::RCodeMask, RCode::NoError);
  BOOST_CHECK_EQUAL(readUInt16(response, DNSHeaderOffsets::ancount), 0U);
}

BOOST_AUTO_TEST_CASE(test_counts_are_cleared)
{
  auto query = makeDNSQuery("example.com", QType::A, 99);
  writeUInt16(query, DNSHeaderOffsets::ancount, 3);
  writeUInt16(query, DNSHeaderOffsets::nscount, 2);
  writeUInt16(query, DNSHeaderOffsets::arcount, 1);
  query.at(DNSHeaderOffsets::flags1) |= DNSFlags::AA | DNSFlags::TC;

  auto response = makeBlockedResponse(query);
  BOOST_CHECK_EQUAL(readUInt16(response, DNSHeaderOffsets::ancount), 0U);
  BOOST_CHECK_EQUAL(readUInt16(response, DNSHeaderOffsets::nscount), 0U);
  BOOST_CHECK_EQUAL(readUInt16(response, DNSHeaderOffsets::arcount), 0U);
  BOOST_CHECK(!(response.at(DNSHeaderOffsets::flags1) & DNSFlags::AA));
  BOOST_CHECK(!(response.at(DNSHeaderOffsets::flags1) & DNSFlags::TC));
}

BOOST_AUTO_TEST_CASE(test_short_query)
{
  PacketBuffer query{0xab, 0xcd, 0x01, 0x00, 0x00};
  auto response = makeBlockedResponse(query);
  BOOST_REQUIRE_EQUAL(response.size(), s_dnsHeaderSize);
  BOOST_CHECK_EQUAL(readUInt16(response, DNSHeaderOffsets::id), 0xabcd);
  BOOST_CHECK(response.at(DNSHeaderOffsets::flags1) & DNSFlags::QR);
  BOOST_CHECK_EQUAL(response.at(DNSHeaderOffsets::flags2) & DNSFlags::RCodeMask, RCode::NXDomain);

  response = makeBlockedResponse(PacketBuffer());
  BOOST_CHECK_EQUAL(response.size(), s_dnsHeaderSize);
}

BOOST_AUTO_TEST_SUITE_END()
