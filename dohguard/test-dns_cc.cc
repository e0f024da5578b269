#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <stdexcept>
#include <boost/test/unit_test.hpp>

#include "dns.hh"
#include "dnswriter.hh"

using namespace dohguard;

BOOST_AUTO_TEST_SUITE(test_dns_cc)

BOOST_AUTO_TEST_CASE(test_qtypes)
{
  BOOST_CHECK_EQUAL(QType::chartocode("A"), QType::A);
  BOOST_CHECK_EQUAL(QType::chartocode("aaaa"), QType::AAAA);
  BOOST_CHECK_EQUAL(QType::chartocode("Https"), QType::HTTPS);
  BOOST_CHECK_EQUAL(QType::chartocode("64"), 64);
  BOOST_CHECK_EQUAL(QType::chartocode("65536"), 0);
  BOOST_CHECK_EQUAL(QType::chartocode("BOGUS"), 0);

  BOOST_CHECK_EQUAL(QType::toString(QType::MX), "MX");
  BOOST_CHECK_EQUAL(QType::toString(64), "TYPE64");
  BOOST_CHECK_EQUAL(RCode::to_s(RCode::NXDomain), "Non-Existent domain");
  BOOST_CHECK_EQUAL(RCode::to_s(11), "Err#11");
}

BOOST_AUTO_TEST_CASE(test_make_query)
{
  auto query = makeDNSQuery("www.example.com.", QType::AAAA, 0xbeef);
  const PacketBuffer expected{
    0xbe, 0xef, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    3, 'w', 'w', 'w', 7, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 3, 'c', 'o', 'm', 0,
    0x00, 0x1c, 0x00, 0x01};
  BOOST_CHECK(query == expected);

  query = makeDNSQuery("example.com", QType::A, 0, false);
  BOOST_CHECK_EQUAL(query.at(DNSHeaderOffsets::flags1), 0);

  /* the root */
  query = makeDNSQuery(".", QType::NS);
  BOOST_CHECK_EQUAL(query.size(), s_dnsHeaderSize + 5);
}

BOOST_AUTO_TEST_CASE(test_invalid_names)
{
  BOOST_CHECK_THROW(makeDNSQuery("a..example", QType::A), std::range_error);
  BOOST_CHECK_THROW(makeDNSQuery(std::string(64, 'a') + ".example", QType::A), std::range_error);
  std::string tooLong;
  for (size_t idx = 0; idx < 30; ++idx) {
    tooLong += "abcdefghi.";
  }
  BOOST_CHECK_THROW(makeDNSQuery(tooLong + "com", QType::A), std::range_error);
}

BOOST_AUTO_TEST_SUITE_END()
