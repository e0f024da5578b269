#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <boost/test/unit_test.hpp>

#include "base64.hh"
#include "dnswriter.hh"

using namespace dohguard;

BOOST_AUTO_TEST_SUITE(test_base64_cc)

BOOST_AUTO_TEST_CASE(test_Base64_Roundtrip)
{
  std::string before("Some Random String"), after;
  std::string encoded = Base64Encode(before);
  BOOST_CHECK_EQUAL(encoded, "U29tZSBSYW5kb20gU3RyaW5n");
  BOOST_CHECK_EQUAL(B64Decode(encoded, after), 0);
  BOOST_CHECK_EQUAL(before, after);
}

BOOST_AUTO_TEST_CASE(test_Base64Url_Decode)
{
  /* "+/8=" in the standard alphabet */
  BOOST_CHECK_EQUAL(base64UrlDecode("-_8"), std::string("\xfb\xff", 2));
  BOOST_CHECK_EQUAL(base64UrlDecode("-_8="), std::string("\xfb\xff", 2));
  BOOST_CHECK_EQUAL(base64UrlDecode("Zm9v"), "foo");
  BOOST_CHECK_EQUAL(base64UrlDecode("Zm8"), "fo");
  BOOST_CHECK_EQUAL(base64UrlDecode("Zg"), "f");
}

BOOST_AUTO_TEST_CASE(test_Base64Url_Invalid)
{
  BOOST_CHECK(base64UrlDecode("").empty());
  BOOST_CHECK(base64UrlDecode("Z").empty());
  BOOST_CHECK(base64UrlDecode("Zm9v!").empty());
  BOOST_CHECK(base64UrlDecode("Zm 9v").empty());
  /* padding is only accepted at the very end */
  BOOST_CHECK(base64UrlDecode("AAAA=!!!garbage").empty());
  BOOST_CHECK(base64UrlDecode("Zg=Zg").empty());
  BOOST_CHECK(base64UrlDecode("Zg=a=").empty());
  BOOST_CHECK_EQUAL(base64UrlDecode("Zg=="), "f");
}

BOOST_AUTO_TEST_CASE(test_Base64Url_Query)
{
  /* the RFC 8484 example: www.example.com IN A, ID 0 */
  const std::string rfcExample{"AAABAAABAAAAAAAAA3d3dwdleGFtcGxlA2NvbQAAAQAB"};
  auto query = makeDNSQuery("www.example.com", QType::A, 0);
  std::string raw(query.begin(), query.end());

  BOOST_CHECK_EQUAL(base64UrlEncode(raw), rfcExample);
  BOOST_CHECK(base64UrlDecode(rfcExample) == raw);
  BOOST_CHECK_EQUAL(base64UrlEncode(std::string("\xfb\xff", 2)), "-_8");
}

BOOST_AUTO_TEST_SUITE_END()
