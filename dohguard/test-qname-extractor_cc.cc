#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <string>
#include <boost/test/unit_test.hpp>

#include "dnswriter.hh"
#include "qname-extractor.hh"

using namespace dohguard;

static void appendLabel(PacketBuffer& packet, const std::string& label)
{
  packet.push_back(static_cast<uint8_t>(label.size()));
  packet.insert(packet.end(), label.begin(), label.end());
}

static PacketBuffer makeHeader()
{
  PacketBuffer packet(s_dnsHeaderSize, 0);
  writeUInt16(packet, DNSHeaderOffsets::id, 0x4242);
  writeUInt16(packet, DNSHeaderOffsets::qdcount, 1);
  return packet;
}

BOOST_AUTO_TEST_SUITE(test_qname_extractor_cc)

BOOST_AUTO_TEST_CASE(test_too_short)
{
  PacketBuffer packet(11, 0);
  auto question = extractQuestion(packet);
  BOOST_CHECK(question.qname.empty());
  BOOST_CHECK_EQUAL(question.qtype, QType::A);

  question = extractQuestion(PacketBuffer());
  BOOST_CHECK(question.qname.empty());
}

BOOST_AUTO_TEST_CASE(test_header_only)
{
  auto question = extractQuestion(makeHeader());
  BOOST_CHECK(question.qname.empty());
  BOOST_CHECK_EQUAL(question.qtype, QType::A);
}

BOOST_AUTO_TEST_CASE(test_simple_question)
{
  auto query = makeDNSQuery("www.PowerDNS.COM", QType::AAAA, 42);
  auto question = extractQuestion(query);
  BOOST_CHECK_EQUAL(question.qname, "www.powerdns.com");
  BOOST_CHECK_EQUAL(question.qtype, QType::AAAA);

  question = extractQuestion(makeDNSQuery("doubleclick.net.", QType::HTTPS));
  BOOST_CHECK_EQUAL(question.qname, "doubleclick.net");
  BOOST_CHECK_EQUAL(question.qtype, QType::HTTPS);
}

BOOST_AUTO_TEST_CASE(test_compressed_question)
{
  /* "www" followed by a pointer to "example.com", stored after the question */
  auto packet = makeHeader();
  appendLabel(packet, "www");
  const size_t pointerPos = packet.size();
  packet.push_back(0xC0);
  packet.push_back(0x00);
  packet.push_back(0x00);
  packet.push_back(QType::AAAA);
  packet.push_back(0x00);
  packet.push_back(0x01);
  const size_t target = packet.size();
  appendLabel(packet, "example");
  appendLabel(packet, "com");
  packet.push_back(0);
  packet.at(pointerPos + 1) = static_cast<uint8_t>(target);

  auto compressed = extractQuestion(packet);
  auto plain = extractQuestion(makeDNSQuery("www.example.com", QType::AAAA));
  BOOST_CHECK_EQUAL(compressed.qname, "www.example.com");
  BOOST_CHECK_EQUAL(compressed.qname, plain.qname);
  /* the type is read right after the pointer, not after the pointed-to name */
  BOOST_CHECK_EQUAL(compressed.qtype, QType::AAAA);
  BOOST_CHECK_EQUAL(compressed.qtype, plain.qtype);
}

BOOST_AUTO_TEST_CASE(test_chained_pointers)
{
  /* question: pointer -> "ads" + pointer -> "example.com" */
  auto packet = makeHeader();
  packet.push_back(0xC0);
  packet.push_back(0x00);
  packet.push_back(0x00);
  packet.push_back(QType::TXT);
  packet.push_back(0x00);
  packet.push_back(0x01);
  const size_t second = packet.size();
  appendLabel(packet, "example");
  appendLabel(packet, "com");
  packet.push_back(0);
  const size_t first = packet.size();
  appendLabel(packet, "ads");
  packet.push_back(0xC0);
  packet.push_back(static_cast<uint8_t>(second));
  packet.at(13) = static_cast<uint8_t>(first);

  auto question = extractQuestion(packet);
  BOOST_CHECK_EQUAL(question.qname, "ads.example.com");
  BOOST_CHECK_EQUAL(question.qtype, QType::TXT);
}

BOOST_AUTO_TEST_CASE(test_self_referencing_pointer)
{
  auto packet = makeHeader();
  packet.push_back(0xC0);
  packet.push_back(0x0C);
  packet.push_back(0x00);
  packet.push_back(QType::AAAA);

  auto question = extractQuestion(packet);
  BOOST_CHECK(question.qname.empty());
  BOOST_CHECK_EQUAL(question.qtype, QType::A);
}

BOOST_AUTO_TEST_CASE(test_pointer_loop_keeps_partial_name)
{
  /* "abc" then a pointer back to the start of the question */
  auto packet = makeHeader();
  appendLabel(packet, "abc");
  packet.push_back(0xC0);
  packet.push_back(0x0C);

  auto question = extractQuestion(packet);
  std::string expected = "abc";
  for (unsigned int idx = 0; idx < s_maxCompressionJumps; ++idx) {
    expected += ".abc";
  }
  BOOST_CHECK_EQUAL(question.qname, expected);
  BOOST_CHECK_EQUAL(question.qtype, QType::A);
}

BOOST_AUTO_TEST_CASE(test_invalid_label_length)
{
  auto packet = makeHeader();
  appendLabel(packet, "abc");
  packet.push_back(0x40);
  packet.push_back('x');
  packet.push_back(0);
  packet.push_back(0x00);
  packet.push_back(QType::AAAA);

  auto question = extractQuestion(packet);
  BOOST_CHECK_EQUAL(question.qname, "abc");
  BOOST_CHECK_EQUAL(question.qtype, QType::A);

  packet = makeHeader();
  packet.push_back(0x80);
  question = extractQuestion(packet);
  BOOST_CHECK(question.qname.empty());
}

BOOST_AUTO_TEST_CASE(test_truncated)
{
  /* label running past the end of the message */
  auto packet = makeHeader();
  appendLabel(packet, "example");
  packet.push_back(10);
  packet.push_back('c');
  auto question = extractQuestion(packet);
  BOOST_CHECK_EQUAL(question.qname, "example");
  BOOST_CHECK_EQUAL(question.qtype, QType::A);

  /* complete name, missing type */
  packet = makeHeader();
  appendLabel(packet, "example");
  appendLabel(packet, "com");
  packet.push_back(0);
  packet.push_back(0);
  question = extractQuestion(packet);
  BOOST_CHECK_EQUAL(question.qname, "example.com");
  BOOST_CHECK_EQUAL(question.qtype, QType::A);

  /* pointer cut in half */
  packet = makeHeader();
  appendLabel(packet, "www");
  packet.push_back(0xC0);
  question = extractQuestion(packet);
  BOOST_CHECK_EQUAL(question.qname, "www");
}

BOOST_AUTO_TEST_CASE(test_pointer_out_of_bounds)
{
  auto packet = makeHeader();
  appendLabel(packet, "www");
  packet.push_back(0xFF);
  packet.push_back(0xFF);
  packet.push_back(0x00);
  packet.push_back(QType::AAAA);

  auto question = extractQuestion(packet);
  BOOST_CHECK_EQUAL(question.qname, "www");
  BOOST_CHECK_EQUAL(question.qtype, QType::A);
}

BOOST_AUTO_TEST_CASE(test_raw_bytes_are_kept)
{
  auto packet = makeHeader();
  appendLabel(packet, std::string("a_b-C\xe9", 6));
  packet.push_back(0);
  packet.push_back(0x00);
  packet.push_back(QType::A);

  auto question = extractQuestion(packet);
  BOOST_CHECK_EQUAL(question.qname, std::string("a_b-c\xe9", 6));
}

BOOST_AUTO_TEST_SUITE_END()
