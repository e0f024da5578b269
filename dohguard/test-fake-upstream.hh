#pragma once
#include <atomic>
#include <stdexcept>
#include <string>

#include "dns.hh"
#include "dohguardexception.hh"
#include "upstream.hh"

namespace dohguard
{
/* Answers every query with one A record pointing to 192.0.2.1,
   or throws when told to fail. */
class FakeUpstream : public UpstreamResolver
{
public:
  FakeUpstream(std::string name = "fake") :
    d_name(std::move(name))
  {
  }

  UpstreamAnswer resolve(const PacketBuffer& query) override
  {
    ++d_calls;
    if (d_fail) {
      throw UpstreamException(d_name + " is down");
    }

    UpstreamAnswer answer;
    answer.response = query;
    if (answer.response.size() < s_dnsHeaderSize) {
      answer.response.resize(s_dnsHeaderSize);
    }
    answer.response.at(DNSHeaderOffsets::flags1) |= DNSFlags::QR;
    answer.response.at(DNSHeaderOffsets::flags2) |= DNSFlags::RA;
    writeUInt16(answer.response, DNSHeaderOffsets::ancount, 1);
    /* pointer to the question name, A, IN, TTL 60, 192.0.2.1 */
    const PacketBuffer record{0xC0, 0x0C, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x3C, 0x00, 0x04, 192, 0, 2, 1};
    answer.response.insert(answer.response.end(), record.begin(), record.end());
    return answer;
  }

  std::string getName() const override
  {
    return d_name;
  }

  std::atomic<size_t> d_calls{0};
  std::atomic<bool> d_fail{false};

private:
  const std::string d_name;
};

/* Forwards to a FakeUpstream it does not own, so that a test can keep
   an eye on it once the FailoverResolver has taken ownership. */
class FakeUpstreamProxy : public UpstreamResolver
{
public:
  explicit FakeUpstreamProxy(FakeUpstream& upstream) :
    d_upstream(upstream)
  {
  }

  UpstreamAnswer resolve(const PacketBuffer& query) override
  {
    return d_upstream.resolve(query);
  }

  std::string getName() const override
  {
    return d_upstream.getName();
  }

private:
  FakeUpstream& d_upstream;
};
}
