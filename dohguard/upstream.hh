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
#pragma once
#include <memory>
#include <string>

#include "dns.hh"

namespace dohguard
{
struct UpstreamAnswer
{
  PacketBuffer response;
  //! set when the primary resolver failed and the answer came from the fallback
  bool fromFallback{false};
};

/* Forwards a raw wire-format query somewhere and returns the raw answer.
   Implementations throw (DohGuardException or std::exception) when no
   usable answer could be obtained, they never return an empty answer. */
class UpstreamResolver
{
public:
  virtual ~UpstreamResolver() = default;
  virtual UpstreamAnswer resolve(const PacketBuffer& query) = 0;
  virtual std::string getName() const = 0;
};

/* RFC 8484 POST to a single DoH endpoint */
class DoHUpstream : public UpstreamResolver
{
public:
  DoHUpstream(std::string url, int timeout, bool verifyTLS = true) :
    d_url(std::move(url)), d_timeout(timeout), d_verifyTLS(verifyTLS)
  {
  }

  UpstreamAnswer resolve(const PacketBuffer& query) override;
  std::string getName() const override
  {
    return d_url;
  }

private:
  const std::string d_url;
  const int d_timeout;
  const bool d_verifyTLS;
};

/* Asks the primary resolver, and the fallback once if the primary failed. */
class FailoverResolver : public UpstreamResolver
{
public:
  FailoverResolver(std::unique_ptr<UpstreamResolver> primary, std::unique_ptr<UpstreamResolver> fallback);

  UpstreamAnswer resolve(const PacketBuffer& query) override;
  std::string getName() const override;

private:
  std::unique_ptr<UpstreamResolver> d_primary;
  std::unique_ptr<UpstreamResolver> d_fallback;
};

/* builds a DoHUpstream for primaryURL, wrapped in a FailoverResolver when
   fallbackURL is not empty */
std::unique_ptr<UpstreamResolver> makeUpstreamResolver(const std::string& primaryURL, const std::string& fallbackURL, int timeout);

static const std::string s_dnsMessageContentType{"application/dns-message"};
}
