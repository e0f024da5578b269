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
#include <stdexcept>

#include "upstream.hh"
#include "doh-client.hh"
#include "dohguardexception.hh"
#include "dolog.hh"

namespace dohguard
{
UpstreamAnswer DoHUpstream::resolve(const PacketBuffer& query)
{
  /* curl handles are not shareable between threads, and queries
     are processed concurrently */
  DoHClient client;
  DoHClient::Headers headers{
    {"Content-Type", s_dnsMessageContentType},
    {"Accept", s_dnsMessageContentType}};

  auto reply = client.postURL(d_url, std::string(query.begin(), query.end()), headers, d_timeout, d_verifyTLS);
  if (reply.status < 200 || reply.status > 299) {
    throw UpstreamException("Upstream " + d_url + " answered with HTTP status " + std::to_string(reply.status));
  }
  if (reply.body.size() < s_dnsHeaderSize) {
    throw UpstreamException("Upstream " + d_url + " returned a truncated DNS message (" + std::to_string(reply.body.size()) + " bytes)");
  }

  UpstreamAnswer answer;
  answer.response.assign(reply.body.begin(), reply.body.end());
  return answer;
}

FailoverResolver::FailoverResolver(std::unique_ptr<UpstreamResolver> primary, std::unique_ptr<UpstreamResolver> fallback) :
  d_primary(std::move(primary)), d_fallback(std::move(fallback))
{
  if (!d_primary) {
    throw std::invalid_argument("A primary upstream resolver is required");
  }
}

std::string FailoverResolver::getName() const
{
  if (d_fallback) {
    return d_primary->getName() + " (fallback " + d_fallback->getName() + ")";
  }
  return d_primary->getName();
}

UpstreamAnswer FailoverResolver::resolve(const PacketBuffer& query)
{
  std::string primaryError;
  try {
    auto answer = d_primary->resolve(query);
    answer.fromFallback = false;
    return answer;
  }
  catch (const DohGuardException& e) {
    primaryError = e.reason;
  }
  catch (const std::exception& e) {
    primaryError = e.what();
  }

  if (!d_fallback) {
    throw UpstreamException("Upstream " + d_primary->getName() + " failed: " + primaryError);
  }

  warnlog("Upstream %s failed (%s), retrying with %s", d_primary->getName(), primaryError, d_fallback->getName());

  try {
    auto answer = d_fallback->resolve(query);
    answer.fromFallback = true;
    return answer;
  }
  catch (const DohGuardException& e) {
    throw UpstreamException("All upstreams failed: " + primaryError + ", then " + e.reason);
  }
  catch (const std::exception& e) {
    throw UpstreamException("All upstreams failed: " + primaryError + ", then " + e.what());
  }
}

std::unique_ptr<UpstreamResolver> makeUpstreamResolver(const std::string& primaryURL, const std::string& fallbackURL, int timeout)
{
  auto primary = std::make_unique<DoHUpstream>(primaryURL, timeout);
  std::unique_ptr<UpstreamResolver> fallback;
  if (!fallbackURL.empty()) {
    fallback = std::make_unique<DoHUpstream>(fallbackURL, timeout);
  }
  return std::make_unique<FailoverResolver>(std::move(primary), std::move(fallback));
}
}
