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
#include <memory>
#include <sstream>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "doh-frontend.hh"
#include "base64.hh"
#include "dohguardexception.hh"
#include "dolog.hh"

namespace dohguard
{
static DoHResponse makeTextResponse(int status, const std::string& body)
{
  DoHResponse response;
  response.status = status;
  response.headers["Content-Type"] = "text/plain; charset=utf-8";
  response.body = body;
  return response;
}

static std::vector<std::string> splitEntries(const std::string& body)
{
  std::vector<std::string> lines;
  std::vector<std::string> entries;
  boost::split(lines, body, boost::is_any_of("\n,"));
  for (auto& line : lines) {
    boost::trim(line);
    if (line.empty() || line.at(0) == '#') {
      continue;
    }
    entries.push_back(line);
  }
  return entries;
}

DoHResponse DoHFrontend::handle(const DoHRequest& request)
{
  DoHResponse response;

  if (request.method == "OPTIONS") {
    response.status = 204;
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";
    response.headers["Access-Control-Max-Age"] = "86400";
  }
  else if (request.path == s_dohPath) {
    response = handleDNSQuery(request);
  }
  else if (request.path == "/stats" && request.method == "GET") {
    response = handleStats();
  }
  else if (request.path == "/blocklist" || request.path == "/allowlist" || request.path == "/patterns") {
    response = handleList(request);
  }
  else if (request.path == "/" && request.method == "GET") {
    response = makeTextResponse(200, "DNS Ad Blocker Active");
  }
  else {
    response = makeTextResponse(404, "Not found\n");
  }

  response.headers["Access-Control-Allow-Origin"] = "*";
  return response;
}

DoHResponse DoHFrontend::handleDNSQuery(const DoHRequest& request)
{
  PacketBuffer query;

  if (request.method == "GET") {
    auto it = request.getvars.find("dns");
    if (it != request.getvars.end()) {
      /* undecodable input gives an empty query, handled like any
         other query we cannot parse */
      auto decoded = base64UrlDecode(it->second);
      query.assign(decoded.begin(), decoded.end());
    }
  }
  else if (request.method == "POST") {
    auto it = request.headers.find("Content-Type");
    if (it != request.headers.end() && !boost::istarts_with(it->second, s_dnsMessageContentType)) {
      return makeTextResponse(415, "Unsupported content type, expected " + s_dnsMessageContentType + "\n");
    }
    query.assign(request.body.begin(), request.body.end());
  }
  else {
    auto response = makeTextResponse(405, "Method not allowed\n");
    response.headers["Allow"] = "GET, POST, OPTIONS";
    return response;
  }

  auto result = d_processor.process(query);

  if (result.outcome == QueryOutcome::UpstreamFailure) {
    return makeTextResponse(502, "Upstream resolution failed\n");
  }

  DoHResponse response;
  response.headers["Content-Type"] = s_dnsMessageContentType;
  response.body.assign(result.response.begin(), result.response.end());

  if (result.outcome == QueryOutcome::Blocked) {
    response.headers["X-Blocked-Domain"] = result.qname;
    response.headers["Cache-Control"] = "max-age=" + std::to_string(s_blockedMaxAge);
  }
  else {
    response.headers["X-Cache"] = outcomeToString(result.outcome);
    response.headers["Cache-Control"] = "max-age=" + std::to_string(d_processor.getOptions().cacheTTL);
  }

  return response;
}

DoHResponse DoHFrontend::handleList(const DoHRequest& request)
{
  const bool patterns = request.path == "/patterns";
  DomainSet* list = nullptr;
  if (!patterns) {
    list = request.path == "/blocklist" ? &d_context.rules.blocklist : &d_context.rules.allowlist;
  }

  if (request.method == "GET") {
    auto entries = patterns ? d_context.rules.patterns.toStrings() : list->entries();
    std::string body = boost::join(entries, "\n");
    if (!body.empty()) {
      body.push_back('\n');
    }
    return makeTextResponse(200, body);
  }

  if (request.method != "POST") {
    auto response = makeTextResponse(405, "Method not allowed\n");
    response.headers["Allow"] = "GET, POST, OPTIONS";
    return response;
  }

  auto entries = splitEntries(request.body);
  size_t added = 0;
  if (patterns) {
    /* all or nothing: compile everything before adding anything */
    std::vector<std::shared_ptr<const DomainPattern>> compiled;
    compiled.reserve(entries.size());
    try {
      for (const auto& entry : entries) {
        compiled.push_back(std::make_shared<const RegexDomainPattern>(entry));
      }
    }
    catch (const DohGuardException& e) {
      return makeTextResponse(400, e.reason + "\n");
    }
    for (auto& pattern : compiled) {
      d_context.rules.patterns.add(std::move(pattern));
      ++added;
    }
  }
  else {
    added = list->add(entries);
  }

  infolog("Added %d entries to %s", added, request.path.substr(1));
  return makeTextResponse(200, "added " + std::to_string(added) + "\n");
}

std::string DoHFrontend::formatStats(const StatsSnapshot& snapshot)
{
  std::ostringstream str;
  str << boost::format("%-18s %d\n") % "total-queries" % snapshot.totalQueries;
  str << boost::format("%-18s %d\n") % "blocked-queries" % snapshot.blockedQueries;
  str << boost::format("%-18s %d\n") % "allowed-queries" % snapshot.allowedQueries;
  str << boost::format("%-18s %s%%\n") % "block-rate" % snapshot.blockRateToString();
  str << boost::format("%-18s %d\n") % "cache-hits" % snapshot.cacheHits;
  str << boost::format("%-18s %d\n") % "cache-misses" % snapshot.cacheMisses;
  str << boost::format("%-18s %d\n") % "upstream-failures" % snapshot.upstreamFailures;
  str << boost::format("%-18s %d\n") % "uptime" % snapshot.uptimeSeconds;
  str << "top-blocked\n";
  unsigned int rank = 1;
  for (const auto& entry : snapshot.topBlocked) {
    str << boost::format("%4d  %-40s %d\n") % rank % entry.first % entry.second;
    ++rank;
  }
  return str.str();
}

DoHResponse DoHFrontend::handleStats()
{
  return makeTextResponse(200, formatStats(d_context.stats.snapshot()));
}
}
