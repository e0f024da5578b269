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
#include <map>
#include <string>
#include <strings.h>

#include "query-processor.hh"

namespace dohguard
{
struct CIStringCompare
{
  bool operator()(const std::string& lhs, const std::string& rhs) const
  {
    return strcasecmp(lhs.c_str(), rhs.c_str()) < 0;
  }
};

using HTTPHeaders = std::map<std::string, std::string, CIStringCompare>;

/* An HTTP request as handed over by whatever server accepted it:
   the path without its query string, decoded query parameters, headers
   and the raw body. */
struct DoHRequest
{
  std::string method;
  std::string path;
  std::map<std::string, std::string> getvars;
  HTTPHeaders headers;
  std::string body;
};

struct DoHResponse
{
  int status{200};
  HTTPHeaders headers;
  std::string body;
};

/* Maps HTTP requests onto the query processor and the administrative
   accessors of the filter context:

   GET  /dns-query?dns=...    RFC 8484 GET, base64url, padding optional
   POST /dns-query            RFC 8484 POST, raw message in the body
   GET  /stats                text snapshot of the statistics
   GET  /blocklist, /allowlist, /patterns   one entry per line
   POST /blocklist, /allowlist, /patterns   add the entries in the body, one per line
   OPTIONS *                  CORS preflight
   GET  /                     banner */
class DoHFrontend
{
public:
  DoHFrontend(QueryProcessor& processor, FilterContext& context) :
    d_processor(processor), d_context(context)
  {
  }

  DoHResponse handle(const DoHRequest& request);

  static std::string formatStats(const StatsSnapshot& snapshot);

private:
  DoHResponse handleDNSQuery(const DoHRequest& request);
  DoHResponse handleList(const DoHRequest& request);
  DoHResponse handleStats();

  QueryProcessor& d_processor;
  FilterContext& d_context;
};

static const std::string s_dohPath{"/dns-query"};
static const uint32_t s_blockedMaxAge{300};
}
