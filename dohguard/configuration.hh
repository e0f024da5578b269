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
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include "blocked-response.hh"
#include "classifier.hh"

namespace dohguard
{
struct Configuration
{
  std::string upstream{"https://cloudflare-dns.com/dns-query"};
  std::string fallbackUpstream{"https://dns.google/dns-query"};
  std::vector<std::string> blocklistFiles;
  std::vector<std::string> allowlistFiles;
  std::vector<std::string> patternFiles;
  std::vector<std::string> blockedDomains;
  std::vector<std::string> allowedDomains;
  std::vector<std::string> blockPatterns;
  size_t cacheSize{1000};
  uint32_t cacheShards{1};
  uint32_t cacheTTL{300};
  int upstreamTimeout{5};
  BlockedResponsePolicy blockedPolicy{BlockedResponsePolicy::NXDomain};
  bool defaultRules{true};
  bool verbose{false};
  bool syslog{false};
  bool logTimestamps{false};
};

//! options shared by the dohguard tools
boost::program_options::options_description getConfigurationOptions();

/* Reads the variables produced from getConfigurationOptions(), merging
   the content of --config when set. Throws DohGuardException on invalid
   values. */
Configuration configurationFromVariables(boost::program_options::variables_map& vm, const boost::program_options::options_description& desc);

void applyLoggingConfiguration(const Configuration& config);

/* Fills the rule sets from the built-in defaults (when enabled), the
   rule files and the individual entries of the configuration.
   Throws DohGuardException when a file cannot be read or a pattern does
   not compile. */
void loadRules(const Configuration& config, FilterRules& rules);

/* One entry per line, '#' starts a comment. Hosts-file lines
   ("0.0.0.0 ads.example.com") are accepted, the address is skipped. */
size_t loadDomainFile(const std::string& path, DomainSet& set);
size_t loadPatternFile(const std::string& path, PatternList& patterns);

const std::vector<std::string>& getDefaultBlockedDomains();
const std::vector<std::string>& getDefaultBlockPatterns();
}
