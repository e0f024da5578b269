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
#include <fstream>
#include <boost/algorithm/string.hpp>

#include "configuration.hh"
#include "dohguardexception.hh"
#include "dolog.hh"

namespace po = boost::program_options;

namespace dohguard
{
const std::vector<std::string>& getDefaultBlockedDomains()
{
  static const std::vector<std::string> domains{
    "doubleclick.net",
    "googlesyndication.com",
    "googleadservices.com",
    "adservice.google.com",
    "ads.yahoo.com",
    "scorecardresearch.com",
  };
  return domains;
}

const std::vector<std::string>& getDefaultBlockPatterns()
{
  static const std::vector<std::string> patterns{
    R"(^ads?[0-9]*\.)",
    R"(^(.*\.)?doubleclick\.)",
    R"(^track(ing|er)?[0-9]*\.)",
    R"(^analytics\.)",
    R"(^telemetry\.)",
    R"(^adserver\.)",
  };
  return patterns;
}

po::options_description getConfigurationOptions()
{
  po::options_description desc("Configuration");
  desc.add_options()
    ("config", po::value<std::string>(), "read additional options from this file")
    ("upstream", po::value<std::string>()->default_value("https://cloudflare-dns.com/dns-query"), "DoH URL queries are forwarded to")
    ("fallback-upstream", po::value<std::string>()->default_value("https://dns.google/dns-query"), "DoH URL used when the upstream fails, empty to disable")
    ("upstream-timeout", po::value<int>()->default_value(5), "seconds to wait for an upstream answer")
    ("cache-size", po::value<size_t>()->default_value(1000), "maximum number of cached answers")
    ("cache-shards", po::value<uint32_t>()->default_value(1), "number of independently locked cache shards")
    ("cache-ttl", po::value<uint32_t>()->default_value(300), "seconds an upstream answer stays cached")
    ("blocked-rcode", po::value<std::string>()->default_value("nxdomain"), "answer for blocked names: nxdomain or noerror")
    ("blocklist-file", po::value<std::vector<std::string>>()->composing(), "file with blocked domains, one per line")
    ("allowlist-file", po::value<std::vector<std::string>>()->composing(), "file with allowed domains, one per line")
    ("pattern-file", po::value<std::vector<std::string>>()->composing(), "file with blocking regular expressions, one per line")
    ("block-domain", po::value<std::vector<std::string>>()->composing(), "block this domain and its subdomains")
    ("allow-domain", po::value<std::vector<std::string>>()->composing(), "always allow this domain and its subdomains")
    ("block-pattern", po::value<std::vector<std::string>>()->composing(), "block names matching this regular expression")
    ("no-default-rules", "do not load the built-in block rules")
    ("verbose,v", "log every blocked query")
    ("syslog", "log to syslog as well")
    ("log-timestamps", "prefix log lines with a timestamp");
  return desc;
}

template <typename T>
static std::vector<T> getMulti(const po::variables_map& vm, const char* name)
{
  if (vm.count(name) != 0) {
    return vm[name].as<std::vector<T>>();
  }
  return {};
}

Configuration configurationFromVariables(po::variables_map& vm, const po::options_description& desc)
{
  if (vm.count("config") != 0) {
    const auto& path = vm["config"].as<std::string>();
    std::ifstream ifs(path);
    if (!ifs) {
      throw DohGuardException("Unable to open configuration file '" + path + "'");
    }
    try {
      po::store(po::parse_config_file(ifs, desc), vm);
    }
    catch (const po::error& e) {
      throw DohGuardException("Error in configuration file '" + path + "': " + e.what());
    }
    po::notify(vm);
  }

  Configuration config;
  config.upstream = vm["upstream"].as<std::string>();
  config.fallbackUpstream = vm["fallback-upstream"].as<std::string>();
  config.upstreamTimeout = vm["upstream-timeout"].as<int>();
  config.cacheSize = vm["cache-size"].as<size_t>();
  config.cacheShards = vm["cache-shards"].as<uint32_t>();
  config.cacheTTL = vm["cache-ttl"].as<uint32_t>();
  config.blocklistFiles = getMulti<std::string>(vm, "blocklist-file");
  config.allowlistFiles = getMulti<std::string>(vm, "allowlist-file");
  config.patternFiles = getMulti<std::string>(vm, "pattern-file");
  config.blockedDomains = getMulti<std::string>(vm, "block-domain");
  config.allowedDomains = getMulti<std::string>(vm, "allow-domain");
  config.blockPatterns = getMulti<std::string>(vm, "block-pattern");
  config.defaultRules = vm.count("no-default-rules") == 0;
  config.verbose = vm.count("verbose") != 0;
  config.syslog = vm.count("syslog") != 0;
  config.logTimestamps = vm.count("log-timestamps") != 0;

  auto rcode = boost::to_lower_copy(vm["blocked-rcode"].as<std::string>());
  if (rcode == "nxdomain") {
    config.blockedPolicy = BlockedResponsePolicy::NXDomain;
  }
  else if (rcode == "noerror") {
    config.blockedPolicy = BlockedResponsePolicy::NoData;
  }
  else {
    throw DohGuardException("Invalid value '" + rcode + "' for blocked-rcode, expected nxdomain or noerror");
  }

  if (config.upstreamTimeout <= 0) {
    throw DohGuardException("upstream-timeout has to be positive");
  }
  if (config.cacheShards == 0 || config.cacheSize < config.cacheShards) {
    throw DohGuardException("cache-size has to be at least cache-shards, and cache-shards at least 1");
  }
  if (config.upstream.empty()) {
    throw DohGuardException("An upstream URL is required");
  }

  return config;
}

void applyLoggingConfiguration(const Configuration& config)
{
  logging::LoggingConfiguration::setVerbose(config.verbose);
  logging::LoggingConfiguration::setLogTimestamps(config.logTimestamps);
  logging::LoggingConfiguration::setSyslog(config.syslog);
  if (config.syslog) {
    logging::setSyslogFacility(LOG_DAEMON);
  }
}

static std::vector<std::string> readEntries(const std::string& path)
{
  std::ifstream ifs(path);
  if (!ifs) {
    throw DohGuardException("Unable to open '" + path + "' for reading");
  }

  std::vector<std::string> entries;
  std::string line;
  while (std::getline(ifs, line)) {
    auto pos = line.find('#');
    if (pos != std::string::npos) {
      line.resize(pos);
    }
    boost::trim(line);
    if (!line.empty()) {
      entries.push_back(line);
    }
  }
  return entries;
}

size_t loadDomainFile(const std::string& path, DomainSet& set)
{
  size_t added = 0;
  for (const auto& entry : readEntries(path)) {
    std::vector<std::string> fields;
    boost::split(fields, entry, boost::is_any_of(" \t"), boost::token_compress_on);
    /* hosts file format, the name comes after the address */
    const auto& domain = fields.size() > 1 ? fields.at(1) : fields.at(0);
    if (set.add(domain)) {
      ++added;
    }
  }
  infolog("Loaded %d domains from %s", added, path);
  return added;
}

size_t loadPatternFile(const std::string& path, PatternList& patterns)
{
  size_t added = 0;
  for (const auto& entry : readEntries(path)) {
    patterns.addRegex(entry);
    ++added;
  }
  infolog("Loaded %d patterns from %s", added, path);
  return added;
}

void loadRules(const Configuration& config, FilterRules& rules)
{
  if (config.defaultRules) {
    rules.blocklist.add(getDefaultBlockedDomains());
    for (const auto& pattern : getDefaultBlockPatterns()) {
      rules.patterns.addRegex(pattern);
    }
  }

  for (const auto& path : config.blocklistFiles) {
    loadDomainFile(path, rules.blocklist);
  }
  for (const auto& path : config.allowlistFiles) {
    loadDomainFile(path, rules.allowlist);
  }
  for (const auto& path : config.patternFiles) {
    loadPatternFile(path, rules.patterns);
  }

  rules.blocklist.add(config.blockedDomains);
  rules.allowlist.add(config.allowedDomains);
  for (const auto& pattern : config.blockPatterns) {
    rules.patterns.addRegex(pattern);
  }

  infolog("Rules loaded: %d blocked domains, %d allowed domains, %d patterns", rules.blocklist.size(), rules.allowlist.size(), rules.patterns.size());
}
}
