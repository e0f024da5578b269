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
#include <cstdlib>
#include <iostream>
#include <boost/program_options.hpp>

#include "base64.hh"
#include "configuration.hh"
#include "dnswriter.hh"
#include "doh-frontend.hh"
#include "dohguardexception.hh"
#include "dolog.hh"
#include "query-processor.hh"

namespace po = boost::program_options;
using namespace dohguard;

static void usage(const po::options_description& desc)
{
  std::cerr << "Usage: dohguard-query [OPTIONS] NAME [TYPE]" << std::endl;
  std::cerr << "       dohguard-query [OPTIONS] --dns BASE64URL" << std::endl;
  std::cerr << desc << std::endl;
}

static uint8_t getRCode(const PacketBuffer& response)
{
  if (response.size() < s_dnsHeaderSize) {
    return RCode::FormErr;
  }
  return response.at(DNSHeaderOffsets::flags2) & DNSFlags::RCodeMask;
}

int main(int argc, char** argv)
try {
  po::options_description desc("Allowed options");
  desc.add_options()
    ("help,h", "produce help message")
    ("dns", po::value<std::string>(), "process this base64url-encoded DNS message instead of NAME")
    ("repeat", po::value<unsigned int>()->default_value(1), "process the query this many times, to exercise the cache")
    ("stats", "print the statistics snapshot once done");
  auto configDesc = getConfigurationOptions();
  desc.add(configDesc);

  po::options_description hidden("hidden options");
  hidden.add_options()
    ("qname", po::value<std::string>(), "name to query")
    ("qtype", po::value<std::string>()->default_value("A"), "type to query");

  po::options_description alloptions;
  alloptions.add(desc).add(hidden);
  po::positional_options_description positional;
  positional.add("qname", 1);
  positional.add("qtype", 1);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).options(alloptions).positional(positional).run(), vm);
  po::notify(vm);

  if (vm.count("help") != 0) {
    usage(desc);
    return EXIT_SUCCESS;
  }

  if (vm.count("qname") == 0 && vm.count("dns") == 0) {
    std::cerr << "Fatal, need a name to query or a --dns message" << std::endl;
    usage(desc);
    return EXIT_FAILURE;
  }

  auto config = configurationFromVariables(vm, configDesc);
  applyLoggingConfiguration(config);

  PacketBuffer query;
  if (vm.count("dns") != 0) {
    auto decoded = base64UrlDecode(vm["dns"].as<std::string>());
    query.assign(decoded.begin(), decoded.end());
  }
  else {
    auto qtype = QType::chartocode(vm["qtype"].as<std::string>());
    if (qtype == 0) {
      std::cerr << "Fatal, unknown query type '" << vm["qtype"].as<std::string>() << "'" << std::endl;
      return EXIT_FAILURE;
    }
    query = makeDNSQuery(vm["qname"].as<std::string>(), qtype, 0);
  }

  FilterContext context(config.cacheSize, config.cacheShards);
  loadRules(config, context.rules);

  auto upstream = makeUpstreamResolver(config.upstream, config.fallbackUpstream, config.upstreamTimeout);
  QueryProcessorOptions options;
  options.cacheTTL = config.cacheTTL;
  options.blockedPolicy = config.blockedPolicy;

  int ret = EXIT_SUCCESS;
  {
    DeferredWorkQueue deferred;
    QueryProcessor processor(context, *upstream, options, deferred.getRunner());

    const auto repeat = vm["repeat"].as<unsigned int>();
    for (unsigned int idx = 0; idx < repeat; ++idx) {
      auto result = processor.process(query);
      /* make sure the cache is filled before the next round */
      deferred.drain();

      std::cout << (result.qname.empty() ? std::string("<unparsable>") : result.qname) << "|" << QType::toString(result.qtype) << ": " << outcomeToString(result.outcome);
      if (result.outcome == QueryOutcome::UpstreamFailure) {
        std::cout << " (" << result.error << ")" << std::endl;
        ret = EXIT_FAILURE;
        continue;
      }
      if (!result.matchedRule.empty()) {
        std::cout << " [" << result.matchedRule << "]";
      }
      std::cout << ", rcode " << RCode::to_s(getRCode(result.response)) << ", " << result.response.size() << " bytes" << std::endl;
    }
  }

  if (vm.count("stats") != 0) {
    std::cout << DoHFrontend::formatStats(context.stats.snapshot());
  }

  return ret;
}
catch (const DohGuardException& e) {
  std::cerr << "Fatal: " << e.reason << std::endl;
  return EXIT_FAILURE;
}
catch (const std::exception& e) {
  std::cerr << "Fatal: " << e.what() << std::endl;
  return EXIT_FAILURE;
}
