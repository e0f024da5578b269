#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <stdlib.h>
#include <unistd.h>
#include <vector>
#include <boost/test/unit_test.hpp>

#include "configuration.hh"
#include "dohguardexception.hh"

using namespace dohguard;
namespace po = boost::program_options;

/* writes content to a fresh temporary file, removed when going out of scope */
class TemporaryFile
{
public:
  TemporaryFile(const std::string& content)
  {
    int fd = mkstemp(d_path);
    if (fd < 0) {
      BOOST_FAIL("Unable to generate a temporary file");
    }
    ssize_t len = write(fd, content.c_str(), content.size());
    close(fd);
    BOOST_REQUIRE_EQUAL(len, static_cast<ssize_t>(content.size()));
  }
  ~TemporaryFile()
  {
    unlink(d_path);
  }
  TemporaryFile(const TemporaryFile&) = delete;
  TemporaryFile& operator=(const TemporaryFile&) = delete;

  std::string getPath() const
  {
    return d_path;
  }

private:
  char d_path[32] = "/tmp/dohguard-test.XXXXXX";
};

static Configuration parseArguments(std::vector<const char*> args)
{
  auto desc = getConfigurationOptions();
  args.insert(args.begin(), "test");
  po::variables_map vm;
  po::store(po::parse_command_line(static_cast<int>(args.size()), args.data(), desc), vm);
  po::notify(vm);
  return configurationFromVariables(vm, desc);
}

BOOST_AUTO_TEST_SUITE(test_configuration_cc)

BOOST_AUTO_TEST_CASE(test_defaults)
{
  auto config = parseArguments({});
  BOOST_CHECK_EQUAL(config.upstream, "https://cloudflare-dns.com/dns-query");
  BOOST_CHECK_EQUAL(config.fallbackUpstream, "https://dns.google/dns-query");
  BOOST_CHECK_EQUAL(config.cacheSize, 1000U);
  BOOST_CHECK_EQUAL(config.cacheTTL, 300U);
  BOOST_CHECK_EQUAL(config.upstreamTimeout, 5);
  BOOST_CHECK(config.blockedPolicy == BlockedResponsePolicy::NXDomain);
  BOOST_CHECK(config.defaultRules);
  BOOST_CHECK(!config.verbose);
}

BOOST_AUTO_TEST_CASE(test_command_line)
{
  auto config = parseArguments({"--upstream", "https://resolver.example/dns-query", "--upstream-timeout", "3", "--cache-size", "10", "--cache-shards", "2", "--blocked-rcode", "NOERROR", "--block-domain", "a.example", "--block-domain", "b.example", "--no-default-rules", "-v"});
  BOOST_CHECK_EQUAL(config.upstream, "https://resolver.example/dns-query");
  BOOST_CHECK_EQUAL(config.upstreamTimeout, 3);
  BOOST_CHECK_EQUAL(config.cacheSize, 10U);
  BOOST_CHECK_EQUAL(config.cacheShards, 2U);
  BOOST_CHECK(config.blockedPolicy == BlockedResponsePolicy::NoData);
  BOOST_REQUIRE_EQUAL(config.blockedDomains.size(), 2U);
  BOOST_CHECK_EQUAL(config.blockedDomains.at(1), "b.example");
  BOOST_CHECK(!config.defaultRules);
  BOOST_CHECK(config.verbose);
}

BOOST_AUTO_TEST_CASE(test_invalid_values)
{
  BOOST_CHECK_THROW(parseArguments({"--blocked-rcode", "refused"}), DohGuardException);
  BOOST_CHECK_THROW(parseArguments({"--upstream-timeout", "0"}), DohGuardException);
  BOOST_CHECK_THROW(parseArguments({"--cache-size", "2", "--cache-shards", "4"}), DohGuardException);
  BOOST_CHECK_THROW(parseArguments({"--config", "/nonexistent/dohguard.conf"}), DohGuardException);
}

BOOST_AUTO_TEST_CASE(test_config_file)
{
  TemporaryFile file("# dohguard\ncache-ttl=60\nblock-domain=c.example\nblocked-rcode=noerror\n");
  auto config = parseArguments({"--config", file.getPath().c_str(), "--block-domain", "a.example", "--blocked-rcode", "nxdomain"});
  BOOST_CHECK_EQUAL(config.cacheTTL, 60U);
  /* the command line wins */
  BOOST_CHECK(config.blockedPolicy == BlockedResponsePolicy::NXDomain);
  BOOST_CHECK_EQUAL(config.blockedDomains.size(), 2U);

  TemporaryFile broken("no-such-option=1\n");
  BOOST_CHECK_THROW(parseArguments({"--config", broken.getPath().c_str()}), DohGuardException);
}

BOOST_AUTO_TEST_CASE(test_domain_file)
{
  TemporaryFile file(R"(# a hosts file
0.0.0.0 ads.example.com
127.0.0.1	tracker.example.org # inline comment
plain.example.net

*.wildcard.example
0.0.0.0 ads.example.com
)");

  DomainSet set;
  BOOST_CHECK_EQUAL(loadDomainFile(file.getPath(), set), 4U);
  BOOST_CHECK(set.contains("ads.example.com"));
  BOOST_CHECK(set.contains("tracker.example.org"));
  BOOST_CHECK(set.contains("plain.example.net"));
  BOOST_CHECK(set.contains("wildcard.example"));

  BOOST_CHECK_THROW(loadDomainFile("/nonexistent/blocklist", set), DohGuardException);
}

BOOST_AUTO_TEST_CASE(test_pattern_file)
{
  TemporaryFile file("^ads?[0-9]*\\.\n# comment\n^metrics\\.\n");
  PatternList patterns;
  BOOST_CHECK_EQUAL(loadPatternFile(file.getPath(), patterns), 2U);
  BOOST_CHECK(patterns.firstMatch("metrics.example.com") != nullptr);

  TemporaryFile broken("(unbalanced\n");
  BOOST_CHECK_THROW(loadPatternFile(broken.getPath(), patterns), DohGuardException);
}

BOOST_AUTO_TEST_CASE(test_load_rules)
{
  TemporaryFile allow("googleadservices.com\n");
  Configuration config;
  config.allowlistFiles.push_back(allow.getPath());
  config.blockedDomains.push_back("extra.example");

  FilterRules rules;
  loadRules(config, rules);
  Classifier classifier(rules);

  BOOST_CHECK_EQUAL(rules.blocklist.size(), getDefaultBlockedDomains().size() + 1);
  BOOST_CHECK_EQUAL(rules.patterns.size(), getDefaultBlockPatterns().size());
  BOOST_CHECK(classifier.classify("doubleclick.net") == Verdict::Block);
  BOOST_CHECK(classifier.classify("www.extra.example") == Verdict::Block);
  BOOST_CHECK(classifier.classify("ads2.example.com") == Verdict::Block);
  BOOST_CHECK(classifier.classify("tracking.example.com") == Verdict::Block);
  BOOST_CHECK(classifier.classify("googleadservices.com") == Verdict::Allow);
  BOOST_CHECK(classifier.classify("www.example.com") == Verdict::Allow);

  config.defaultRules = false;
  FilterRules bare;
  loadRules(config, bare);
  BOOST_CHECK_EQUAL(bare.blocklist.size(), 1U);
  BOOST_CHECK_EQUAL(bare.patterns.size(), 0U);
}

BOOST_AUTO_TEST_SUITE_END()
