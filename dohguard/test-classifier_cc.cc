#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <thread>
#include <boost/test/unit_test.hpp>

#include "classifier.hh"
#include "dohguardexception.hh"

using namespace dohguard;

BOOST_AUTO_TEST_SUITE(test_classifier_cc)

BOOST_AUTO_TEST_CASE(test_suffix_match)
{
  FilterRules rules;
  BOOST_CHECK(rules.blocklist.add("ads.example.com"));
  Classifier classifier(rules);

  BOOST_CHECK(classifier.classify("ads.example.com") == Verdict::Block);
  BOOST_CHECK(classifier.classify("sub.ads.example.com") == Verdict::Block);
  BOOST_CHECK(classifier.classify("a.b.ads.example.com") == Verdict::Block);
  BOOST_CHECK(classifier.classify("example.com") == Verdict::Allow);
  BOOST_CHECK(classifier.classify("otherads.example.com") == Verdict::Allow);
  BOOST_CHECK(classifier.classify("ads.example.com.evil.net") == Verdict::Allow);
}

BOOST_AUTO_TEST_CASE(test_tld_entries)
{
  FilterRules rules;
  rules.blocklist.add("com");
  Classifier classifier(rules);

  BOOST_CHECK(classifier.classify("com") == Verdict::Block);
  BOOST_CHECK(classifier.classify("example.com") == Verdict::Allow);
  BOOST_CHECK(classifier.classify("www.example.com") == Verdict::Allow);
}

BOOST_AUTO_TEST_CASE(test_allow_overrides_block)
{
  FilterRules rules;
  rules.blocklist.add("cdn.example.com");
  rules.allowlist.add("example.com");
  rules.patterns.addRegex("cdn");
  Classifier classifier(rules);

  std::string matched;
  BOOST_CHECK(classifier.classify("cdn.example.com", &matched) == Verdict::Allow);
  BOOST_CHECK_EQUAL(matched, "allow:example.com");
  BOOST_CHECK(classifier.classify("cdn.other.com", &matched) == Verdict::Block);
  BOOST_CHECK_EQUAL(matched, "pattern:cdn");
}

BOOST_AUTO_TEST_CASE(test_sets_before_patterns)
{
  FilterRules rules;
  rules.blocklist.add("tracker.example.net");
  rules.patterns.addRegex(R"(^tracker\.)");
  rules.patterns.addRegex(R"(example)");
  Classifier classifier(rules);

  std::string matched;
  BOOST_CHECK(classifier.classify("tracker.example.net", &matched) == Verdict::Block);
  BOOST_CHECK_EQUAL(matched, "block:tracker.example.net");

  /* first matching pattern, in insertion order */
  BOOST_CHECK(classifier.classify("tracker.example.org", &matched) == Verdict::Block);
  BOOST_CHECK_EQUAL(matched, "pattern:^tracker\\.");

  BOOST_CHECK(classifier.classify("www.powerdns.com", &matched) == Verdict::Allow);
  BOOST_CHECK(matched.empty());
}

BOOST_AUTO_TEST_CASE(test_patterns_ignore_case)
{
  FilterRules rules;
  rules.patterns.addRegex(R"(^ADS?[0-9]*\.)");
  Classifier classifier(rules);

  BOOST_CHECK(classifier.classify("ads1.example.com") == Verdict::Block);
  BOOST_CHECK(classifier.classify("ad.example.com") == Verdict::Block);
  BOOST_CHECK(classifier.classify("adsl.example.com") == Verdict::Allow);
}

BOOST_AUTO_TEST_CASE(test_empty_name_is_allowed)
{
  FilterRules rules;
  rules.blocklist.add("example.com");
  rules.patterns.addRegex(".*");
  Classifier classifier(rules);

  BOOST_CHECK(classifier.classify("") == Verdict::Allow);
  BOOST_CHECK(classifier.classify("anything.org") == Verdict::Block);
}

BOOST_AUTO_TEST_CASE(test_invalid_pattern)
{
  PatternList patterns;
  BOOST_CHECK_THROW(patterns.addRegex("(unbalanced"), DohGuardException);
  BOOST_CHECK_EQUAL(patterns.size(), 0U);
}

BOOST_AUTO_TEST_CASE(test_domain_set_normalization)
{
  DomainSet set;
  BOOST_CHECK(set.add("  DoubleClick.NET. "));
  BOOST_CHECK(!set.add("doubleclick.net"));
  BOOST_CHECK(set.add("*.tracker.example"));
  BOOST_CHECK(!set.add(""));
  BOOST_CHECK(!set.add("two words.com"));
  BOOST_CHECK(!set.add("bad..name"));

  BOOST_CHECK_EQUAL(set.size(), 2U);
  BOOST_CHECK(set.contains("doubleclick.net"));
  BOOST_CHECK(set.contains("tracker.example"));

  auto entries = set.entries();
  BOOST_REQUIRE_EQUAL(entries.size(), 2U);
  BOOST_CHECK_EQUAL(entries.at(0), "doubleclick.net");
  BOOST_CHECK_EQUAL(entries.at(1), "tracker.example");

  BOOST_CHECK_EQUAL(DomainSet::normalize("WWW.Example.Com"), "www.example.com");
  BOOST_CHECK_EQUAL(DomainSet::normalize(".example.com"), "");
}

BOOST_AUTO_TEST_CASE(test_concurrent_additions)
{
  FilterRules rules;
  Classifier classifier(rules);

  std::thread writer([&rules]() {
    for (size_t idx = 0; idx < 1000; ++idx) {
      rules.blocklist.add("host" + std::to_string(idx) + ".example");
    }
  });

  size_t blocked = 0;
  for (size_t idx = 0; idx < 1000; ++idx) {
    if (classifier.classify("www.host" + std::to_string(idx) + ".example") == Verdict::Block) {
      ++blocked;
    }
  }
  writer.join();

  BOOST_CHECK_LE(blocked, 1000U);
  BOOST_CHECK_EQUAL(rules.blocklist.size(), 1000U);
  BOOST_CHECK(classifier.classify("www.host999.example") == Verdict::Block);
}

BOOST_AUTO_TEST_SUITE_END()
