#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#include <cstdlib>
#include <boost/test/unit_test.hpp>

#include "dolog.hh"

static bool init_unit_test()
{
  /* the suites log upstream failures and blocked names on purpose,
     only show the verbose part when asked to */
  if (getenv("DOHGUARD_TEST_VERBOSE") != nullptr) { // NOLINT(concurrency-mt-unsafe)
    dohguard::logging::LoggingConfiguration::setVerbose(true);
  }
  dohguard::logging::LoggingConfiguration::setSyslog(false);
  return true;
}

int main(int argc, char* argv[])
{
  setenv("BOOST_TEST_RANDOM", "1", 1); // NOLINT(concurrency-mt-unsafe)
  return boost::unit_test::unit_test_main(&init_unit_test, argc, argv);
}
