#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <thread>
#include <vector>
#include <boost/test/unit_test.hpp>

#include "lock.hh"

using namespace dohguard;

BOOST_AUTO_TEST_SUITE(test_lock_hh)

BOOST_AUTO_TEST_CASE(test_lock_guarded)
{
  LockGuarded<std::vector<int>> values;
  std::vector<std::thread> threads;
  for (int thread = 0; thread < 4; ++thread) {
    threads.emplace_back([&values]() {
      for (int idx = 0; idx < 1000; ++idx) {
        values.lock()->push_back(idx);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  BOOST_CHECK_EQUAL(values.lock()->size(), 4000U);
}

BOOST_AUTO_TEST_CASE(test_shared_lock_guarded)
{
  SharedLockGuarded<int> value(42);
  {
    auto first = value.read_lock();
    auto second = value.read_lock();
    BOOST_CHECK_EQUAL(*first, 42);
    BOOST_CHECK_EQUAL(*second, 42);
  }
  *(value.write_lock()) = 43;
  BOOST_CHECK_EQUAL(*(value.read_lock()), 43);
}

BOOST_AUTO_TEST_SUITE_END()
