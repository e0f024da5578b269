#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#include <atomic>
#include <future>
#include <stdexcept>
#include <boost/test/unit_test.hpp>

#include "deferred-work.hh"
#include "dohguardexception.hh"

using namespace dohguard;

BOOST_AUTO_TEST_SUITE(test_deferred_work_cc)

BOOST_AUTO_TEST_CASE(test_run_deferred_task)
{
  size_t ran = 0;
  runDeferredTask([&ran]() { ++ran; });
  BOOST_CHECK_EQUAL(ran, 1U);

  BOOST_CHECK_NO_THROW(runDeferredTask([]() { throw std::runtime_error("boom"); }));
  BOOST_CHECK_NO_THROW(runDeferredTask([]() { throw DohGuardException("boom"); }));
}

BOOST_AUTO_TEST_CASE(test_queue_runs_in_order)
{
  DeferredWorkQueue queue;
  std::vector<int> order;

  for (int idx = 0; idx < 100; ++idx) {
    BOOST_CHECK(queue.submit([&order, idx]() { order.push_back(idx); }));
  }
  queue.drain();

  BOOST_REQUIRE_EQUAL(order.size(), 100U);
  for (int idx = 0; idx < 100; ++idx) {
    BOOST_CHECK_EQUAL(order.at(idx), idx);
  }
  BOOST_CHECK_EQUAL(queue.getExecuted(), 100U);
}

BOOST_AUTO_TEST_CASE(test_failing_task_does_not_stop_the_queue)
{
  DeferredWorkQueue queue;
  std::atomic<size_t> ran{0};
  auto runner = queue.getRunner();

  runner([]() { throw std::runtime_error("boom"); });
  runner([&ran]() { ++ran; });
  queue.drain();

  BOOST_CHECK_EQUAL(ran.load(), 1U);
  BOOST_CHECK_EQUAL(queue.getExecuted(), 2U);
}

BOOST_AUTO_TEST_CASE(test_full_queue_drops)
{
  DeferredWorkQueue queue(1);
  std::promise<void> started;
  std::promise<void> release;
  auto releaseFuture = release.get_future().share();

  BOOST_REQUIRE(queue.submit([&started, releaseFuture]() {
    started.set_value();
    releaseFuture.wait();
  }));
  started.get_future().wait();

  /* the worker is busy, one task fits in the queue, the next does not */
  BOOST_CHECK(queue.submit([]() {}));
  BOOST_CHECK(!queue.submit([]() {}));
  BOOST_CHECK_EQUAL(queue.getDropped(), 1U);

  release.set_value();
  queue.drain();
  BOOST_CHECK_EQUAL(queue.getExecuted(), 2U);
}

BOOST_AUTO_TEST_CASE(test_destructor_runs_pending_tasks)
{
  std::atomic<size_t> ran{0};
  {
    DeferredWorkQueue queue;
    for (size_t idx = 0; idx < 10; ++idx) {
      queue.submit([&ran]() { ++ran; });
    }
  }
  BOOST_CHECK_EQUAL(ran.load(), 10U);
}

BOOST_AUTO_TEST_SUITE_END()
