#include "doctest/doctest.h"
#include "test_support.hpp"
#include "visionsync/limiter.hpp"

#include <mutex>
#include <thread>
#include <vector>

using namespace visionsync;
using visionsync_test::eventually;

DOCTEST_TEST_CASE("limiter grants up to capacity") {
  ConcurrencyLimiter l(2);
  DOCTEST_REQUIRE(l.try_acquire());
  DOCTEST_REQUIRE(l.acquire());
  DOCTEST_REQUIRE(!l.try_acquire());
  DOCTEST_REQUIRE_EQ(l.in_use(), 2u);
  l.release();
  DOCTEST_REQUIRE_EQ(l.in_use(), 1u);
  DOCTEST_REQUIRE(l.try_acquire());
  l.release();
  l.release();
  DOCTEST_REQUIRE_EQ(l.in_use(), 0u);
  DOCTEST_REQUIRE_EQ(l.peak_in_use(), 2u);
}

DOCTEST_TEST_CASE("limiter hands permits to waiters in arrival order") {
  ConcurrencyLimiter l(1);
  DOCTEST_REQUIRE(l.acquire());

  std::mutex mu;
  std::vector<int> order;
  auto waiter = [&](int n) {
    DOCTEST_REQUIRE(l.acquire());
    {
      std::lock_guard<std::mutex> lk(mu);
      order.push_back(n);
    }
    l.release();
  };

  std::thread a(waiter, 1);
  DOCTEST_REQUIRE(eventually([&] { return l.waiting() == 1; }));
  std::thread b(waiter, 2);
  DOCTEST_REQUIRE(eventually([&] { return l.waiting() == 2; }));

  // A late try_acquire must not overtake the queue.
  DOCTEST_REQUIRE(!l.try_acquire());

  l.release();
  a.join();
  b.join();
  DOCTEST_REQUIRE_EQ(order.size(), 2u);
  DOCTEST_REQUIRE_EQ(order[0], 1);
  DOCTEST_REQUIRE_EQ(order[1], 2);
  DOCTEST_REQUIRE_EQ(l.in_use(), 0u);
  DOCTEST_REQUIRE_EQ(l.peak_in_use(), 1u);
}

DOCTEST_TEST_CASE("cancelled waiter leaves the queue without a permit") {
  ConcurrencyLimiter l(1);
  DOCTEST_REQUIRE(l.acquire());

  std::atomic<bool> cancelled{false};
  bool got = true;
  std::thread t([&] { got = l.acquire(&cancelled); });
  DOCTEST_REQUIRE(eventually([&] { return l.waiting() == 1; }));

  cancelled = true;
  l.interrupt();
  t.join();

  DOCTEST_REQUIRE(!got);
  DOCTEST_REQUIRE_EQ(l.waiting(), 0u);
  DOCTEST_REQUIRE_EQ(l.in_use(), 1u);

  // Already-set flag is honoured on entry.
  l.release();
  DOCTEST_REQUIRE(!l.acquire(&cancelled));
  DOCTEST_REQUIRE_EQ(l.in_use(), 0u);
}

DOCTEST_TEST_CASE("permit releases on scope exit and follows moves") {
  ConcurrencyLimiter l(1);
  {
    DOCTEST_REQUIRE(l.acquire());
    Permit p(&l);
    Permit q(std::move(p));
    DOCTEST_REQUIRE(!p);
    DOCTEST_REQUIRE(q);
    DOCTEST_REQUIRE_EQ(l.in_use(), 1u);
  }
  DOCTEST_REQUIRE_EQ(l.in_use(), 0u);
}
