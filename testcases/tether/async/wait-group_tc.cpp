
#include "stdinc.hpp"

#include "tether/async/execution-context.hpp"
#include "tether/async/wait-group.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

namespace tether::async::tests {

CATCH_TEST_CASE("WaitGroup", "[wait-group]") {
  CATCH_SECTION("wait-with-nothing-added") {
    WaitGroup wg;
    wg.wait();
    CATCH_REQUIRE(wg.count() == 0);
  }

  CATCH_SECTION("waits-for-pool-tasks") {
    constexpr int k_tasks = 100;
    std::atomic<int> counter{0};
    WaitGroup wg;
    ExecutionContext pool{4};
    CATCH_REQUIRE(pool.size() == 4);

    for (int i = 0; i < k_tasks; ++i) {
      wg.add();
      pool.post([&]() {
        std::this_thread::sleep_for(std::chrono::microseconds{50});
        counter.fetch_add(1, std::memory_order_relaxed);
        wg.done();
      });
    }
    wg.wait();
    CATCH_REQUIRE(counter.load() == k_tasks);
    CATCH_REQUIRE(wg.count() == 0);
  }
}

CATCH_TEST_CASE("ExecutionContext", "[execution-context]") {
  CATCH_SECTION("stop-and-join-finishes-queued-work") {
    std::atomic<int> counter{0};
    ExecutionContext pool{2};
    for (int i = 0; i < 10; ++i)
      pool.post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); });
    pool.stop_and_join();
    CATCH_REQUIRE(counter.load() == 10);
  }

  CATCH_SECTION("zero-means-hardware-concurrency") {
    ExecutionContext pool{0};
    CATCH_REQUIRE(pool.size() >= 1);
  }
}

} // namespace tether::async::tests
