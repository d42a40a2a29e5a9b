
#include "stdinc.hpp"

#include "tether/async/completion-queue.hpp"

#include <catch2/catch.hpp>

#include <thread>

namespace tether::async::tests {

CATCH_TEST_CASE("CompletionQueue", "[completion-queue]") {
  CATCH_SECTION("fifo") {
    CompletionQueue<int> queue;
    queue.push(1);
    queue.push(2);
    CATCH_REQUIRE(queue.size() == 2);
    CATCH_REQUIRE(queue.pop() == 1);
    CATCH_REQUIRE(queue.pop() == 2);
    CATCH_REQUIRE(queue.size() == 0);
  }

  CATCH_SECTION("try-pop-and-timeout") {
    CompletionQueue<int> queue;
    int value = 0;
    CATCH_REQUIRE(!queue.try_pop(value));
    CATCH_REQUIRE(!queue.pop_for(std::chrono::milliseconds{10}, value));
    queue.push(7);
    CATCH_REQUIRE(queue.pop_for(std::chrono::milliseconds{10}, value));
    CATCH_REQUIRE(value == 7);
  }

  CATCH_SECTION("push-never-blocks-a-producer") {
    // Nobody is reading: the producer still runs to completion
    CompletionQueue<int> queue;
    std::thread producer{[&queue]() {
      for (int i = 0; i < 1000; ++i)
        queue.push(i);
    }};
    producer.join();
    CATCH_REQUIRE(queue.size() == 1000);
  }

  CATCH_SECTION("many-producers") {
    CompletionQueue<int> queue;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t)
      producers.emplace_back([&queue, t]() {
        for (int i = 0; i < 50; ++i)
          queue.push(t * 50 + i);
      });

    std::vector<bool> seen(200, false);
    for (int n = 0; n < 200; ++n)
      seen[std::size_t(queue.pop())] = true;
    for (auto& producer : producers)
      producer.join();
    CATCH_REQUIRE(std::all_of(cbegin(seen), cend(seen), [](bool x) { return x; }));
  }
}

} // namespace tether::async::tests
