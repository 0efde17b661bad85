#include <catch2/catch_test_macros.hpp>
#include "StreamExecutor.h"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace concurrency;

TEST_CASE("StreamExecutor construction", "[StreamExecutor]")
{
  SECTION("Explicit worker count")
  {
    StreamExecutor executor(3);
    REQUIRE(executor.size() == 3);
  }

  SECTION("Zero picks hardware concurrency")
  {
    StreamExecutor executor(0);
    REQUIRE(executor.size() >= 1);
  }
}

TEST_CASE("StreamExecutor stream affinity", "[StreamExecutor]")
{
  StreamExecutor executor(4);

  SECTION("A stream key always maps to the same worker")
  {
    for (const std::string key : {"BTCUSDT", "ETHUSDT", "ES-default", "NQ-aggressive"}) {
      const std::size_t w = executor.workerFor(key);
      REQUIRE(w < executor.size());
      for (int i = 0; i < 10; ++i)
	REQUIRE(executor.workerFor(key) == w);
    }
  }

  SECTION("Tasks of one stream run on one thread in submission order")
  {
    const std::vector<std::string> streams = {"s0", "s1", "s2", "s3", "s4", "s5"};
    std::mutex mutex;
    std::map<std::string, std::vector<int>> order;
    std::map<std::string, std::set<std::thread::id>> threads;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 200; ++i) {
      for (const auto& s : streams) {
	futures.push_back(executor.submit(s, [&, s, i]() {
	  std::lock_guard<std::mutex> lock(mutex);
	  order[s].push_back(i);
	  threads[s].insert(std::this_thread::get_id());
	}));
      }
    }

    for (auto& f : futures)
      f.get();

    for (const auto& s : streams) {
      REQUIRE(order[s].size() == 200);
      for (int i = 0; i < 200; ++i)
	REQUIRE(order[s][i] == i);
      REQUIRE(threads[s].size() == 1);
    }
  }

  SECTION("One stream never runs two tasks at once")
  {
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 20; ++i) {
      futures.push_back(executor.submit("single", [&]() {
	const int now = active.fetch_add(1) + 1;
	int prev = maxActive.load();
	while (now > prev && !maxActive.compare_exchange_weak(prev, now)) {}
	std::this_thread::sleep_for(std::chrono::milliseconds(1));
	active.fetch_sub(1);
      }));
    }

    for (auto& f : futures)
      f.get();

    REQUIRE(maxActive.load() == 1);
  }
}

TEST_CASE("StreamExecutor results and exceptions", "[StreamExecutor]")
{
  StreamExecutor executor(2);

  SECTION("Return values travel through the future")
  {
    auto fut = executor.submit("calc", []() { return 6 * 7; });
    REQUIRE(fut.get() == 42);
  }

  SECTION("Exceptions travel through the future")
  {
    auto fut = executor.submit("bad", []() -> int { throw std::runtime_error("stream failure"); });
    REQUIRE_THROWS_AS(fut.get(), std::runtime_error);

    // The worker survives
    auto next = executor.submit("bad", []() { return 1; });
    REQUIRE(next.get() == 1);
  }
}

TEST_CASE("StreamExecutor drains queued tasks on destruction", "[StreamExecutor]")
{
  std::atomic<int> counter{0};
  {
    StreamExecutor executor(2);
    for (int i = 0; i < 100; ++i)
      executor.submit(std::to_string(i % 5), [&counter]() { counter.fetch_add(1); });
  }
  REQUIRE(counter.load() == 100);
}
