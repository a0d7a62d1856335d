#include "xdrls/utils/broadcast_event.hpp"

#include <atomic>
#include <chrono>
#include <memory>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/xdrls/common/async_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using xdrls::test::RunAsyncTest;
using xdrls::utils::BroadcastEvent;

namespace {

auto Sleep(asio::any_io_executor executor, int ms) -> asio::awaitable<void> {
  asio::steady_timer timer(executor);
  timer.expires_after(std::chrono::milliseconds(ms));
  co_await timer.async_wait(asio::use_awaitable);
}

}  // namespace

TEST_CASE("BroadcastEvent wait after set completes", "[broadcast_event]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    BroadcastEvent event(executor);
    event.Set();

    co_await event.AsyncWait(asio::use_awaitable);
    co_await event.AsyncWait(asio::use_awaitable);
    REQUIRE(event.IsSet());
  });
}

TEST_CASE("BroadcastEvent wakes every parked waiter once",
          "[broadcast_event]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto event = std::make_shared<BroadcastEvent>(executor);
    std::atomic<int> completed_count{0};

    for (int i = 0; i < 4; ++i) {
      asio::co_spawn(
          executor,
          [event, &completed_count]() -> asio::awaitable<void> {
            co_await event->AsyncWait(asio::use_awaitable);
            completed_count.fetch_add(1, std::memory_order_relaxed);
          },
          asio::detached);
    }

    co_await Sleep(executor, 30);
    REQUIRE(completed_count.load() == 0);

    // Repeated Set() must not wake anyone twice
    event->Set();
    event->Set();

    co_await Sleep(executor, 30);
    REQUIRE(completed_count.load() == 4);
  });
}

TEST_CASE("BroadcastEvent publishes results set before it",
          "[broadcast_event]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto ready = std::make_shared<BroadcastEvent>(executor);
    auto indexed_files = std::make_shared<std::atomic<int>>(0);
    std::atomic<int> observed{-1};

    asio::co_spawn(
        executor,
        [ready, indexed_files, &observed]() -> asio::awaitable<void> {
          co_await ready->AsyncWait(asio::use_awaitable);
          observed.store(indexed_files->load(std::memory_order_acquire));
        },
        asio::detached);

    // Producer finishes on another thread, then signals
    asio::thread_pool pool(1);
    asio::post(pool, [ready, indexed_files]() {
      indexed_files->store(3, std::memory_order_release);
      ready->Set();
    });
    pool.join();

    co_await Sleep(executor, 30);
    REQUIRE(observed.load() == 3);
  });
}
