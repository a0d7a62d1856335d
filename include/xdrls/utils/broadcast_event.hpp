#pragma once

#include <memory>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

namespace xdrls::utils {

// One-shot notification that wakes every waiter at once.
//
// AsyncWait() before Set() queues the waiter; AsyncWait() after Set()
// completes immediately. Carries no data: the producer publishes its result
// elsewhere (the index store) and then calls Set().
//
// State lives behind a shared_ptr so handlers already posted to the strand
// stay valid if the event is destroyed first.
class BroadcastEvent {
 public:
  explicit BroadcastEvent(asio::any_io_executor executor)
      : state_(std::make_shared<State>(executor)) {
  }

  ~BroadcastEvent() = default;

  BroadcastEvent(const BroadcastEvent&) = delete;
  auto operator=(const BroadcastEvent&) -> BroadcastEvent& = delete;
  BroadcastEvent(BroadcastEvent&&) = delete;
  auto operator=(BroadcastEvent&&) -> BroadcastEvent& = delete;

  // Example:
  //   co_await ready.AsyncWait(asio::use_awaitable);
  template <typename CompletionToken>
  auto AsyncWait(CompletionToken&& token) {
    return asio::async_initiate<CompletionToken, void()>(
        [state = state_](auto handler) {
          asio::post(state->strand, [state, h = std::move(handler)]() mutable {
            if (state->ready) {
              asio::post(state->executor, std::move(h));
            } else {
              state->waiters.push_back(
                  std::make_unique<ConcreteHandler<decltype(h)>>(std::move(h)));
            }
          });
        },
        std::forward<CompletionToken>(token));
  }

  // Idempotent; callable from any thread
  auto Set() -> void {
    asio::post(state_->strand, [state = state_]() {
      if (state->ready) {
        return;
      }
      state->ready = true;

      auto waiters = std::move(state->waiters);
      state->waiters.clear();
      for (auto& handler : waiters) {
        asio::post(state->executor, [h = std::move(handler)]() mutable {
          h->Invoke();
        });
      }
    });
  }

  // Racy snapshot, for tests and logging only
  [[nodiscard]] auto IsSet() const -> bool {
    return state_->ready;
  }

 private:
  struct Handler {
    Handler() = default;
    virtual ~Handler() = default;
    Handler(const Handler&) = delete;
    auto operator=(const Handler&) -> Handler& = delete;
    Handler(Handler&&) = delete;
    auto operator=(Handler&&) -> Handler& = delete;
    virtual auto Invoke() -> void = 0;
  };

  template <typename F>
  struct ConcreteHandler : Handler {
    explicit ConcreteHandler(F&& f) : func(std::move(f)) {
    }
    auto Invoke() -> void override {
      func();
    }
    F func;
  };

  struct State {
    explicit State(asio::any_io_executor exec)
        : executor(exec), strand(asio::make_strand(exec)) {
    }

    asio::any_io_executor executor;
    // Guards ready and waiters
    asio::strand<asio::any_io_executor> strand;
    bool ready = false;
    std::vector<std::unique_ptr<Handler>> waiters;
  };

  std::shared_ptr<State> state_;
};

}  // namespace xdrls::utils
