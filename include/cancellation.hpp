#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// Cooperative cancellation flag. Copies share state, so a token can be handed to
// every flow that has to observe a shutdown request at its suspension points.
class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void cancel() {
    {
      std::lock_guard<std::mutex> g(state_->mu);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> g(state_->mu);
    return state_->cancelled;
  }

  // Sleeps for d. Returns false if cancelled before (or while) waiting.
  template <class Rep, class Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lk(state_->mu);
    return !state_->cv.wait_for(lk, d, [this] { return state_->cancelled; });
  }

private:
  struct State {
    mutable std::mutex mu;
    std::condition_variable cv;
    bool cancelled{false};
  };
  std::shared_ptr<State> state_;
};
