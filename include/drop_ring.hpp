#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <vector>

// Fixed-capacity FIFO that never blocks the writer. Slots are allocated once; when
// the ring is full, push() overwrites the oldest slot in place and counts a drop.
// A single reader may lease the oldest element instead of popping it: the slot
// stays occupied until release(), so the leased element still counts against
// capacity and is evicted like any other if the writer overruns the ring.
template <class T>
class DropOldestRing {
public:
  explicit DropOldestRing(size_t capacity) : slots_(capacity) {
    if (capacity == 0) throw std::invalid_argument("ring capacity must be >= 1");
  }

  // Returns true when an older element was evicted to make room.
  bool push(T v) {
    bool evicted = false;
    {
      std::lock_guard<std::mutex> g(mu_);
      if (closed_) return false;
      if (count_ == slots_.size()) {
        // Overwrite the oldest slot and advance head past it. A lease on that
        // slot is lost.
        slots_[head_] = std::move(v);
        leased_ = false;
        head_ = (head_ + 1) % slots_.size();
        dropped_++;
        evicted = true;
      } else {
        slots_[(head_ + count_) % slots_.size()] = std::move(v);
        count_++;
        if (count_ > high_water_) high_water_ = count_;
      }
    }
    cv_.notify_one();
    return evicted;
  }

  bool try_pop(T& out) {
    std::lock_guard<std::mutex> g(mu_);
    return pop_locked(out);
  }

  // Waits up to d for an element. After close(), remaining elements are still
  // handed out; false is returned once the ring is closed and empty.
  bool pop_for(T& out, std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, d, [&] { return closed_ || count_ > 0; });
    return pop_locked(out);
  }

  // Moves the oldest element into out and keeps its slot until release().
  // Fails while a lease is already held.
  bool lease_for(T& out, std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, d, [&] { return closed_ || (count_ > 0 && !leased_); });
    if (count_ == 0 || leased_) return false;
    out = std::move(slots_[head_]);
    leased_ = true;
    return true;
  }

  // Frees the leased slot. Returns false when push() evicted it first.
  bool release() {
    std::lock_guard<std::mutex> g(mu_);
    if (!leased_) return false;
    leased_ = false;
    slots_[head_] = T{};
    head_ = (head_ + 1) % slots_.size();
    count_--;
    return true;
  }

  bool lease_held() const {
    std::lock_guard<std::mutex> g(mu_);
    return leased_;
  }

  void close() {
    {
      std::lock_guard<std::mutex> g(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Empties the ring, returning how many elements were discarded.
  size_t clear() {
    std::lock_guard<std::mutex> g(mu_);
    size_t n = count_;
    for (size_t i = 0; i < count_; ++i) slots_[(head_ + i) % slots_.size()] = T{};
    head_ = 0;
    count_ = 0;
    leased_ = false;
    return n;
  }

  bool closed() const {
    std::lock_guard<std::mutex> g(mu_);
    return closed_;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return count_;
  }
  size_t capacity() const { return slots_.size(); }
  size_t high_water() const {
    std::lock_guard<std::mutex> g(mu_);
    return high_water_;
  }
  uint64_t dropped() const {
    std::lock_guard<std::mutex> g(mu_);
    return dropped_;
  }

private:
  bool pop_locked(T& out) {
    if (count_ == 0 || leased_) return false;
    out = std::move(slots_[head_]);
    slots_[head_] = T{};
    head_ = (head_ + 1) % slots_.size();
    count_--;
    return true;
  }

  std::vector<T> slots_;
  size_t head_{0};
  size_t count_{0};
  size_t high_water_{0};
  uint64_t dropped_{0};
  bool closed_{false};
  bool leased_{false};
  mutable std::mutex mu_;
  std::condition_variable cv_;
};
