#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// Bounded multi-producer queue with close semantics. Producers block while
// the queue is full; receive() drains what is left after close() and then
// reports end of stream with std::nullopt.
template<typename T>
class BoundedChannel {
public:
  explicit BoundedChannel(std::size_t capacity = 16)
    : capacity_(capacity == 0 ? 1 : capacity) {}

  // False when the channel was closed before the value could be queued.
  bool send(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [&]{ return closed_ || queue_.size() < capacity_; });
    if(closed_) return false;
    queue_.push_back(std::move(value));
    not_empty_.notify_one();
    return true;
  }

  std::optional<T> receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [&]{ return closed_ || !queue_.empty(); });
    return pop_locked();
  }

  // Waits until `deadline` at most; nullopt on timeout or end of stream.
  std::optional<T> receive_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_until(lock, deadline, [&]{ return closed_ || !queue_.empty(); });
    return pop_locked();
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

private:
  std::optional<T> pop_locked() {
    if(queue_.empty()) return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> queue_;
  bool closed_ = false;
};
