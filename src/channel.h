#pragma once

#include "util.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace cmdex {

// Bounded multi-producer, single-consumer queue with an explicit close.
//
// send() blocks while the buffer is full. receive() blocks until a value is
// available or the channel is closed and drained, then returns nullopt. Only one
// party may close; a second close() or a send() after close() is a logic error.
//
// detach_receiver() is the consumer walking away: blocked senders wake up and
// every later send() discards its value and returns false.
template <typename T>
class channel : unmovable {
 public:
  explicit channel(std::size_t capacity) : capacity_{ capacity } {
    if (capacity_ == 0) { throw std::invalid_argument("channel capacity must be positive"); }
  }

  bool send(T value) {
    std::unique_lock<std::mutex> lock{ mutex_ };
    not_full_.wait(lock, [this] {
      return closed_ || detached_ || buffer_.size() < capacity_;
    });

    if (closed_) { throw std::logic_error("channel: send after close"); }
    if (detached_) { return false; }

    buffer_.push_back(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  std::optional<T> receive() {
    std::unique_lock<std::mutex> lock{ mutex_ };
    not_empty_.wait(lock, [this] { return closed_ || !buffer_.empty(); });

    if (buffer_.empty()) { return std::nullopt; }

    T value{ std::move(buffer_.front()) };
    buffer_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return value;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock{ mutex_ };
      if (closed_) { throw std::logic_error("channel: closed more than once"); }
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  void detach_receiver() {
    {
      std::lock_guard<std::mutex> lock{ mutex_ };
      detached_ = true;
      buffer_.clear();
    }
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock{ mutex_ };
    return closed_;
  }

  bool receiver_detached() const {
    std::lock_guard<std::mutex> lock{ mutex_ };
    return detached_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock{ mutex_ };
    return buffer_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  std::size_t const capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> buffer_;
  bool closed_{ false };
  bool detached_{ false };
};

}  // namespace cmdex
