// include/shardio/parallel/bounded_queue.hpp
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace shardio {

// Blocking MPMC queue bounded by a cost budget (1 per item for task queues,
// record bytes for the reader output queue). An item costlier than the whole
// budget is still admitted once the queue is empty, so it cannot wedge.
//
// close(): no more pushes; pops drain what is left, then return nullopt.
template <class T>
class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Blocks until there is room or the queue is closed. false if closed.
  bool push(T item, size_t cost = 1) {
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, [&] { return closed_ || fits_locked(cost); });
    if (closed_) return false;
    q_.emplace_back(std::move(item), cost);
    used_ += cost;
    not_empty_.notify_one();
    return true;
  }

  // Blocks until an item is available or the queue is closed and empty.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, [&] { return closed_ || !q_.empty(); });
    if (q_.empty()) return std::nullopt;
    auto [item, cost] = std::move(q_.front());
    q_.pop_front();
    used_ -= cost;
    not_full_.notify_all();
    return std::move(item);
  }

  void close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Drops queued items; producers blocked on a full queue wake up.
  void clear() {
    std::lock_guard<std::mutex> lk(mu_);
    q_.clear();
    used_ = 0;
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

  size_t cost() const {
    std::lock_guard<std::mutex> lk(mu_);
    return used_;
  }

  size_t capacity() const noexcept { return capacity_; }

private:
  bool fits_locked(size_t cost) const {
    return q_.empty() || used_ + cost <= capacity_;
  }

  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<std::pair<T, size_t>> q_;
  size_t used_ = 0;
  bool closed_ = false;
};

} // namespace shardio
