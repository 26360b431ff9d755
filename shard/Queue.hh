#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace shard {

/// A blocking first-in first-out queue shared between producers and a pool of
/// consumers.
template <class Item>
class Threadsafe {
 public:
  Threadsafe() = default;
  ~Threadsafe() { shutdown(); }

  Threadsafe(const Threadsafe &) = delete;
  Threadsafe &operator=(const Threadsafe &) = delete;

  /// Throws std::runtime_error once shutdown() has been called.
  void enqueue(Item item) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (shutdown_) {
      throw std::runtime_error("Enqueue on a queue that is shutting down.");
    }
    items_.push_back(std::move(item));
    work_.notify_one();
  }

  // Signals shut down. After this no new items can be enqueued, but all
  // enqueued items are still handed out.
  void shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    shutdown_ = true;
    work_.notify_all();
  }

  /// Blocks until an item is available. Returns nullopt only when the queue
  /// is shut down and drained.
  std::optional<Item> generate() {
    std::unique_lock<std::mutex> lock(mutex_);
    work_.wait(lock, [this]() { return !items_.empty() || shutdown_; });
    if (items_.empty()) {
      return std::nullopt;
    }
    Item item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

 private:
  std::deque<Item> items_;

  // Are we shutting down?
  bool shutdown_ = false;

  // Lock on this object.
  std::mutex mutex_;

  // Signaled when there are items to process.
  std::condition_variable work_;
};

}  // namespace shard
