#pragma once
#include <chrono>
#include <string>

#ifndef SHARD_VERSION
#define SHARD_VERSION "0.1.0"
#endif

namespace shard {

inline std::string version() { return SHARD_VERSION; }

class Timer {
 public:
  // Create and start the timer
  Timer() : start_(clock::now()) {}

  Timer(const Timer &timer) = delete;
  Timer &operator=(const Timer &timer) = delete;

  Timer(Timer &&timer) = default;
  Timer &operator=(Timer &&timer) = default;

  // Get the time elapsed without stopping the timer. If the template type is
  // not specified, it returns the time counts as represented by
  // std::chrono::seconds
  template <class Duration = std::chrono::seconds>
  double elapsed() const {
    using duration_double =
        std::chrono::duration<double, typename Duration::period>;
    return std::chrono::duration_cast<duration_double>(clock::now() - start_)
        .count();
  }

  void reset() { start_ = clock::now(); }

 private:
  using clock = std::chrono::steady_clock;
  using time_point = std::chrono::time_point<clock>;

  time_point start_;
};

}  // namespace shard
