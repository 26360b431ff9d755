#pragma once
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#define SHARD_BREAK std::raise(SIGTRAP)

#define SHARD_TRACE(x)                        \
  do {                                        \
    std::cerr << __FILE__ << ":" << __LINE__; \
    std::cerr << " " << __FUNCTION__ << " ";  \
    std::cerr << #x << ": " << (x) << '\n';   \
  } while (0)

#define SHARD_TRACE2(x, y) \
  SHARD_TRACE(x);          \
  SHARD_TRACE(y)

#define SHARD_ABORT_IF(condition, error) \
  do {                                   \
    if (condition) {                     \
      std::cerr << (error) << '\n';      \
      std::abort();                      \
    }                                    \
  } while (0)

#define SHARD_ABORT(message) \
  do {                       \
    std::cerr << (message);  \
    std::abort();            \
  } while (0)

#ifdef SHARD_ENABLE_LOG
#define LOG(level, ...)               \
  do {                                \
    fprintf(stderr, "[%s] ", #level); \
    fprintf(stderr, __VA_ARGS__);     \
    fprintf(stderr, "\n");            \
  } while (0)
#else  // SHARD_ENABLE_LOG
#define LOG(...) (void)0
#endif  // SHARD_ENABLE_LOG
