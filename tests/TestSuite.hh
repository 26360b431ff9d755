#pragma once
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

#include "shard/Types.hh"

#define SHARD_CHECK(condition)                                                \
  do {                                                                        \
    if (!(condition)) {                                                       \
      fprintf(stderr, "%s:%d %s failed\n", __FILE__, __LINE__, (#condition)); \
      throw std::runtime_error("Failed test");                                \
    }                                                                         \
    fprintf(stderr, "%s:%d %s success\n", __FILE__, __LINE__, (#condition));  \
  } while (0)

#define SHARD_CHECK_EQUAL(lhs, rhs)                                    \
  do {                                                                 \
    if (!((lhs) == (rhs))) {                                           \
      std::cerr << __FILE__ << ":" << __LINE__ << " " << #lhs          \
                << " == " << #rhs << " failed\n";                      \
      std::cerr << "  lhs: " << (lhs) << "\n  rhs: " << (rhs) << "\n"; \
      throw std::runtime_error("Failed test");                         \
    }                                                                  \
    fprintf(stderr, "%s:%d %s == %s success\n", __FILE__, __LINE__,    \
            (#lhs), (#rhs));                                           \
  } while (0)

#define SHARD_CHECK_THROWS(statement, exception)                         \
  do {                                                                   \
    bool thrown = false;                                                 \
    try {                                                                \
      statement;                                                         \
    } catch (const exception &) {                                        \
      thrown = true;                                                     \
    }                                                                    \
    if (!thrown) {                                                       \
      fprintf(stderr, "%s:%d %s did not throw %s\n", __FILE__, __LINE__, \
              (#statement), (#exception));                               \
      throw std::runtime_error("Failed test");                           \
    }                                                                    \
    fprintf(stderr, "%s:%d %s throws %s\n", __FILE__, __LINE__,          \
            (#statement), (#exception));                                 \
  } while (0)

namespace shard {

inline std::ostream &operator<<(std::ostream &out, const Range &range) {
  return out << "[" << range.begin << ", " << range.end << ")";
}

inline std::ostream &operator<<(std::ostream &out, const Ranges &ranges) {
  out << "{";
  std::string separator;
  for (const Range &range : ranges) {
    out << separator << range;
    separator = ", ";
  }
  return out << "}";
}

template <class T>
std::ostream &operator<<(std::ostream &out, const std::vector<T> &values) {
  out << "{";
  std::string separator;
  for (const T &value : values) {
    out << separator << value;
    separator = ", ";
  }
  return out << "}";
}

}  // namespace shard
