#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include "shard/Types.hh"

namespace shard {

// Inspired by https://github.com/luvit/pcre2/blob/master/src/pcre2demo.c
class Match;

/// Compile options for patterns over transcript text: UTF-8 subjects,
/// Unicode semantics for \s, \d and friends, and tolerance for byte sequences
/// that are not valid UTF-8 (they never take part in a match).
constexpr uint32_t kUnicode =
    PCRE2_UTF | PCRE2_UCP | PCRE2_MATCH_INVALID_UTF;  // NOLINT

class Regex {
 public:
  /// Throws std::invalid_argument if the pattern does not compile.
  Regex(const std::string &pattern,  // pattern to be compiled
        uint32_t options             // pcre2 options for regex compilation
  );
  ~Regex();

  Regex(const Regex &) = delete;
  Regex &operator=(const Regex &) = delete;

  int find(std::string_view subj,  // the string (view) agains we are matching
           Match *M,               // where to store the results of the match
           size_t start = 0,       // where to start searching in the string
           uint32_t options = 0    // search options
  ) const;

  int consume(
      std::string_view *subj,  // the string (view) agains we are matching
      Match *M,                // where to store the results of the match
      uint32_t options = 0     // search options
  ) const;

  /// Byte ranges of all non-overlapping matches of the whole pattern, left to
  /// right.
  Ranges matches(std::string_view subj) const;

  /// Replaces every match in subj by replacement. `$` in the replacement
  /// refers to groups, as in pcre2_substitute.
  std::string replace(std::string_view subj,
                      const std::string &replacement) const;

  const pcre2_code *get_pcre2_code() const;  // return compiled regex
  std::string get_error_message() const;     // return error message
  const std::string &pattern() const { return pattern_; }

 private:
  std::string pattern_;

  PCRE2_SIZE error_offset_ = 0;
  int error_number_ = 0;
  pcre2_code *const re_;
};

class Match {
 public:
  pcre2_match_data *const match_data;  // stores matching offsets
  const char *data{nullptr};           // beginning of subject text span
  int num_matched_groups{0};
  std::string_view operator[](int i) const;
  Range range(int i) const;  // offsets of group i within the subject
  explicit Match(const pcre2_code *re);
  explicit Match(const Regex &re);
  ~Match();

  Match(const Match &) = delete;
  Match &operator=(const Match &) = delete;
};

}  // namespace shard
