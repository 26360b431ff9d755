#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "shard/Types.hh"

namespace shard {

// Returns a sequence length for a UTF-8 multi-byte sequence starting with the
// character. Continuation bytes return 0. 1-byte, 2-byte, 3-byte, 4-byte
// multisequences return their respective length for the start character.
int utf8_sequence_length(char c);

// Number of bytes making up the character at byte offset `at` of text. A byte
// that does not start a well-formed sequence is a character of its own, so
// the result is always at least 1 (for at < text.size()).
size_t utf8_step(std::string_view text, size_t at);

/// Utf8Text binds a UTF-8 string with the byte offset of each of its
/// characters, so that spans can be expressed in characters while slicing
/// and matching keep working on bytes.
///
/// Offsets given to and returned by length(), slice() and to_bytes() are
/// character offsets. Byte offsets are what Regex hands back; to_chars()
/// converts them.
class Utf8Text {
 public:
  Utf8Text() : offsets_{0} {}
  explicit Utf8Text(std::string text);

  const std::string &str() const { return text_; }
  bool empty() const { return text_.empty(); }

  /// Length in characters.
  size_t length() const { return offsets_.size() - 1; }

  /// Byte offset at which character `chars` begins. length() maps to the
  /// size of the string in bytes.
  size_t to_bytes(size_t chars) const { return offsets_[chars]; }

  /// Character offset of byte offset `bytes`. A byte in the middle of a
  /// character is attributed to the next character.
  size_t to_chars(size_t bytes) const;

  Range to_bytes(const Range &chars) const {
    return Range{to_bytes(chars.begin), to_bytes(chars.end)};
  }

  Range to_chars(const Range &bytes) const {
    return Range{to_chars(bytes.begin), to_chars(bytes.end)};
  }

  /// View on the characters in [range.begin, range.end).
  std::string_view slice(const Range &range) const;

 private:
  std::string text_;
  std::vector<size_t> offsets_;  // character index -> byte offset, plus end
};

/// Truncates text to at most `chars` characters.
std::string_view utf8_prefix(std::string_view text, size_t chars);

}  // namespace shard
