#include "shard/Text.hh"

#include <algorithm>
#include <utility>

#include "shard/Macros.hh"

namespace shard {

int utf8_sequence_length(char c) {
  // char is 8 bit (1 byte). "xxxxxxxx". Per UTF-8 Encoding rules:
  //   * first 1 bit  is  "0xxxxxxx" => start of a 1-byte character.
  //   * first 3 bits are "110xxxxx" => start of a 2-byte sequence.
  //   * first 4 bits are "1110xxxx" => start of a 3-byte sequence.
  //   * first 5 bits are "11110xxx" => start of a 4-byte sequence.

  // Check leading bit. 0x80 = 1000000, & gets us first bit.
  if ((c & 0x80) == 0) {  // NOLINT
    return 1;
  }

  if ((c & 0xE0) == 0xC0) {  // NOLINT
    return 2;
  }
  if ((c & 0xF0) == 0xE0) {  // NOLINT
    return 3;
  }
  if ((c & 0xF8) == 0xF0) {  // NOLINT
    return 4;
  }

  // Continuation byte (10xxxxxx) or an invalid lead byte.
  return 0;
}

size_t utf8_step(std::string_view text, size_t at) {
  int length = utf8_sequence_length(text[at]);
  if (length <= 1 || at + length > text.size()) {
    return 1;
  }
  for (int i = 1; i < length; i++) {
    if ((text[at + i] & 0xC0) != 0x80) {  // NOLINT
      return 1;
    }
  }
  return length;
}

Utf8Text::Utf8Text(std::string text) : text_(std::move(text)) {
  offsets_.reserve(text_.size() + 1);
  size_t byte_idx = 0;
  while (byte_idx < text_.size()) {
    offsets_.push_back(byte_idx);
    byte_idx += utf8_step(text_, byte_idx);
  }
  offsets_.push_back(text_.size());
}

size_t Utf8Text::to_chars(size_t bytes) const {
  auto query = std::lower_bound(offsets_.begin(), offsets_.end(), bytes);
  SHARD_ABORT_IF(query == offsets_.end(), "Byte offset beyond end of text");
  return static_cast<size_t>(query - offsets_.begin());
}

std::string_view Utf8Text::slice(const Range &range) const {
  SHARD_ABORT_IF(range.begin > range.end || range.end > length(),
                 "Span outside of text");
  Range bytes = to_bytes(range);
  return std::string_view(text_.data() + bytes.begin, bytes.size());
}

std::string_view utf8_prefix(std::string_view text, size_t chars) {
  size_t byte_idx = 0;
  for (size_t i = 0; i < chars && byte_idx < text.size(); i++) {
    byte_idx += utf8_step(text, byte_idx);
  }
  return text.substr(0, byte_idx);
}

}  // namespace shard
