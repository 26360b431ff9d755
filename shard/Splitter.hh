#pragma once
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "shard/Regex.hh"
#include "shard/Text.hh"
#include "shard/Types.hh"

namespace shard {

/// A Boundary recognizes where sentences end in some script. Given text, it
/// returns the byte offsets immediately past each sentence end, ascending.
class Boundary {
 public:
  virtual ~Boundary() = default;
  virtual std::vector<size_t> ends(std::string_view text) const = 0;
};

/// Sentence ends are the ends of the matches of a pattern.
class PatternBoundary : public Boundary {
 public:
  explicit PatternBoundary(const std::string &pattern);
  std::vector<size_t> ends(std::string_view text) const override;

 private:
  Regex regex_;
};

// `.`, `!` or `?` followed by whitespace or the end of text.
std::unique_ptr<Boundary> latin_boundary();

// The Korean terminal syllables 다, 요, 함 followed by a period, followed by
// whitespace or the end of text.
std::unique_ptr<Boundary> korean_boundary();

/// Splitter cuts a block that does not fit into `max_chars` into pieces that
/// do, cutting at sentence ends where it can.
///
/// Pieces are accumulated sentence by sentence. When the next sentence does
/// not fit, the piece is closed at the last sentence end that did. If not even
/// the first sentence of a piece fits, the piece is cut at exactly
/// `max_chars` characters, mid-sentence. Text without any sentence end is cut
/// into fixed-width pieces of `max_chars`.
class Splitter {
 public:
  /// Splitter with the Latin and Korean recognizers.
  Splitter();
  explicit Splitter(std::vector<std::unique_ptr<Boundary>> boundaries);

  void add(std::unique_ptr<Boundary> boundary);

  /// Byte offsets past each sentence end in text, merged over all
  /// recognizers, ascending and without duplicates.
  std::vector<size_t> sentence_ends(std::string_view text) const;

  /// Splits `block`, a character range of text, into character ranges each
  /// at most max_chars long. A block that fits is returned as is.
  Ranges operator()(const Utf8Text &text, const Range &block,
                    size_t max_chars) const;

 private:
  std::vector<std::unique_ptr<Boundary>> boundaries_;
};

// Appends [from, to) shifted by base, as consecutive pieces of width.
void slice_fixed(size_t base, size_t from, size_t to, size_t width,
                 Ranges &out);

// Auxiliary function to print a chunk of text as a single line,
// replacing line breaks by blanks. This is faster than doing a
// global replacement in a string first.
std::ostream &single_line(
    std::ostream &out,          // destination stream
    std::string_view span,      // text span to be printed in a single line
    std::string_view end = "");  // stuff to put at end of line

}  // namespace shard
