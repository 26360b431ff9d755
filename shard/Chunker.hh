#pragma once
#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

#include "shard/Splitter.hh"
#include "shard/Text.hh"
#include "shard/Types.hh"

namespace shard {

class Chunker {
 public:
  struct Config {
    // NOLINTBEGIN
    int max_chars = 1200;
    int overlap_chars = 200;
    // NOLINTEND

    template <class App>
    void setup_onto(App &app) {
      // clang-format off
      app.add_option("--max-chars", max_chars, "Maximum characters in a chunk.");
      app.add_option("--overlap-chars", overlap_chars, "Characters of the previous chunk repeated at the start of the next.");
      // clang-format on
    }
  };

  /// Throws std::invalid_argument unless max_chars > 0 and
  /// overlap_chars >= 0.
  explicit Chunker(const Config &config);

  /// Normalizes record.transcript and cuts it into chunks. An empty
  /// transcript gives no chunks.
  Chunks chunk(const Record &record) const;

  /// Same, for a transcript already passed through normalize(). Other text is
  /// chunked as given: offsets refer to it, and blank lines at either end are
  /// left out of every chunk.
  Chunks chunk(const Record &record, const std::string &normalized) const;

  /// Character spans of the chunks of normalized text, before materializing.
  Ranges spans(const Utf8Text &normalized) const;

  const Config &config() const { return config_; }

 private:
  Config config_;
  Splitter splitter_;
};

/// Chunks of a sequence of records, concatenated in record order and produced
/// lazily: only the chunks of the current record are held at any time.
/// Iterating again starts over from the first record.
class ChunkStream {
 public:
  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Chunk;
    using difference_type = std::ptrdiff_t;
    using pointer = const Chunk *;
    using reference = const Chunk &;

    Iterator() = default;

    reference operator*() const { return buffer_[position_]; }
    pointer operator->() const { return &buffer_[position_]; }
    Iterator &operator++();

    friend bool operator==(const Iterator &a, const Iterator &b) {
      return a.stream_ == b.stream_ && a.record_ == b.record_ &&
             a.position_ == b.position_;
    }
    friend bool operator!=(const Iterator &a, const Iterator &b) {
      return !(a == b);
    }

   private:
    friend class ChunkStream;
    explicit Iterator(const ChunkStream *stream);

    // Loads records from record_ on until one has chunks or none are left.
    void fill();

    const ChunkStream *stream_ = nullptr;
    size_t record_ = 0;
    size_t position_ = 0;
    Chunks buffer_;
  };

  ChunkStream(std::vector<Record> records, const Chunker &chunker);

  Iterator begin() const { return Iterator(this); }
  Iterator end() const { return Iterator(); }

  const std::vector<Record> &records() const { return records_; }

 private:
  std::vector<Record> records_;
  const Chunker &chunker_;
};

}  // namespace shard
