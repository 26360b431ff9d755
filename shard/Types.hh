#pragma once
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace shard {

/// Range stores indices for half-interval [begin, end) in a string. Depending
/// on where it comes from, indices are bytes (regex matches) or characters
/// (spans over normalized text).
struct Range {
  size_t begin;
  size_t end;
  size_t size() const { return end - begin; }
};

inline bool operator==(const Range &a, const Range &b) {
  return a.begin == b.begin && a.end == b.end;
}

inline bool operator!=(const Range &a, const Range &b) { return !(a == b); }

using Ranges = std::vector<Range>;

/// A meeting transcript as handed over by a record source. The core only
/// reads from it.
struct Record {
  std::string key;   ///< Opaque, stable identifier of the meeting.
  std::string date;  ///< YYYY-MM-DD, or empty when unknown.
  std::string name;  ///< Display name.
  std::string transcript;
  size_t index = 0;    ///< Position of the record in its source.
  std::string source;  ///< Where the record was read from, if anywhere.
};

/// One chunk of a normalized transcript. begin and end are character offsets
/// into the normalized text, text is the UTF-8 slice they denote.
struct Chunk {
  std::string key;
  std::string date;
  std::string name;
  size_t index;
  std::string id;  ///< 40 hex characters, see stable_id().
  size_t begin;
  size_t end;
  std::string text;
};

using Chunks = std::vector<Chunk>;

/// Per-meeting bookkeeping emitted next to the chunks.
struct Summary {
  std::string key;
  std::string date;
  std::string name;
  size_t length;  ///< Characters in the normalized transcript.
  size_t chunk_count;
  std::string source;
};

template <class T>
using Ptr = std::shared_ptr<T>;

using Promise = std::promise<Chunks>;
using Future = std::future<Chunks>;

}  // namespace shard
