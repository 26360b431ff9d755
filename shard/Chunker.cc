#include "shard/Chunker.hh"

#include <stdexcept>
#include <utility>

#include "shard/Digest.hh"
#include "shard/Macros.hh"
#include "shard/Normalizer.hh"
#include "shard/Spans.hh"

namespace shard {

Chunker::Chunker(const Config &config) : config_(config) {
  if (config_.max_chars <= 0) {
    throw std::invalid_argument("max_chars must be positive, got " +
                                std::to_string(config_.max_chars));
  }
  if (config_.overlap_chars < 0) {
    throw std::invalid_argument("overlap_chars must not be negative, got " +
                                std::to_string(config_.overlap_chars));
  }
}

Ranges Chunker::spans(const Utf8Text &normalized) const {
  Ranges base = base_spans(normalized, config_.max_chars, splitter_);
  return apply_overlap(std::move(base), config_.overlap_chars);
}

Chunks Chunker::chunk(const Record &record) const {
  return chunk(record, normalize(record.transcript));
}

Chunks Chunker::chunk(const Record &record,
                      const std::string &normalized) const {
  Chunks chunks;
  if (normalized.empty()) {
    return chunks;
  }

  // Text that did not come from normalize() may end in blank lines, which
  // no span covers.
  Utf8Text text(normalized);
  Ranges ranges = spans(text);

  chunks.reserve(ranges.size());
  for (size_t index = 0; index < ranges.size(); index++) {
    const Range &range = ranges[index];
    std::string slice(text.slice(range));
    std::string id = stable_id(record.key, index, slice);
    chunks.push_back(Chunk{
        record.key,        //
        record.date,       //
        record.name,       //
        index,             //
        std::move(id),     //
        range.begin,       //
        range.end,         //
        std::move(slice),  //
    });
  }

  LOG(info, "%s: %zu characters, %zu chunks", record.key.c_str(),
      text.length(), chunks.size());
  return chunks;
}

ChunkStream::ChunkStream(std::vector<Record> records, const Chunker &chunker)
    : records_(std::move(records)), chunker_(chunker) {}

ChunkStream::Iterator::Iterator(const ChunkStream *stream) : stream_(stream) {
  fill();
}

void ChunkStream::Iterator::fill() {
  const std::vector<Record> &records = stream_->records_;
  while (record_ < records.size()) {
    buffer_ = stream_->chunker_.chunk(records[record_]);
    position_ = 0;
    if (!buffer_.empty()) {
      return;
    }
    ++record_;
  }

  // Exhausted, become end().
  *this = Iterator();
}

ChunkStream::Iterator &ChunkStream::Iterator::operator++() {
  ++position_;
  if (position_ == buffer_.size()) {
    ++record_;
    fill();
  }
  return *this;
}

}  // namespace shard
