#include "shard/Splitter.hh"

#include <algorithm>
#include <utility>

namespace shard {

PatternBoundary::PatternBoundary(const std::string &pattern)
    : regex_(pattern, kUnicode) {}

std::vector<size_t> PatternBoundary::ends(std::string_view text) const {
  std::vector<size_t> ends;
  for (const Range &match : regex_.matches(text)) {
    ends.push_back(match.end);
  }
  return ends;
}

namespace {

// Followed by whitespace, an information separator, or the end of text.
constexpr const char *kBeforeSpace = "(?=[\\s\\x{1c}-\\x{1f}]|$)";

}  // namespace

std::unique_ptr<Boundary> latin_boundary() {
  return std::make_unique<PatternBoundary>(std::string("[.!?]") +
                                           kBeforeSpace);
}

std::unique_ptr<Boundary> korean_boundary() {
  return std::make_unique<PatternBoundary>(std::string("(?:다|요|함)\\.") +
                                           kBeforeSpace);
}

Splitter::Splitter() {
  add(latin_boundary());
  add(korean_boundary());
}

Splitter::Splitter(std::vector<std::unique_ptr<Boundary>> boundaries)
    : boundaries_(std::move(boundaries)) {}

void Splitter::add(std::unique_ptr<Boundary> boundary) {
  boundaries_.push_back(std::move(boundary));
}

std::vector<size_t> Splitter::sentence_ends(std::string_view text) const {
  std::vector<size_t> ends;
  for (const auto &boundary : boundaries_) {
    std::vector<size_t> found = boundary->ends(text);
    ends.insert(ends.end(), found.begin(), found.end());
  }
  std::sort(ends.begin(), ends.end());
  ends.erase(std::unique(ends.begin(), ends.end()), ends.end());
  return ends;
}

void slice_fixed(size_t base, size_t from, size_t to, size_t width,
                 Ranges &out) {
  for (size_t i = from; i < to; i += width) {
    out.push_back(Range{base + i, base + std::min(i + width, to)});
  }
}

Ranges Splitter::operator()(const Utf8Text &text, const Range &block,
                            size_t max_chars) const {
  size_t length = block.size();
  if (length <= max_chars) {
    return {block};
  }

  // Sentence ends, as character offsets local to the block.
  Range bytes = text.to_bytes(block);
  std::string_view view(text.str().data() + bytes.begin, bytes.size());
  std::vector<size_t> ends = sentence_ends(view);
  for (size_t &end : ends) {
    end = text.to_chars(bytes.begin + end) - block.begin;
  }

  Ranges spans;
  if (ends.empty()) {
    slice_fixed(block.begin, 0, length, max_chars, spans);
    return spans;
  }

  auto emit = [&spans, &block](size_t begin, size_t end) {
    spans.push_back(Range{block.begin + begin, block.begin + end});
  };

  size_t current = 0;  // start of the piece being accumulated
  size_t last = 0;     // last accepted sentence end in the piece
  for (size_t end : ends) {
    if (end - current <= max_chars) {
      last = end;
      continue;
    }

    if (last == current) {
      // Not even the first sentence fits, cut mid-sentence.
      size_t hard = std::min(current + max_chars, length);
      emit(current, hard);
      current = hard;
    } else {
      emit(current, last);
      current = last;
    }
    last = current;

    if (end - current <= max_chars) {
      last = end;
    }
  }

  if (last > current) {
    emit(current, last);
    current = last;
  }
  slice_fixed(block.begin, current, length, max_chars, spans);
  return spans;
}

std::ostream &single_line(
    std::ostream &out,      // destination stream
    std::string_view span,  // text span to be printed in a single line
    std::string_view end) {  // stuff to put at end of line
  static const Regex pattern(R"(^\s*(.*)\R+\s*)", kUnicode);
  Match match(pattern);
  int success = pattern.consume(&span, &match);
  while (success > 0) {
    auto m = match[1];
    out.write(m.data(), m.size());
    out.write(" ", 1);
    success = pattern.consume(&span, &match);
  }
  out.write(span.data(), span.size());
  out.write(end.data(), end.size());
  return out;
}

}  // namespace shard
