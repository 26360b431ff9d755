#include "shard/Spans.hh"

#include <algorithm>
#include <optional>

#include "shard/Paragraph.hh"

namespace shard {

Ranges base_spans(const Utf8Text &text, size_t max_chars,
                  const Splitter &splitter) {
  Ranges spans;

  // The span being accumulated, if any. Paragraphs either extend it, or flush
  // it and open a new one (or bypass it entirely when oversized).
  std::optional<Range> pending;

  for (const Range &block : paragraphs(text)) {
    if (pending && block.end - pending->begin <= max_chars) {
      pending->end = block.end;
      continue;
    }

    if (pending) {
      spans.push_back(*pending);
      pending.reset();
    }

    if (block.size() <= max_chars) {
      pending = block;
    } else {
      Ranges pieces = splitter(text, block, max_chars);
      spans.insert(spans.end(), pieces.begin(), pieces.end());
    }
  }

  if (pending) {
    spans.push_back(*pending);
  }
  return spans;
}

Ranges apply_overlap(Ranges spans, size_t overlap) {
  if (spans.empty() || overlap == 0) {
    return spans;
  }

  size_t previous_end = spans.front().end;
  for (size_t i = 1; i < spans.size(); i++) {
    Range &span = spans[i];
    size_t reach = previous_end > overlap ? previous_end - overlap : 0;
    previous_end = span.end;
    span.begin = std::min(span.begin, reach);
  }
  return spans;
}

}  // namespace shard
