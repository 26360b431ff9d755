#pragma once
#include <cstddef>

#include "shard/Splitter.hh"
#include "shard/Text.hh"
#include "shard/Types.hh"

namespace shard {

/// Packs consecutive paragraphs of text greedily into spans of at most
/// max_chars characters. A paragraph that does not fit on its own is handed
/// to splitter and never shares a span with its neighbours.
///
/// The result covers every paragraph in order, with starts non-decreasing and
/// no span longer than max_chars. max_chars must be positive; the Chunker
/// checks this before getting here.
Ranges base_spans(const Utf8Text &text, size_t max_chars,
                  const Splitter &splitter);

/// Pulls the start of every span but the first back to overlap characters
/// before the end of the span preceding it, if that is earlier. Ends are left
/// alone. Overlap is taken from the immediately preceding span only.
Ranges apply_overlap(Ranges spans, size_t overlap);

}  // namespace shard
