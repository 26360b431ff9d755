#pragma once
#include "shard/Text.hh"
#include "shard/Types.hh"

namespace shard {

// Blocks of text separated by blank lines (a newline, optional whitespace,
// one or more newlines), as character ranges in text order. Separators belong
// to no block and empty blocks are never produced.
Ranges paragraphs(const Utf8Text &text);

}  // namespace shard
