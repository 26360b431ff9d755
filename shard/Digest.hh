#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace shard {

// Lowercase hex SHA-1 of bytes, 40 characters.
std::string sha1_hex(std::string_view bytes);

/// Identifier of a chunk: SHA-1 over "{key}|{index}|{text}". Identical inputs
/// give identical ids across runs and machines, so re-chunking a transcript
/// with the same parameters reproduces its ids.
std::string stable_id(std::string_view key, size_t index,
                      std::string_view text);

}  // namespace shard
