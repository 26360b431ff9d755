#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "shard/Types.hh"

namespace shard {

/// Extracts a YYYY-MM-DD date from free text such as a meeting title or a
/// timestamp column. Recognizes, in this order, within the first 50
/// characters of the trimmed input:
///
///   * 2024-3-7, 2024.03.07, 2024/3/07 (any of - . / as separators),
///   * 2024년 3월 7일 (whitespace between parts optional),
///   * anything with `-` at positions 4 and 7, cut to ten characters.
///
/// Month and day are zero-padded. Returns an empty string if nothing matches.
std::string normalize_date(std::string_view value);

/// Key for a record whose source carries none: the first 12 hex characters
/// of SHA-1 over "{name}|{date}|{index}".
std::string meeting_key(std::string_view name, std::string_view date,
                        size_t index);

Summary summarize(const Record &record, const Chunks &chunks);

}  // namespace shard
