#pragma once
#include <string>
#include <string_view>

namespace shard {

/// Canonicalizes a raw transcript before it is segmented:
///
///   1. leading byte-order marks are dropped,
///   2. escaped line breaks left over from serialization (a backslash
///      followed by `r` or `n`) become real ones,
///   3. CRLF and lone CR become LF, tabs become a single space,
///   4. runs of three or more newlines collapse to a blank line,
///   5. surrounding whitespace is trimmed.
///
/// Never fails; an empty input gives an empty output. All offsets handed out
/// by the chunker refer to the string returned here.
std::string normalize(std::string_view raw);

// Strips leading and trailing Unicode whitespace, and the ASCII information
// separators U+001C..U+001F.
std::string trim(std::string_view text);

}  // namespace shard
