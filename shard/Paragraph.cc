#include "shard/Paragraph.hh"

#include "shard/Regex.hh"

namespace shard {

Ranges paragraphs(const Utf8Text &text) {
  // \s plus the information separators U+001C..U+001F.
  static const Regex separator("\\n[\\s\\x{1c}-\\x{1f}]*\\n+", kUnicode);

  Ranges blocks;
  if (text.empty()) {
    return blocks;
  }

  const std::string &bytes = text.str();
  size_t start = 0;
  for (const Range &gap : separator.matches(bytes)) {
    if (gap.begin > start) {
      blocks.push_back(text.to_chars(Range{start, gap.begin}));
    }
    start = gap.end;
  }

  if (start < bytes.size()) {
    blocks.push_back(text.to_chars(Range{start, bytes.size()}));
  }
  return blocks;
}

}  // namespace shard
