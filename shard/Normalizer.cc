#include "shard/Normalizer.hh"

#include "shard/Regex.hh"

namespace shard {

namespace {

constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

void replace_all(std::string &text, std::string_view from,
                 std::string_view to) {
  std::string out;
  out.reserve(text.size());
  size_t cursor = 0;
  size_t hit = text.find(from);
  while (hit != std::string::npos) {
    out.append(text, cursor, hit - cursor);
    out.append(to.data(), to.size());
    cursor = hit + from.size();
    hit = text.find(from, cursor);
  }
  out.append(text, cursor, std::string::npos);
  text.swap(out);
}

}  // namespace

std::string trim(std::string_view text) {
  static const Regex edges(
      "^[\\s\\x{1c}-\\x{1f}]+|[\\s\\x{1c}-\\x{1f}]+\\z", kUnicode);
  return edges.replace(text, "");
}

std::string normalize(std::string_view raw) {
  static const Regex blank_lines("\\n{3,}", kUnicode);

  while (raw.substr(0, kByteOrderMark.size()) == kByteOrderMark) {
    raw.remove_prefix(kByteOrderMark.size());
  }

  std::string text(raw);

  // Order matters: the two-sequence escape goes first so it yields a single
  // newline.
  replace_all(text, "\\r\\n", "\n");
  replace_all(text, "\\n", "\n");
  replace_all(text, "\\r", "\n");

  replace_all(text, "\r\n", "\n");
  replace_all(text, "\r", "\n");
  replace_all(text, "\t", " ");

  text = blank_lines.replace(text, "\n\n");
  return trim(text);
}

}  // namespace shard
