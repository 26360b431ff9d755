#include "shard/Record.hh"

#include <cstdio>
#include <initializer_list>
#include <string>

#include "shard/Digest.hh"
#include "shard/Normalizer.hh"
#include "shard/Regex.hh"
#include "shard/Text.hh"

namespace shard {

namespace {

constexpr size_t kDateScanLength = 50;
constexpr size_t kKeyLength = 12;

std::string ymd(std::string_view year, std::string_view month,
                std::string_view day) {
  char buffer[16];  // NOLINT
  std::snprintf(buffer, sizeof(buffer), "%.4s-%02d-%02d", year.data(),
                std::stoi(std::string(month)), std::stoi(std::string(day)));
  return std::string(buffer);
}

}  // namespace

std::string normalize_date(std::string_view value) {
  // Digits are ASCII only, everything else Unicode aware.
  static const Regex numeric(
      R"(([0-9]{4})[./-]([0-9]{1,2})[./-]([0-9]{1,2}))", kUnicode);
  static const Regex korean(
      R"(([0-9]{4})[\s\x{1c}-\x{1f}]*년[\s\x{1c}-\x{1f}]*([0-9]{1,2}))"
      R"([\s\x{1c}-\x{1f}]*월[\s\x{1c}-\x{1f}]*([0-9]{1,2}))"
      R"([\s\x{1c}-\x{1f}]*일)", kUnicode);

  std::string trimmed = trim(value);
  std::string_view head = utf8_prefix(trimmed, kDateScanLength);
  if (head.empty()) {
    return "";
  }

  for (const Regex *pattern : {&numeric, &korean}) {
    Match match(*pattern);
    if (pattern->find(head, &match) > 0) {
      return ymd(match[1], match[2], match[3]);
    }
  }

  Utf8Text text{std::string(head)};
  if (text.length() >= 10 && text.slice(Range{4, 5}) == "-" &&
      text.slice(Range{7, 8}) == "-") {
    return std::string(text.slice(Range{0, 10}));
  }
  return "";
}

std::string meeting_key(std::string_view name, std::string_view date,
                        size_t index) {
  std::string payload;
  payload.append(name.data(), name.size());
  payload += '|';
  payload.append(date.data(), date.size());
  payload += '|';
  payload += std::to_string(index);
  return sha1_hex(payload).substr(0, kKeyLength);
}

Summary summarize(const Record &record, const Chunks &chunks) {
  Utf8Text text(normalize(record.transcript));
  return Summary{
      record.key,      //
      record.date,     //
      record.name,     //
      text.length(),   //
      chunks.size(),   //
      record.source,   //
  };
}

}  // namespace shard
