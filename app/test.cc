#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "shard/shard.hh"
#include "tests/TestSuite.hh"

namespace shard {

namespace {

Ranges spans_of(const Chunks &chunks) {
  Ranges spans;
  for (const Chunk &chunk : chunks) {
    spans.push_back(Range{chunk.begin, chunk.end});
  }
  return spans;
}

std::vector<std::string> ids_of(const Chunks &chunks) {
  std::vector<std::string> ids;
  for (const Chunk &chunk : chunks) {
    ids.push_back(chunk.id);
  }
  return ids;
}

Record make_record(const std::string &key, const std::string &transcript) {
  Record record;
  record.key = key;
  record.date = "2026-02-02";
  record.name = "Meeting";
  record.transcript = transcript;
  return record;
}

Chunker make_chunker(int max_chars, int overlap_chars) {
  Chunker::Config config;
  config.max_chars = max_chars;
  config.overlap_chars = overlap_chars;
  return Chunker(config);
}

// Paragraphs of sentences of varying count, enough to need several chunks.
std::string long_transcript() {
  std::string text;
  for (int i = 0; i < 30; i++) {  // NOLINT
    if (i > 0) {
      text += "\n\n";
    }
    for (int j = 0; j <= i % 4; j++) {
      text += "Sentence number " + std::to_string(i) + " is here. ";
    }
  }
  return text;
}

// Ends a sentence after every `;`.
class SemicolonBoundary : public Boundary {
 public:
  std::vector<size_t> ends(std::string_view text) const override {
    std::vector<size_t> ends;
    for (size_t i = 0; i < text.size(); i++) {
      if (text[i] == ';') {
        ends.push_back(i + 1);
      }
    }
    return ends;
  }
};

// Scratch directory, removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string &name)
      : path_(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ignored;
    std::filesystem::remove_all(path_, ignored);
  }

  std::string write(const std::string &fname, const std::string &content) {
    std::filesystem::path fpath = path_ / fname;
    std::ofstream out(fpath, std::ios::binary);
    out << content;
    return fpath.string();
  }

  std::string path() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};

}  // namespace

void normalize_newlines() {
  std::string raw = "\xEF\xBB\xBFLine1\\r\\nLine2\r\nLine3\rLine4\tTab\n\n\nLine5";
  SHARD_CHECK_EQUAL(normalize(raw),
                    std::string("Line1\nLine2\nLine3\nLine4 Tab\n\nLine5"));
}

void normalize_edges() {
  SHARD_CHECK_EQUAL(normalize(""), std::string());
  SHARD_CHECK_EQUAL(normalize(" \n\t \r\n "), std::string());
  SHARD_CHECK_EQUAL(normalize("a\n\n\n\n\nb"), std::string("a\n\nb"));
  SHARD_CHECK_EQUAL(normalize("\xEF\xBB\xBF\xEF\xBB\xBF  x  "),
                    std::string("x"));
  // An escaped pair collapses to one line break, not two.
  SHARD_CHECK_EQUAL(normalize("a\\r\\nb"), std::string("a\nb"));
  SHARD_CHECK_EQUAL(trim("\x1f hello\xE3\x80\x80"), std::string("hello"));
}

void utf8_offsets() {
  Utf8Text text("a안b");
  SHARD_CHECK_EQUAL(text.length(), 3);
  SHARD_CHECK_EQUAL(text.to_bytes(2), 4);
  SHARD_CHECK_EQUAL(text.to_chars(4), 2);
  SHARD_CHECK_EQUAL(text.slice(Range{1, 2}), std::string_view("안"));

  // A stray byte is a character of its own.
  Utf8Text invalid("a\xFF" "b");
  SHARD_CHECK_EQUAL(invalid.length(), 3);
  SHARD_CHECK_EQUAL(utf8_prefix("안녕하세요", 2), std::string_view("안녕"));
}

void regex_errors() {
  SHARD_CHECK_THROWS(Regex("(", kUnicode), std::invalid_argument);
  Regex digits("[0-9]+", kUnicode);
  Ranges found = digits.matches("a1 22 b333");
  Ranges expected = {{1, 2}, {3, 5}, {7, 10}};
  SHARD_CHECK_EQUAL(found, expected);
  SHARD_CHECK_EQUAL(digits.replace("a1 22", "#"), std::string("a# #"));
}

void paragraph_blocks() {
  Ranges blocks = paragraphs(Utf8Text("A\n\nB\n \n\nC"));
  Ranges expected = {{0, 1}, {3, 4}, {8, 9}};
  SHARD_CHECK_EQUAL(blocks, expected);

  SHARD_CHECK(paragraphs(Utf8Text("")).empty());

  Ranges single = paragraphs(Utf8Text("single\nline break"));
  Ranges whole = {{0, 17}};
  SHARD_CHECK_EQUAL(single, whole);
}

void sentence_ends() {
  Splitter splitter;
  std::vector<size_t> ends = splitter.sentence_ends("Hi. Ok! 됐다. 3.14 x?");
  std::vector<size_t> expected = {3, 7, 15, 23};
  SHARD_CHECK_EQUAL(ends, expected);

  std::vector<size_t> korean = korean_boundary()->ends("좋다. 네");
  std::vector<size_t> korean_expected = {7};
  SHARD_CHECK_EQUAL(korean, korean_expected);

  SHARD_CHECK(latin_boundary()->ends("3.14 and 2.5x").empty());
}

void split_fixed_width() {
  Chunker chunker = make_chunker(100, 0);
  Chunks chunks = chunker.chunk(make_record("abc", std::string(500, 'x')));
  SHARD_CHECK_EQUAL(chunks.size(), 5);
  for (size_t i = 0; i < chunks.size(); i++) {
    SHARD_CHECK_EQUAL(chunks[i].begin, i * 100);
    SHARD_CHECK_EQUAL(chunks[i].text.size(), 100);
  }
}

void split_sentences() {
  Splitter splitter;
  Utf8Text text("One. Two. Three. Four.");
  Ranges pieces = splitter(text, Range{0, text.length()}, 10);
  Ranges expected = {{0, 9}, {9, 16}, {16, 22}};
  SHARD_CHECK_EQUAL(pieces, expected);

  // A block that fits is returned as is.
  Ranges whole = splitter(text, Range{0, text.length()}, 100);
  Ranges single = {{0, 22}};
  SHARD_CHECK_EQUAL(whole, single);
}

void split_forced_cut() {
  Splitter splitter;
  Utf8Text text("Averyveryverylongsentence. Short.");
  Ranges pieces = splitter(text, Range{0, text.length()}, 10);
  Ranges expected = {{0, 10}, {10, 20}, {20, 30}, {30, 33}};
  SHARD_CHECK_EQUAL(pieces, expected);

  Utf8Text tail("aaaaaaaaaaaaaaaaaaaaaaaaa. bbbbb.");
  Ranges tail_pieces = splitter(tail, Range{0, tail.length()}, 10);
  SHARD_CHECK_EQUAL(tail_pieces, expected);
}

void split_custom_boundary() {
  Utf8Text text("aaa; bbb; ccc");
  Range block{0, text.length()};

  // Neither built-in recognizer sees an end here.
  Ranges fixed = Splitter()(text, block, 5);
  Ranges fixed_expected = {{0, 5}, {5, 10}, {10, 13}};
  SHARD_CHECK_EQUAL(fixed, fixed_expected);

  std::vector<std::unique_ptr<Boundary>> boundaries;
  boundaries.push_back(std::make_unique<SemicolonBoundary>());
  Splitter splitter(std::move(boundaries));
  std::vector<size_t> ends = splitter.sentence_ends(text.str());
  std::vector<size_t> ends_expected = {4, 9};
  SHARD_CHECK_EQUAL(ends, ends_expected);

  Ranges pieces = splitter(text, block, 5);
  Ranges expected = {{0, 4}, {4, 9}, {9, 13}};
  SHARD_CHECK_EQUAL(pieces, expected);

  // Recognizers added later merge with the ones already there.
  Splitter merged;
  merged.add(std::make_unique<SemicolonBoundary>());
  std::vector<size_t> mixed = merged.sentence_ends("a; b. c");
  std::vector<size_t> mixed_expected = {2, 5};
  SHARD_CHECK_EQUAL(mixed, mixed_expected);
}

void paragraph_spans() {
  Splitter splitter;
  Utf8Text text("Para1 line.\n\nPara2 line.\n\nPara3 line.");
  Ranges spans = base_spans(text, 20, splitter);
  Ranges expected = {{0, 11}, {13, 24}, {26, 37}};
  SHARD_CHECK_EQUAL(spans, expected);
}

void paragraph_merge() {
  Splitter splitter;
  Utf8Text text("Aa.\n\nBb.\n\nCccccccccc.");
  Ranges spans = base_spans(text, 12, splitter);
  Ranges expected = {{0, 8}, {10, 21}};
  SHARD_CHECK_EQUAL(spans, expected);
}

void span_invariants() {
  Chunker chunker = make_chunker(60, 0);
  std::string normalized = normalize(long_transcript());
  Utf8Text text(normalized);
  Ranges spans = chunker.spans(text);

  SHARD_CHECK(!spans.empty());
  SHARD_CHECK_EQUAL(spans.front().begin, 0);
  SHARD_CHECK_EQUAL(spans.back().end, text.length());
  for (size_t i = 0; i < spans.size(); i++) {
    SHARD_CHECK(spans[i].begin < spans[i].end);
    SHARD_CHECK(spans[i].size() <= 60);
    if (i > 0) {
      SHARD_CHECK(spans[i - 1].end <= spans[i].begin);
      // Only blank line separators are left uncovered.
      std::string_view gap = text.slice(Range{spans[i - 1].end, spans[i].begin});
      SHARD_CHECK(trim(gap).empty());
    }
  }

  Ranges head = {{0, 27}, {29, 83}, {85, 138}, {138, 165}, {165, 166}};
  SHARD_CHECK_EQUAL(Ranges(spans.begin(), spans.begin() + 5), head);
}

void overlap_one_step() {
  Ranges base = {{0, 5}, {10, 20}};
  Ranges pulled = {{0, 5}, {2, 20}};
  SHARD_CHECK_EQUAL(apply_overlap(base, 3), pulled);
  SHARD_CHECK_EQUAL(apply_overlap(base, 0), base);
  SHARD_CHECK(apply_overlap(Ranges(), 5).empty());

  // Short spans and a large overlap: reach is from the previous span only.
  Chunker chunker = make_chunker(4, 3);
  Ranges spans = chunker.spans(Utf8Text("A. B. C. D. E. F."));
  Ranges expected = {{0, 2}, {0, 5}, {2, 8}, {5, 11}, {8, 14}, {11, 17}};
  SHARD_CHECK_EQUAL(spans, expected);
  for (size_t i = 1; i < spans.size(); i++) {
    SHARD_CHECK(spans[i - 1].begin <= spans[i].begin);
    SHARD_CHECK(spans[i].begin <= spans[i - 1].end);
    SHARD_CHECK(spans[i].begin + 3 >= spans[i - 1].end);
  }
}

void overlap_chunks() {
  Chunker chunker = make_chunker(20, 5);
  Chunks chunks = chunker.chunk(
      make_record("abc", "Para1 line.\n\nPara2 line.\n\nPara3 line."));
  Ranges expected = {{0, 11}, {6, 24}, {19, 37}};
  SHARD_CHECK_EQUAL(spans_of(chunks), expected);
  SHARD_CHECK_EQUAL(chunks[1].text, std::string("line.\n\nPara2 line."));
}

void korean_offsets() {
  Chunker chunker = make_chunker(8, 3);
  Record record = make_record("k", "안녕하세요. 반갑습니다.\n\n좋아요.");
  Chunks chunks = chunker.chunk(record);
  Ranges expected = {{0, 6}, {3, 13}, {10, 19}};
  SHARD_CHECK_EQUAL(spans_of(chunks), expected);
  SHARD_CHECK_EQUAL(chunks[0].text, std::string("안녕하세요."));
  SHARD_CHECK_EQUAL(chunks[2].text, std::string("니다.\n\n좋아요."));
  SHARD_CHECK_EQUAL(chunks[2].id,
                    std::string("20054aad32bc2298d1fa6e7257ba4d6b45c0b8b7"));
}

void chunk_fields() {
  Chunker chunker = make_chunker(20, 0);
  Record record =
      make_record("abc", "Para1 line.\n\nPara2 line.\n\nPara3 line.");
  Chunks chunks = chunker.chunk(record);
  SHARD_CHECK_EQUAL(chunks.size(), 3);

  std::string normalized = normalize(record.transcript);
  Utf8Text text(normalized);
  for (size_t i = 0; i < chunks.size(); i++) {
    const Chunk &chunk = chunks[i];
    SHARD_CHECK_EQUAL(chunk.key, record.key);
    SHARD_CHECK_EQUAL(chunk.date, record.date);
    SHARD_CHECK_EQUAL(chunk.name, record.name);
    SHARD_CHECK_EQUAL(chunk.index, i);
    SHARD_CHECK_EQUAL(chunk.text,
                      std::string(text.slice(Range{chunk.begin, chunk.end})));
    SHARD_CHECK_EQUAL(chunk.id, stable_id(chunk.key, chunk.index, chunk.text));
    SHARD_CHECK_EQUAL(chunk.id.size(), 40);
  }
}

void chunk_idempotent() {
  Chunker chunker = make_chunker(60, 10);
  Record record = make_record("abc", long_transcript());
  Chunks first = chunker.chunk(record);
  Chunks second = chunker.chunk(record);
  Chunks normalized = chunker.chunk(record, normalize(record.transcript));

  SHARD_CHECK_EQUAL(spans_of(first), spans_of(second));
  SHARD_CHECK_EQUAL(ids_of(first), ids_of(second));
  SHARD_CHECK_EQUAL(spans_of(first), spans_of(normalized));
  SHARD_CHECK_EQUAL(ids_of(first), ids_of(normalized));

  // Normalizing is idempotent, so chunking normalized text changes nothing.
  Record again = record;
  again.transcript = normalize(record.transcript);
  SHARD_CHECK_EQUAL(ids_of(chunker.chunk(again)), ids_of(first));
}

void chunk_empty() {
  Chunker chunker = make_chunker(20, 5);
  SHARD_CHECK(chunker.chunk(make_record("abc", "")).empty());
  SHARD_CHECK(chunker.chunk(make_record("abc", " \r\n\t\xEF\xBB\xBF")).empty());
}

void chunk_given_text() {
  Chunker chunker{Chunker::Config()};
  Record record = make_record("abc", "");

  // Trailing blank lines are not covered, and nothing aborts.
  Chunks chunks = chunker.chunk(record, std::string("abc\n\n"));
  Ranges expected = {{0, 3}};
  SHARD_CHECK_EQUAL(spans_of(chunks), expected);
  SHARD_CHECK_EQUAL(chunks[0].text, std::string("abc"));

  Chunks leading = chunker.chunk(record, std::string("\n\nabc"));
  Ranges leading_expected = {{2, 5}};
  SHARD_CHECK_EQUAL(spans_of(leading), leading_expected);

  SHARD_CHECK(chunker.chunk(record, std::string("\n\n")).empty());
}

void config_rejected() {
  SHARD_CHECK_THROWS(make_chunker(0, 0), std::invalid_argument);
  SHARD_CHECK_THROWS(make_chunker(-5, 0), std::invalid_argument);
  SHARD_CHECK_THROWS(make_chunker(10, -1), std::invalid_argument);
  Chunker defaults{Chunker::Config()};
  SHARD_CHECK_EQUAL(defaults.config().max_chars, 1200);
  SHARD_CHECK_EQUAL(defaults.config().overlap_chars, 200);
}

void stable_ids() {
  SHARD_CHECK_EQUAL(stable_id("abc", 0, "text"),
                    std::string("611c2aece2c2e86972c32bbcfd7ba92bf200e464"));
  SHARD_CHECK_EQUAL(stable_id("abc", 0, "text"), stable_id("abc", 0, "text"));
  SHARD_CHECK_EQUAL(stable_id("abc", 1, "text"),
                    std::string("987c483a3d341f5c881302774e5931d9edecdc6c"));
  SHARD_CHECK_EQUAL(stable_id("abc", 0, "안녕하세요."),
                    std::string("c216d29d6e0a72258da27a2c696ffb4c14e98d20"));
  SHARD_CHECK_EQUAL(sha1_hex(""),
                    std::string("da39a3ee5e6b4b0d3255bfef95601890afd80709"));

  // Each input on its own changes the id.
  SHARD_CHECK(stable_id("abd", 0, "text") != stable_id("abc", 0, "text"));
  SHARD_CHECK(stable_id("abc", 2, "text") != stable_id("abc", 0, "text"));
  SHARD_CHECK(stable_id("abc", 0, "texT") != stable_id("abc", 0, "text"));

  std::set<std::string> ids;
  size_t count = 0;
  for (const char *key : {"abc", "abd", "ab", ""}) {
    for (size_t index : {0, 1, 10}) {
      for (const char *text : {"text", "text ", "", "안녕하세요."}) {
        ids.insert(stable_id(key, index, text));
        ++count;
      }
    }
  }
  SHARD_CHECK_EQUAL(ids.size(), count);
}

void chunk_stream() {
  Chunker chunker = make_chunker(20, 5);
  std::vector<Record> records = {
      make_record("a", "Para1 line.\n\nPara2 line.\n\nPara3 line."),
      make_record("b", "   "),
      make_record("c", "One. Two. Three. Four. Five."),
  };

  std::vector<std::string> expected;
  for (const Record &record : records) {
    for (const std::string &id : ids_of(chunker.chunk(record))) {
      expected.push_back(id);
    }
  }

  ChunkStream stream(records, chunker);
  for (int pass = 0; pass < 2; pass++) {
    std::vector<std::string> streamed;
    for (const Chunk &chunk : stream) {
      streamed.push_back(chunk.id);
    }
    SHARD_CHECK_EQUAL(streamed, expected);
  }

  ChunkStream empty({make_record("x", "")}, chunker);
  SHARD_CHECK(empty.begin() == empty.end());
}

void async_matches_blocking() {
  Chunker chunker = make_chunker(60, 10);
  std::vector<Record> records;
  for (size_t i = 0; i < 10; i++) {
    Record record = make_record("key" + std::to_string(i), long_transcript());
    record.transcript.resize(200 * (i + 1));
    records.push_back(record);
  }

  std::vector<Future> futures;
  {
    Async service(chunker, 3);
    SHARD_CHECK_EQUAL(service.workers(), 3);
    for (const Record &record : records) {
      futures.push_back(service.submit(record));
    }
  }

  for (size_t i = 0; i < records.size(); i++) {
    Chunks chunks = futures[i].get();
    Chunks expected = chunker.chunk(records[i]);
    SHARD_CHECK_EQUAL(ids_of(chunks), ids_of(expected));
  }

  SHARD_CHECK_THROWS(Async(chunker, 0), std::invalid_argument);
}

void date_formats() {
  SHARD_CHECK_EQUAL(normalize_date("2024.3.7 weekly"),
                    std::string("2024-03-07"));
  SHARD_CHECK_EQUAL(normalize_date("  2024/12/01 "), std::string("2024-12-01"));
  SHARD_CHECK_EQUAL(normalize_date("주간회의 2024년 3월 7일"),
                    std::string("2024-03-07"));
  SHARD_CHECK_EQUAL(normalize_date("2024년3월17일"), std::string("2024-03-17"));
  SHARD_CHECK_EQUAL(normalize_date("2024\x1c" "년 3월\x1f" "7일"),
                    std::string("2024-03-07"));
  SHARD_CHECK_EQUAL(normalize_date("abcd-ef-ghij"), std::string("abcd-ef-gh"));
  SHARD_CHECK_EQUAL(normalize_date("meeting"), std::string());
  SHARD_CHECK_EQUAL(normalize_date(""), std::string());
  // Only the first 50 characters are looked at.
  SHARD_CHECK_EQUAL(normalize_date(std::string(50, 'x') + "2024-01-01"),
                    std::string());
}

void meeting_keys() {
  SHARD_CHECK_EQUAL(meeting_key("회의", "2024-03-07", 0),
                    std::string("a168a50c4dbf"));
  SHARD_CHECK_EQUAL(meeting_key("Meeting", "", 3), std::string("c1537267256f"));
}

void summaries() {
  Record record = make_record("k", "\xEF\xBB\xBF  안녕하세요.\r\n");
  record.source = "memory";
  Chunks chunks = make_chunker(20, 0).chunk(record);
  Summary summary = summarize(record, chunks);
  SHARD_CHECK_EQUAL(summary.length, 6);
  SHARD_CHECK_EQUAL(summary.chunk_count, 1);
  SHARD_CHECK_EQUAL(summary.key, std::string("k"));
  SHARD_CHECK_EQUAL(summary.source, std::string("memory"));
}

void single_lines() {
  std::ostringstream out;
  single_line(out, "a\nb\n\nc", "|");
  SHARD_CHECK_EQUAL(out.str(), std::string("a b c|"));
}

void tsv_rows() {
  Chunk chunk{"k\tx", "2026-02-02", "a\nb", 0, "id", 0, 9, "hi\n\nthere"};
  std::ostringstream rows;
  write_chunks(rows, {chunk});
  SHARD_CHECK_EQUAL(
      rows.str(),
      std::string("k x\t2026-02-02\ta b\t0\tid\t0\t9\thi there\n"));

  Summary summary{"k", "", "x\ty", 12, 2, "dir/f.txt"};
  std::ostringstream summaries;
  write_summary(summaries, summary);
  SHARD_CHECK_EQUAL(summaries.str(),
                    std::string("k\t\tx y\t12\t2\tdir/f.txt\n"));
}

void read_files() {
  TempDir dir("shard-test-read-files");
  std::string dated = dir.write("2024-03-07 Weekly.txt", "Hello.\n\nWorld.");
  std::string other = dir.write("b.txt", "");
  dir.write("notes.md", "ignored");

  std::vector<std::string> files = discover({dir.path(), dated});
  std::vector<std::string> expected = {dated, other};
  SHARD_CHECK_EQUAL(files, expected);

  Record record = read_record(dated, 4);
  SHARD_CHECK_EQUAL(record.name, std::string("2024-03-07 Weekly"));
  SHARD_CHECK_EQUAL(record.date, std::string("2024-03-07"));
  SHARD_CHECK_EQUAL(record.key, meeting_key(record.name, record.date, 4));
  SHARD_CHECK_EQUAL(record.transcript, std::string("Hello.\n\nWorld."));
  SHARD_CHECK_EQUAL(record.index, 4);

  Record empty = read_record(other, 0);
  SHARD_CHECK(empty.transcript.empty());
  SHARD_CHECK_EQUAL(empty.date, std::string());

  SHARD_CHECK_THROWS(read_record(dir.path() + "/missing.txt", 0),
                     std::runtime_error);

  // Symlinks pointing at each other are skipped, inside a directory and as
  // an argument.
  TempDir looping("shard-test-symlink-loop");
  std::string real = looping.write("real.txt", "Text.");
  std::string a = looping.path() + "/loop-a.txt";
  std::string b = looping.path() + "/loop-b.txt";
  std::filesystem::create_symlink(b, a);
  std::filesystem::create_symlink(a, b);
  std::vector<std::string> found = discover({looping.path(), a});
  std::vector<std::string> only = {real};
  SHARD_CHECK_EQUAL(found, only);
}

}  // namespace shard

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <test-name>\n";
    std::exit(EXIT_FAILURE);
  }

// clang-format off
#define TEST_ENTRY(fn_name) {#fn_name, &shard::fn_name}
  // clang-format on

  using Test = void (*)();
  std::unordered_map<std::string, Test> tests({
      TEST_ENTRY(normalize_newlines),      //
      TEST_ENTRY(normalize_edges),         //
      TEST_ENTRY(utf8_offsets),            //
      TEST_ENTRY(regex_errors),            //
      TEST_ENTRY(paragraph_blocks),        //
      TEST_ENTRY(sentence_ends),           //
      TEST_ENTRY(split_fixed_width),       //
      TEST_ENTRY(split_sentences),         //
      TEST_ENTRY(split_forced_cut),        //
      TEST_ENTRY(split_custom_boundary),   //
      TEST_ENTRY(paragraph_spans),         //
      TEST_ENTRY(paragraph_merge),         //
      TEST_ENTRY(span_invariants),         //
      TEST_ENTRY(overlap_one_step),        //
      TEST_ENTRY(overlap_chunks),          //
      TEST_ENTRY(korean_offsets),          //
      TEST_ENTRY(chunk_fields),            //
      TEST_ENTRY(chunk_idempotent),        //
      TEST_ENTRY(chunk_empty),             //
      TEST_ENTRY(chunk_given_text),        //
      TEST_ENTRY(config_rejected),         //
      TEST_ENTRY(stable_ids),              //
      TEST_ENTRY(chunk_stream),            //
      TEST_ENTRY(async_matches_blocking),  //
      TEST_ENTRY(date_formats),            //
      TEST_ENTRY(meeting_keys),            //
      TEST_ENTRY(summaries),               //
      TEST_ENTRY(single_lines),            //
      TEST_ENTRY(tsv_rows),                //
      TEST_ENTRY(read_files)               //
  });

  std::string test = argv[1];

  auto query = tests.find(test);
  if (query != tests.end()) {
    auto name = query->first;
    auto fn = query->second;
    try {
      std::cout << "Running test [" << name << "] ...";
      fn();
      std::cout << " [success]\n";
    } catch (...) {
      std::cout << " [fail]\n";
      throw;
    }
  } else if (test == "all") {
    std::vector<std::string> failed;
    for (auto &named_test : tests) {
      auto name = named_test.first;
      auto fn = named_test.second;
      try {
        std::cout << "Running test ... ";
        fn();
        std::cout << "[success] [" << name << "]\n";
      } catch (const std::exception &exception) {
        std::cout << " [fail] [" << name << "]\n";
        failed.push_back(name);
      }
    }
    if (!failed.empty()) {
      std::cerr << failed.size() << " tests failed\n";
      return EXIT_FAILURE;
    }
  } else {
    std::cerr << "Unknown test " << test << "\n";
    return EXIT_FAILURE;
  }

  return 0;
}
