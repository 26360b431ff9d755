#include <CLI/CLI.hpp>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "shard/Chunker.hh"
#include "shard/Frontend.hh"
#include "shard/Io.hh"
#include "shard/Macros.hh"
#include "shard/Record.hh"
#include "shard/Types.hh"
#include "shard/Utils.hh"

inline std::string read_from_stdin() {
  // Read a large input text blob from stdin
  std::ostringstream stream;
  stream << std::cin.rdbuf();
  std::string input = stream.str();
  return input;
}

struct Options {
  std::vector<std::string> paths;

  // Identify a transcript read from stdin.
  std::string key;
  std::string name = "stdin";
  std::string date;

  size_t workers = 1;
  bool summary = false;
  bool version = false;

  shard::Chunker::Config chunker;

  template <class App>
  void setup_onto(App &app) {
    // clang-format off
    app.add_option("paths", paths, "Transcript files, or directories of *.txt transcripts. Reads stdin if none are given.");
    app.add_option("--key", key, "Key of the transcript read from stdin. Derived from name and date if empty.");
    app.add_option("--name", name, "Name of the transcript read from stdin.");
    app.add_option("--date", date, "Date of the transcript read from stdin, normalized to YYYY-MM-DD.");
    app.add_option("--workers", workers, "Number of threads chunking transcripts.");
    app.add_flag("--summary", summary, "Write one summary line per transcript to stderr.");
    app.add_flag("--version", version, "Display version");

    chunker.setup_onto(app);
    // clang-format on
  }
};

shard::Record from_stdin(const Options &options) {
  shard::Record record;
  record.transcript = read_from_stdin();
  record.name = options.name;
  record.date = shard::normalize_date(options.date);
  record.key = options.key.empty()
                   ? shard::meeting_key(record.name, record.date, 0)
                   : options.key;
  record.source = "-";
  return record;
}

int run(const Options &options) {
  using namespace shard;  // NOLINT

  // Rejected configurations stop here, before any input is read.
  Chunker chunker(options.chunker);
  if (options.workers == 0) {
    throw std::invalid_argument("--workers must be at least 1.");
  }

  Timer timer;
  int status = EXIT_SUCCESS;
  size_t records = 0;
  size_t emitted = 0;

  auto finish = [&](const Record &record, const Chunks &chunks) {
    write_chunks(std::cout, chunks);
    if (options.summary) {
      write_summary(std::cerr, summarize(record, chunks));
    }
    ++records;
    emitted += chunks.size();
  };

  if (options.paths.empty()) {
    Record record = from_stdin(options);
    finish(record, chunker.chunk(record));
  } else {
    std::vector<std::string> files;
    try {
      files = discover(options.paths);
    } catch (const std::runtime_error &e) {
      fprintf(stderr, "shard: %s\n", e.what());
      return EXIT_FAILURE;
    }
    if (options.workers == 1) {
      for (size_t i = 0; i < files.size(); i++) {
        try {
          Record record = read_record(files[i], i);
          finish(record, chunker.chunk(record));
        } catch (const std::runtime_error &e) {
          fprintf(stderr, "shard: %s\n", e.what());
          status = EXIT_FAILURE;
        }
      }
    } else {
      // Keep a bounded window of transcripts in flight, emitted in input
      // order.
      Async service(chunker, options.workers);
      std::deque<std::pair<Record, Future>> pending;
      auto drain = [&]() {
        auto [record, future] = std::move(pending.front());
        pending.pop_front();
        try {
          finish(record, future.get());
        } catch (const std::exception &e) {
          fprintf(stderr, "shard: %s: %s\n", record.source.c_str(), e.what());
          status = EXIT_FAILURE;
        }
      };

      const size_t window = 4 * options.workers;
      for (size_t i = 0; i < files.size(); i++) {
        try {
          Record record = read_record(files[i], i);
          Future future = service.submit(record);
          pending.emplace_back(std::move(record), std::move(future));
        } catch (const std::runtime_error &e) {
          fprintf(stderr, "shard: %s\n", e.what());
          status = EXIT_FAILURE;
        }
        if (pending.size() >= window) {
          drain();
        }
      }
      while (!pending.empty()) {
        drain();
      }
    }
  }

  std::cout.flush();
  LOG(info, "%zu transcripts, %zu chunks in %.3fs", records, emitted,
      timer.elapsed<std::chrono::duration<double>>());
  return status;
}

int main(int argc, char *argv[]) {
  CLI::App app{"shard"};

  Options options;
  options.setup_onto(app);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    exit(app.exit(e));
  }

  if (options.version) {
    fprintf(stdout, "%s\n", shard::version().c_str());
    return 0;
  }

  try {
    return run(options);
  } catch (const std::invalid_argument &e) {
    fprintf(stderr, "shard: %s\n", e.what());
    return 2;
  }
}
