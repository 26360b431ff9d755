#include "shard/Io.hh"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include "shard/Macros.hh"
#include "shard/Record.hh"
#include "shard/Splitter.hh"

namespace shard {

namespace io {

MmapFile::MmapFile(const std::string &filepath) {
  fd_ = open(filepath.c_str(), O_RDONLY);
  if (fd_ == -1) {
    throw std::runtime_error("Failed to open file: " + filepath);
  }

  struct stat st;
  if (fstat(fd_, &st) == -1) {
    close(fd_);
    throw std::runtime_error("Failed to get file size: " + filepath);
  }
  size_ = st.st_size;

  // mmap refuses zero-length mappings; an empty file maps to nothing.
  if (size_ == 0) {
    return;
  }

  data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (data_ == MAP_FAILED) {  // NOLINT
    close(fd_);
    throw std::runtime_error("Failed to mmap file: " + filepath);
  }
}

MmapFile::~MmapFile() { release(); }

MmapFile::MmapFile(MmapFile &&from) noexcept
    : fd_(from.fd_), data_(from.data_), size_(from.size_) {
  from.reset();
}

MmapFile &MmapFile::operator=(MmapFile &&from) noexcept {
  if (this == &from) {
    return *this;
  }
  release();
  consume(from);
  return *this;
}

void MmapFile::consume(MmapFile &from) {
  fd_ = (from.fd_);
  data_ = (from.data_);
  size_ = (from.size_);
  from.reset();
}

void MmapFile::release() {
  if (data_ != nullptr) {
    munmap(data_, size_);
  }
  if (fd_ != -1) {
    close(fd_);
  }
  reset();
}

void MmapFile::reset() {
  fd_ = -1;
  data_ = nullptr;
  size_ = 0;
}

}  // namespace io

std::vector<std::string> discover(const std::vector<std::string> &paths) {
  namespace fs = std::filesystem;
  std::vector<fs::path> candidates;
  std::error_code ec;
  for (const auto &argument : paths) {
    fs::path path(argument);
    if (fs::is_directory(path, ec)) {
      std::vector<fs::path> listed;
      fs::directory_iterator entries(path, ec);
      const fs::directory_iterator done;
      for (; !ec && entries != done; entries.increment(ec)) {
        const fs::directory_entry &entry = *entries;
        std::error_code status;
        bool regular = entry.is_regular_file(status);
        if (status) {
          LOG(warn, "Skipping %s: %s", entry.path().c_str(),
              status.message().c_str());
        } else if (regular && entry.path().extension() == ".txt") {
          listed.push_back(entry.path());
        }
      }
      if (ec) {
        LOG(warn, "Listing %s stopped: %s", argument.c_str(),
            ec.message().c_str());
        ec.clear();
      }
      std::sort(listed.begin(), listed.end());
      candidates.insert(candidates.end(), listed.begin(), listed.end());
    } else if (fs::is_regular_file(path, ec)) {
      candidates.push_back(path);
    } else {
      LOG(warn, "Skipping %s: not a file or directory", argument.c_str());
      ec.clear();
    }
  }

  std::vector<std::string> unique;
  std::set<fs::path> seen;
  for (const auto &candidate : candidates) {
    fs::path canonical = fs::canonical(candidate, ec);
    if (ec) {
      LOG(warn, "Skipping %s: %s", candidate.c_str(), ec.message().c_str());
      ec.clear();
      continue;
    }
    if (seen.insert(canonical).second) {
      unique.push_back(candidate.string());
    }
  }
  return unique;
}

namespace {

void field(std::ostream &out, std::string_view value, std::string_view end) {
  std::ostringstream folded;
  single_line(folded, value);
  std::string text = folded.str();
  std::replace(text.begin(), text.end(), '\t', ' ');
  out << text << end;
}

}  // namespace

void write_chunks(std::ostream &out, const Chunks &chunks) {
  for (const Chunk &chunk : chunks) {
    field(out, chunk.key, "\t");
    field(out, chunk.date, "\t");
    field(out, chunk.name, "\t");
    out << chunk.index << '\t' << chunk.id << '\t' << chunk.begin << '\t'
        << chunk.end << '\t';
    field(out, chunk.text, "\n");
  }
}

void write_summary(std::ostream &out, const Summary &summary) {
  field(out, summary.key, "\t");
  field(out, summary.date, "\t");
  field(out, summary.name, "\t");
  out << summary.length << '\t' << summary.chunk_count << '\t';
  field(out, summary.source, "\n");
}

Record read_record(const std::string &path, size_t index) {
  io::MmapFile file(path);
  Record record;
  record.transcript.assign(file.data(), file.size());
  record.name = std::filesystem::path(path).stem().string();
  record.date = normalize_date(record.name);
  record.key = meeting_key(record.name, record.date, index);
  record.index = index;
  record.source = path;
  return record;
}

}  // namespace shard
