#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "shard/Types.hh"

namespace shard {

namespace io {

class MmapFile {
 public:
  /// Throws std::runtime_error if the file cannot be opened or mapped.
  explicit MmapFile(const std::string &filepath);
  ~MmapFile();

  const char *data() const { return static_cast<const char *>(data_); }
  size_t size() const { return size_; }

  // Disable copy and assignment
  MmapFile(const MmapFile &) = delete;
  MmapFile &operator=(const MmapFile &) = delete;

  MmapFile(MmapFile &&from) noexcept;

  MmapFile &operator=(MmapFile &&from) noexcept;

 private:
  void consume(MmapFile &from);
  void release();
  void reset();

  int fd_ = -1;
  void *data_ = nullptr;
  size_t size_ = 0;
};

}  // namespace io

/// Expands the given paths into the transcript files to read: directories
/// contribute their `*.txt` files in sorted order, regular files are taken as
/// they are, anything else is skipped. A file reached twice (by canonical
/// path) is kept once, at its first position. Entries whose status cannot be
/// read, such as symlink loops, are skipped with a warning; this never throws
/// for a bad entry.
std::vector<std::string> discover(const std::vector<std::string> &paths);

/// Reads a transcript file into a Record. The name is the file stem, the date
/// is recovered from the name where possible, and the key is derived from
/// both and index.
Record read_record(const std::string &path, size_t index);

/// Writes one tab-separated line per chunk:
///
///   key date name index id begin end text
///
/// Text fields are folded onto a single line and their tabs become spaces, so
/// every line has exactly eight fields.
void write_chunks(std::ostream &out, const Chunks &chunks);

// key date name length chunk_count source, folded the same way.
void write_summary(std::ostream &out, const Summary &summary);

}  // namespace shard
