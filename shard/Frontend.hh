#pragma once
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "shard/Chunker.hh"
#include "shard/Queue.hh"
#include "shard/Types.hh"

namespace shard {

/// Chunks records on a pool of worker threads. Each submitted record
/// completes its own future, so results can be collected in submission order
/// regardless of which worker finished first.
class Async {
 public:
  /// Throws std::invalid_argument if workers is 0. The chunker must outlive
  /// this object.
  Async(const Chunker &chunker, size_t workers);

  /// Waits for everything submitted so far, then stops the workers.
  ~Async();

  Async(const Async &) = delete;
  Async &operator=(const Async &) = delete;

  /// The future carries the exception if chunking the record fails.
  Future submit(Record record);

  size_t workers() const { return workers_.size(); }

 private:
  struct Job {
    Record record;
    Ptr<Promise> promise;
  };

  const Chunker &chunker_;
  Threadsafe<Job> queue_;
  std::vector<std::thread> workers_;
};

}  // namespace shard
