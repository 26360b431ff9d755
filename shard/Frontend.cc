#include "shard/Frontend.hh"

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

#include "shard/Macros.hh"

namespace shard {

Async::Async(const Chunker &chunker, size_t workers) : chunker_(chunker) {
  if (workers == 0) {
    throw std::invalid_argument("Async needs at least one worker.");
  }

  // Also creates consumers, starts listening.
  for (size_t i = 0; i < workers; i++) {
    workers_.emplace_back([this]() {
      std::optional<Job> job = queue_.generate();
      while (job) {
        try {
          job->promise->set_value(chunker_.chunk(job->record));
        } catch (const std::exception &e) {
          LOG(error, "Chunking %s failed: %s", job->record.key.c_str(),
              e.what());
          job->promise->set_exception(std::current_exception());
        }
        job = queue_.generate();
      }
    });
  }
  LOG(info, "Started %zu workers", workers);
}

Future Async::submit(Record record) {
  auto promise = std::make_shared<Promise>();
  Future future = promise->get_future();
  queue_.enqueue(Job{std::move(record), std::move(promise)});
  return future;
}

Async::~Async() {
  queue_.shutdown();
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace shard
