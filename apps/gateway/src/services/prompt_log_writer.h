#pragma once

#include <kj/async.h>
#include <kj/filesystem.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/timer.h>
#include <kj/vector.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

/**
 * Batches prompt log records and appends them to a JSON-lines file.
 *
 * Records are buffered in memory by enqueue() and written by a periodic flush
 * task started with start().
 */
class PromptLogWriter {
public:
  PromptLogWriter(kj::Timer& timer, kj::StringPtr path, kj::Duration flushInterval,
                  core::Logger& logger);

  /**
   * Begin the periodic flush loop. Starting twice is an error.
   */
  void start(kj::TaskSet& tasks);

  [[nodiscard]] bool isRunning() const {
    return running_;
  }

  /**
   * Buffer one record; line must be a single JSON document without newlines.
   */
  void enqueue(kj::String line);

  /**
   * Append everything buffered to the log file.
   * @return Number of records written
   */
  size_t flush();

  [[nodiscard]] size_t pending() const {
    return pending_.size();
  }
  [[nodiscard]] uint64_t written() const {
    return written_;
  }

private:
  kj::Promise<void> flushLoop();

  kj::Timer& timer_;
  kj::Own<kj::Filesystem> fs_;
  kj::Path path_;
  kj::Duration flushInterval_;
  core::Logger& logger_;
  bool running_ = false;
  kj::Vector<kj::String> pending_;
  uint64_t written_ = 0;
};

} // namespace tollgate::gateway
