#include "services/prompt_log_writer.h"

#include <kj/debug.h>

namespace tollgate::gateway {

using core::kv;

PromptLogWriter::PromptLogWriter(kj::Timer& timer, kj::StringPtr path, kj::Duration flushInterval,
                                 core::Logger& logger)
    : timer_(timer), fs_(kj::newDiskFilesystem()), path_(fs_->getCurrentPath().evalNative(path)),
      flushInterval_(flushInterval), logger_(logger) {}

void PromptLogWriter::start(kj::TaskSet& tasks) {
  KJ_REQUIRE(!running_, "prompt log writer already started");
  running_ = true;
  logger_.info("Prompt logging enabled.", {kv("path", path_.toNativeString(true))});
  tasks.add(flushLoop());
}

void PromptLogWriter::enqueue(kj::String line) {
  KJ_REQUIRE(line.findFirst('\n') == kj::none, "prompt log records must be single-line");
  pending_.add(kj::mv(line));
}

size_t PromptLogWriter::flush() {
  if (pending_.size() == 0) {
    return 0;
  }

  auto file = fs_->getRoot().appendFile(
      path_, kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT);
  for (auto& line : pending_) {
    file->write(line.asBytes());
    file->write("\n"_kj.asBytes());
  }

  size_t count = pending_.size();
  written_ += count;
  pending_.clear();
  return count;
}

kj::Promise<void> PromptLogWriter::flushLoop() {
  for (;;) {
    co_await timer_.afterDelay(flushInterval_);
    auto failure = kj::runCatchingExceptions([&]() {
      size_t count = flush();
      if (count > 0) {
        logger_.debug("Flushed prompt log batch.", {kv("records", static_cast<uint64_t>(count))});
      }
    });
    KJ_IF_SOME(exception, failure) {
      // Records stay buffered and are retried on the next tick
      logger_.error("Failed to write prompt log batch.",
                    {kv("error", exception.getDescription()),
                     kv("pending", static_cast<uint64_t>(pending_.size()))});
    }
  }
}

} // namespace tollgate::gateway
