#pragma once

#include "gateway_config.h"
#include "request_context.h"

#include <cstdint>
#include <kj/async.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/timer.h>
#include <kj/vector.h>
#include <random>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

/**
 * Admission control for upstream requests.
 *
 * Each partition (typically an upstream provider) admits up to `concurrency`
 * requests at a time. Waiting requests are admitted oldest-arrival first in fair
 * mode, or in random order in random mode.
 */
class RequestQueue {
public:
  static constexpr kj::Duration kStatsInterval = 60 * kj::SECONDS;

  RequestQueue(QueueMode mode, uint32_t concurrency, core::Logger& logger);

  /**
   * Begin periodic queue statistics logging. Starting twice is an error.
   */
  void start(kj::TaskSet& tasks, kj::Timer& timer);

  [[nodiscard]] bool isRunning() const {
    return running_;
  }

  /**
   * Wait for a slot in partition. The returned promise resolves once the request
   * is admitted; the caller must call release() when it is done.
   */
  kj::Promise<void> enqueue(RequestContext& ctx, kj::StringPtr partition);

  void release(kj::StringPtr partition);

  [[nodiscard]] size_t depth(kj::StringPtr partition) const;
  [[nodiscard]] size_t totalDepth() const;
  [[nodiscard]] uint32_t active(kj::StringPtr partition) const;

private:
  struct Waiter {
    int64_t arrivalMs;
    uint64_t sequence;
    kj::Own<kj::PromiseFulfiller<void>> fulfiller;
  };

  struct Partition {
    uint32_t active = 0;
    kj::Vector<Waiter> waiting;
  };

  Partition& partitionFor(kj::StringPtr name);
  void admitNext(Partition& partition);
  kj::Promise<void> statsLoop(kj::Timer& timer);

  QueueMode mode_;
  uint32_t concurrency_;
  core::Logger& logger_;
  bool running_ = false;
  uint64_t nextSequence_ = 0;
  kj::HashMap<kj::String, Partition> partitions_;
  std::mt19937_64 rng_;
};

} // namespace tollgate::gateway
