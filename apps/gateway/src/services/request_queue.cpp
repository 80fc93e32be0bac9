#include "services/request_queue.h"

#include <kj/debug.h>
#include <tollgate/core/time.h>

namespace tollgate::gateway {

using core::kv;

RequestQueue::RequestQueue(QueueMode mode, uint32_t concurrency, core::Logger& logger)
    : mode_(mode), concurrency_(concurrency), logger_(logger), rng_(std::random_device{}()) {}

void RequestQueue::start(kj::TaskSet& tasks, kj::Timer& timer) {
  KJ_REQUIRE(!running_, "request queue already started");
  KJ_REQUIRE(mode_ != QueueMode::None, "request queue is disabled");
  KJ_REQUIRE(concurrency_ > 0, "queue concurrency must be > 0");
  running_ = true;
  tasks.add(statsLoop(timer));
}

RequestQueue::Partition& RequestQueue::partitionFor(kj::StringPtr name) {
  return partitions_.findOrCreate(name, [&]() {
    return kj::HashMap<kj::String, Partition>::Entry{kj::str(name), Partition{}};
  });
}

kj::Promise<void> RequestQueue::enqueue(RequestContext& ctx, kj::StringPtr partition) {
  KJ_REQUIRE(running_, "request queue not running");
  auto& bookkeeping = ctx.bookkeeping();
  auto& slot = partitionFor(partition);

  if (slot.active < concurrency_ && depth(partition) == 0) {
    ++slot.active;
    return kj::READY_NOW;
  }

  auto paf = kj::newPromiseAndFulfiller<void>();
  slot.waiting.add(
      Waiter{core::to_unix_ms(bookkeeping.arrivalTimestamp), nextSequence_++, kj::mv(paf.fulfiller)});
  return kj::mv(paf.promise);
}

void RequestQueue::release(kj::StringPtr partition) {
  auto& slot = partitionFor(partition);
  KJ_REQUIRE(slot.active > 0, "release without a matching admission", partition);
  --slot.active;
  admitNext(slot);
}

void RequestQueue::admitNext(Partition& partition) {
  while (partition.active < concurrency_) {
    // Cancelled requests leave fulfillers nobody waits on
    kj::Vector<Waiter> live;
    for (auto& waiter : partition.waiting) {
      if (waiter.fulfiller->isWaiting()) {
        live.add(kj::mv(waiter));
      }
    }
    partition.waiting = kj::mv(live);
    if (partition.waiting.size() == 0) {
      return;
    }

    size_t chosen = 0;
    if (mode_ == QueueMode::Random) {
      std::uniform_int_distribution<size_t> pick(0, partition.waiting.size() - 1);
      chosen = pick(rng_);
    } else {
      for (size_t i = 1; i < partition.waiting.size(); ++i) {
        auto& candidate = partition.waiting[i];
        auto& best = partition.waiting[chosen];
        if (candidate.arrivalMs < best.arrivalMs ||
            (candidate.arrivalMs == best.arrivalMs && candidate.sequence < best.sequence)) {
          chosen = i;
        }
      }
    }

    auto fulfiller = kj::mv(partition.waiting[chosen].fulfiller);
    kj::Vector<Waiter> remaining;
    for (size_t i = 0; i < partition.waiting.size(); ++i) {
      if (i != chosen) {
        remaining.add(kj::mv(partition.waiting[i]));
      }
    }
    partition.waiting = kj::mv(remaining);

    ++partition.active;
    fulfiller->fulfill();
  }
}

size_t RequestQueue::depth(kj::StringPtr partition) const {
  KJ_IF_SOME(slot, partitions_.find(partition)) {
    size_t count = 0;
    for (auto& waiter : slot.waiting) {
      if (waiter.fulfiller->isWaiting()) {
        ++count;
      }
    }
    return count;
  }
  return 0;
}

size_t RequestQueue::totalDepth() const {
  size_t total = 0;
  for (auto& entry : partitions_) {
    total += depth(entry.key);
  }
  return total;
}

uint32_t RequestQueue::active(kj::StringPtr partition) const {
  KJ_IF_SOME(slot, partitions_.find(partition)) {
    return slot.active;
  }
  return 0;
}

kj::Promise<void> RequestQueue::statsLoop(kj::Timer& timer) {
  for (;;) {
    co_await timer.afterDelay(kStatsInterval);
    if (totalDepth() > 0) {
      logger_.info("Request queue status.",
                   {kv("mode", kj::str(mode_)), kv("waiting", static_cast<uint64_t>(totalDepth()))});
    }
  }
}

} // namespace tollgate::gateway
