#pragma once

#include "middleware.h"

#include <kj/memory.h>
#include <kj/vector.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

/**
 * Ordered list of filter stages every request passes through.
 *
 * run() executes stages in insertion order and stops at the first outcome that is
 * not Continue. Stages are fixed once the server starts listening.
 */
class AccessFilterChain {
public:
  explicit AccessFilterChain(core::Logger& logger) : logger_(logger) {}

  void add(kj::Own<Middleware> stage);

  [[nodiscard]] size_t size() const {
    return stages_.size();
  }
  [[nodiscard]] kj::Vector<kj::StringPtr> stageNames() const;

  kj::Promise<FilterOutcome> run(RequestContext& ctx);

  /**
   * Notify entered stages, last to first, that the request is done.
   *
   * A stage that throws from finish() is logged and does not stop the others.
   */
  void finish(RequestContext& ctx, kj::Maybe<const kj::Exception&> error);

private:
  core::Logger& logger_;
  kj::Vector<kj::Own<Middleware>> stages_;
};

} // namespace tollgate::gateway
