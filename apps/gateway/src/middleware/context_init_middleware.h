#pragma once

#include "middleware.h"

#include <kj/time.h>
#include <kj/timer.h>

namespace tollgate::gateway {

/**
 * First stage of the chain: stamps arrival time and a zero retry count.
 */
class ContextInitMiddleware final : public Middleware {
public:
  ContextInitMiddleware(const kj::Clock& clock, kj::Timer& timer) : clock_(clock), timer_(timer) {}

  [[nodiscard]] kj::StringPtr name() const override {
    return "context-init"_kj;
  }

  kj::Promise<FilterOutcome> process(RequestContext& ctx) override;

private:
  const kj::Clock& clock_;
  kj::Timer& timer_;
};

} // namespace tollgate::gateway
