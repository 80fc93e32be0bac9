#pragma once

#include "middleware.h"

namespace tollgate::gateway {

/**
 * Answers GET/HEAD /health with an empty 200 before any other processing.
 */
class HealthCheckMiddleware final : public Middleware {
public:
  static constexpr kj::StringPtr kHealthPath = "/health"_kj;

  [[nodiscard]] kj::StringPtr name() const override {
    return "health-check"_kj;
  }

  kj::Promise<FilterOutcome> process(RequestContext& ctx) override;
};

} // namespace tollgate::gateway
