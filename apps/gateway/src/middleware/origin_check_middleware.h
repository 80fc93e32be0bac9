#pragma once

#include "middleware.h"

#include <kj/vector.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

/**
 * Rejects requests whose Origin or Referer mentions a blocked origin.
 *
 * Matching is by substring, so "example.com" also blocks its subdomains.
 */
class OriginCheckMiddleware final : public Middleware {
public:
  struct Config {
    kj::Vector<kj::String> blockedOrigins;
    kj::String message;
  };

  OriginCheckMiddleware(Config&& config, core::Logger& logger);

  [[nodiscard]] kj::StringPtr name() const override {
    return "origin-check"_kj;
  }

  kj::Promise<FilterOutcome> process(RequestContext& ctx) override;

  /**
   * The blocked origin that value mentions, if any.
   */
  [[nodiscard]] kj::Maybe<kj::StringPtr> matchBlocked(kj::StringPtr value) const;

private:
  Config config_;
  core::Logger& logger_;
  kj::String blockedBody_;
};

} // namespace tollgate::gateway
