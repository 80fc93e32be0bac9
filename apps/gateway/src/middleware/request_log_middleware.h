#pragma once

#include "middleware.h"

#include <kj/timer.h>
#include <kj/vector.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

/**
 * Structured request logging.
 *
 * Emits one line per request when it finishes: "request completed" (info, or
 * warn for 4xx) or "request errored" (error, for 5xx and unhandled faults). Lines
 * carry the redacted request summary, the response status and the response time
 * in milliseconds. Successful requests to quiet paths are not logged.
 */
class RequestLogMiddleware final : public Middleware {
public:
  RequestLogMiddleware(core::Logger& logger, kj::Timer& timer);

  [[nodiscard]] kj::StringPtr name() const override {
    return "request-log"_kj;
  }

  kj::Promise<FilterOutcome> process(RequestContext& ctx) override;
  void finish(RequestContext& ctx, kj::Maybe<const kj::Exception&> error) override;

  /**
   * Exact URLs whose successful completions are not logged.
   */
  void addQuietPath(kj::StringPtr url);
  [[nodiscard]] bool isQuiet(kj::StringPtr url) const;

private:
  core::Logger& logger_;
  kj::Timer& timer_;
  kj::Vector<kj::String> quietPaths_;
};

} // namespace tollgate::gateway
