#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/exception.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

/**
 * Terminal error and not-found responders.
 *
 * Errors that carry an explicit HTTP status become {"error": message} with that
 * status. Anything else is an internal failure: it is logged with its stack and the
 * redacted request, then answered with a 500 proxy_error body.
 */
class FaultBoundary {
public:
  static constexpr kj::StringPtr kProxyNote =
      "Reverse proxy encountered an internal server error."_kj;

  explicit FaultBoundary(core::Logger& logger) : logger_(logger) {}

  /**
   * Answer a failed request. Once the response has started the error is logged and
   * rethrown, so the HTTP server drops the connection and reports the fault.
   */
  kj::Promise<void> handleError(RequestContext& ctx, kj::Exception error);
  kj::Promise<void> notFound(RequestContext& ctx);

  /**
   * True for errors without an explicit status, i.e. the ones answered with 500.
   */
  static bool isInternal(const kj::Exception& error);

  static kj::String internalErrorBody(const kj::Exception& error);

private:
  core::Logger& logger_;
};

} // namespace tollgate::gateway
