#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/exception.h>
#include <kj/one-of.h>
#include <kj/string.h>

namespace tollgate::gateway {

/**
 * Stage outcome: hand the request to the next stage.
 */
struct Continue {};

/**
 * Stage outcome: answer the request now and skip the remaining stages and routes.
 * An empty body is sent without a Content-Type.
 */
struct ShortCircuit {
  kj::uint status;
  kj::String body;
  kj::StringPtr contentType = "application/json; charset=utf-8"_kj;
};

/**
 * Stage outcome: the request failed; the error goes to the fault boundary.
 */
struct Fail {
  kj::Exception error;
};

using FilterOutcome = kj::OneOf<Continue, ShortCircuit, Fail>;

/**
 * Base interface for filter stages.
 *
 * Stages run in a fixed order for every request. A stage inspects or annotates the
 * RequestContext and returns an outcome; it never calls the next stage itself.
 * A stage that throws is treated as returning Fail.
 *
 * Once the response is complete, finish() is called on every stage that was
 * entered, in reverse order. error is set when the request ended in an unhandled
 * fault.
 */
class Middleware {
public:
  virtual ~Middleware() noexcept = default;

  [[nodiscard]] virtual kj::StringPtr name() const = 0;

  virtual kj::Promise<FilterOutcome> process(RequestContext& ctx) = 0;

  virtual void finish(RequestContext& ctx, kj::Maybe<const kj::Exception&> error) {
    (void)ctx;
    (void)error;
  }
};

} // namespace tollgate::gateway
