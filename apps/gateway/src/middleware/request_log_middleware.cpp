#include "middleware/request_log_middleware.h"

#include "middleware/redaction.h"

#include <tollgate/core/error.h>
#include <tollgate/core/json.h>

namespace tollgate::gateway {

using core::json_field;
using core::JsonBuilder;
using core::kv;

RequestLogMiddleware::RequestLogMiddleware(core::Logger& logger, kj::Timer& timer)
    : logger_(logger), timer_(timer) {
  addQuietPath("/health"_kj);
  addQuietPath("/proxy/kobold/api/v1/model"_kj);
}

void RequestLogMiddleware::addQuietPath(kj::StringPtr url) {
  quietPaths_.add(kj::str(url));
}

bool RequestLogMiddleware::isQuiet(kj::StringPtr url) const {
  for (auto& quiet : quietPaths_) {
    if (quiet == url) {
      return true;
    }
  }
  return false;
}

kj::Promise<FilterOutcome> RequestLogMiddleware::process(RequestContext& ctx) {
  if (logger_.enabled(core::LogLevel::Trace)) {
    logger_.trace("request received", {json_field("req", redaction::requestSummaryJson(ctx))});
  }
  return FilterOutcome(Continue{});
}

void RequestLogMiddleware::finish(RequestContext& ctx, kj::Maybe<const kj::Exception&> error) {
  kj::uint status = ctx.response.status().orDefault(500u);
  bool failed = error != kj::none || status >= 500;

  if (!failed && status < 400 && isQuiet(ctx.url)) {
    return;
  }

  core::LogLevel level = core::LogLevel::Info;
  if (failed) {
    level = core::LogLevel::Error;
  } else if (status >= 400) {
    level = core::LogLevel::Warn;
  }
  if (!logger_.enabled(level)) {
    return;
  }

  double responseTimeMs = 0;
  if (ctx.hasBookkeeping()) {
    responseTimeMs = (timer_.now() - ctx.bookkeeping().arrivalMonotonic) / kj::MICROSECONDS / 1000.0;
  }

  kj::Vector<core::LogField> fields;
  fields.add(json_field("req", redaction::requestSummaryJson(ctx)));
  fields.add(json_field("res", JsonBuilder::object().put("statusCode", static_cast<int>(status)).build()));
  fields.add(kv("responseTime", responseTimeMs));

  if (failed) {
    // Error lines also carry the (redacted) body to help reproduce the failure
    fields.add(json_field("body", redaction::bodyJson(ctx.parsedBody)));
    KJ_IF_SOME(exception, error) {
      fields.add(json_field("err", JsonBuilder::object()
                                       .put("type", "Error")
                                       .put("message", exception.getDescription())
                                       .put("stack", core::describe_stack(exception).asPtr())
                                       .build()));
    }
    logger_.log(level, "request errored"_kj, fields.asPtr());
  } else {
    logger_.log(level, "request completed"_kj, fields.asPtr());
  }
}

} // namespace tollgate::gateway
