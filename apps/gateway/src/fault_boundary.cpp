#include "fault_boundary.h"

#include "middleware/redaction.h"

#include <kj/debug.h>
#include <tollgate/core/error.h>
#include <tollgate/core/json.h>

namespace tollgate::gateway {

using core::json_field;
using core::kv;

bool FaultBoundary::isInternal(const kj::Exception& error) {
  return core::http_status_of(error) == kj::none;
}

kj::String FaultBoundary::internalErrorBody(const kj::Exception& error) {
  return core::JsonBuilder::object()
      .put_object("error",
                  [&](core::JsonBuilder& body) {
                    body.put("type", "proxy_error")
                        .put("message", error.getDescription())
                        .put("stack", core::describe_stack(error).asPtr())
                        .put("proxy_note", kProxyNote);
                  })
      .build();
}

kj::Promise<void> FaultBoundary::handleError(RequestContext& ctx, kj::Exception error) {
  if (ctx.response.sent()) {
    // Headers are already on the wire; the connection cannot carry another response
    logger_.error("Error after response was sent",
                  {kv("error", error.getDescription()),
                   json_field("req", redaction::requestSummaryJson(ctx))});
    kj::throwFatalException(kj::mv(error));
  }

  KJ_IF_SOME(status, core::http_status_of(error)) {
    co_await ctx.sendError(status, error.getDescription());
    co_return;
  }

  logger_.error("Unhandled error in request",
                {kv("error", error.getDescription()), kv("stack", core::describe_stack(error)),
                 json_field("req", redaction::requestSummaryJson(ctx)),
                 json_field("body", redaction::bodyJson(ctx.parsedBody))});
  co_await ctx.sendJson(500, internalErrorBody(error));
}

kj::Promise<void> FaultBoundary::notFound(RequestContext& ctx) {
  return ctx.sendError(404, "Not found"_kj);
}

} // namespace tollgate::gateway
