#include "middleware/origin_check_middleware.h"

#include <tollgate/core/json.h>

namespace tollgate::gateway {

using core::kv;

OriginCheckMiddleware::OriginCheckMiddleware(Config&& config, core::Logger& logger)
    : config_(kj::mv(config)), logger_(logger) {
  blockedBody_ = core::JsonBuilder::object()
                     .put_object("error",
                                 [&](core::JsonBuilder& error) {
                                   error.put("type", "blocked_origin")
                                       .put("message", config_.message.asPtr());
                                 })
                     .build();
}

kj::Maybe<kj::StringPtr> OriginCheckMiddleware::matchBlocked(kj::StringPtr value) const {
  for (auto& blocked : config_.blockedOrigins) {
    if (value.find(blocked) != kj::none) {
      return blocked.asPtr();
    }
  }
  return kj::none;
}

kj::Promise<FilterOutcome> OriginCheckMiddleware::process(RequestContext& ctx) {
  if (config_.blockedOrigins.size() == 0) {
    return FilterOutcome(Continue{});
  }

  auto origin = ctx.getHeader("Origin"_kj);
  auto referer = ctx.getHeader("Referer"_kj);

  kj::Maybe<kj::StringPtr> matched;
  KJ_IF_SOME(value, origin) {
    matched = matchBlocked(value);
  }
  if (matched == kj::none) {
    KJ_IF_SOME(value, referer) {
      matched = matchBlocked(value);
    }
  }

  KJ_IF_SOME(blocked, matched) {
    logger_.warn("Blocked request from origin",
                 {kv("origin", origin.orDefault(""_kj)), kv("referer", referer.orDefault(""_kj)),
                  kv("blocked", blocked), kv("ip", ctx.peerAddress.asPtr())});
    return FilterOutcome(ShortCircuit{403, kj::str(blockedBody_)});
  }
  return FilterOutcome(Continue{});
}

} // namespace tollgate::gateway
