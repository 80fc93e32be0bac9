#include "handlers/info_page_handler.h"

#include <tollgate/core/json.h>

namespace tollgate::gateway {

using core::JsonBuilder;

InfoPageHandler::InfoPageHandler(const BuildInfo& buildInfo, const GatewayConfig& config,
                                 const KeyPool& keyPool, const RequestQueue& queue,
                                 const UserStore& users, kj::Timer& timer)
    : buildInfo_(buildInfo), config_(config), keyPool_(keyPool), queue_(queue), users_(users),
      timer_(timer), startedAt_(timer.now()) {}

void InfoPageHandler::registerRoutes(Router& router) {
  router.add_route(kj::HttpMethod::GET, "/"_kj,
                   [this](RequestContext& ctx) { return handleInfo(ctx); });
}

kj::String InfoPageHandler::renderInfo() const {
  auto uptimeSeconds = static_cast<int64_t>((timer_.now() - startedAt_) / kj::SECONDS);
  auto providers = keyPool_.providers();

  auto info = JsonBuilder::object();
  info.put("build", buildInfo_.text())
      .put("uptime", uptimeSeconds)
      .put_object("endpoints",
                  [&](JsonBuilder& endpoints) {
                    for (auto provider : providers) {
                      endpoints.put(provider, kj::str("/proxy/", provider).asPtr());
                    }
                    endpoints.put("kobold", "/proxy/kobold");
                  })
      .put("gatekeeper", kj::str(config_.gatekeeper).asPtr())
      .put("queueMode", kj::str(config_.queue_mode).asPtr())
      .put_object("keys",
                  [&](JsonBuilder& keys) {
                    if (keyPool_.isInitialized()) {
                      for (auto provider : providers) {
                        keys.put(provider, static_cast<uint64_t>(keyPool_.keyCount(provider)));
                      }
                    }
                  })
      .put("queueDepth", static_cast<uint64_t>(queue_.totalDepth()));

  if (users_.isInitialized()) {
    info.put("users", static_cast<uint64_t>(users_.userCount()));
  }
  return info.build();
}

kj::Promise<void> InfoPageHandler::handleInfo(RequestContext& ctx) {
  return ctx.sendJson(200, renderInfo());
}

} // namespace tollgate::gateway
