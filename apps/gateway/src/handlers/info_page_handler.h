#pragma once

#include "build_info.h"
#include "gateway_config.h"
#include "route_dispatcher.h"
#include "services/key_pool.h"
#include "services/request_queue.h"
#include "services/user_store.h"

#include <kj/timer.h>

namespace tollgate::gateway {

/**
 * GET / : service status as JSON (build, uptime, access mode, key and queue counts).
 */
class InfoPageHandler final : public RouteGroup {
public:
  InfoPageHandler(const BuildInfo& buildInfo, const GatewayConfig& config, const KeyPool& keyPool,
                  const RequestQueue& queue, const UserStore& users, kj::Timer& timer);

  void registerRoutes(Router& router) override;

  [[nodiscard]] kj::String renderInfo() const;

private:
  kj::Promise<void> handleInfo(RequestContext& ctx);

  const BuildInfo& buildInfo_;
  const GatewayConfig& config_;
  const KeyPool& keyPool_;
  const RequestQueue& queue_;
  const UserStore& users_;
  kj::Timer& timer_;
  kj::TimePoint startedAt_;
};

} // namespace tollgate::gateway
