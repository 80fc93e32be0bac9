#pragma once

#include "gateway_config.h"
#include "route_dispatcher.h"
#include "services/user_store.h"

namespace tollgate::gateway {

/**
 * Administrative routes, mounted at /admin.
 *
 * GET  /users  list users (ids and creation times, never tokens)
 * POST /users  create a user and return its token once
 *
 * Every route requires "Authorization: Bearer <admin key>".
 */
class AdminHandler final : public RouteGroup {
public:
  AdminHandler(const GatewayConfig& config, UserStore& users);

  void registerRoutes(Router& router) override;

private:
  void authorize(const RequestContext& ctx) const;
  void requireUserStore() const;

  kj::Promise<void> handleListUsers(RequestContext& ctx);
  kj::Promise<void> handleCreateUser(RequestContext& ctx);

  const GatewayConfig& config_;
  UserStore& users_;
};

} // namespace tollgate::gateway
