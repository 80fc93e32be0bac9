#include "handlers/admin_handler.h"

#include <tollgate/core/error.h>
#include <tollgate/core/json.h>
#include <tollgate/core/time.h>

namespace tollgate::gateway {

using core::JsonBuilder;

AdminHandler::AdminHandler(const GatewayConfig& config, UserStore& users)
    : config_(config), users_(users) {}

void AdminHandler::registerRoutes(Router& router) {
  router.add_route(kj::HttpMethod::GET, "/users"_kj,
                   [this](RequestContext& ctx) { return handleListUsers(ctx); });
  router.add_route(kj::HttpMethod::POST, "/users"_kj,
                   [this](RequestContext& ctx) { return handleCreateUser(ctx); });
}

void AdminHandler::authorize(const RequestContext& ctx) const {
  if (config_.admin_key.size() == 0) {
    core::throw_http_error(401, "Admin access is not configured"_kj);
  }
  KJ_IF_SOME(header, ctx.getHeader("Authorization"_kj)) {
    if (header.startsWith("Bearer "_kj) && header.slice(7) == config_.admin_key) {
      return;
    }
  }
  core::throw_http_error(401, "Unauthorized"_kj);
}

void AdminHandler::requireUserStore() const {
  if (!users_.isInitialized()) {
    core::throw_http_error(400, "User token authentication is not enabled"_kj);
  }
}

kj::Promise<void> AdminHandler::handleListUsers(RequestContext& ctx) {
  authorize(ctx);
  requireUserStore();

  auto body = JsonBuilder::object()
                  .put_array("users",
                             [&](JsonBuilder& list) {
                               for (auto& user : users_.users()) {
                                 list.add_object([&](JsonBuilder& entry) {
                                   entry.put("id", user.id.asPtr())
                                       .put("createdAt", core::format_iso8601(user.created_at).asPtr())
                                       .put("requestCount", user.request_count);
                                 });
                               }
                             })
                  .build();
  return ctx.sendJson(200, body);
}

kj::Promise<void> AdminHandler::handleCreateUser(RequestContext& ctx) {
  authorize(ctx);
  requireUserStore();

  auto created = users_.createUser();
  auto body = JsonBuilder::object()
                  .put("id", created.id.asPtr())
                  .put("token", created.token.asPtr())
                  .build();
  return ctx.sendJson(201, body);
}

} // namespace tollgate::gateway
