#pragma once

#include "gateway_config.h"
#include "route_dispatcher.h"
#include "services/key_pool.h"
#include "services/prompt_log_writer.h"
#include "services/request_queue.h"
#include "services/user_store.h"

namespace tollgate::gateway {

/**
 * Proxy routes, mounted at /proxy.
 *
 * GET  /{provider}/v1/models             models offered for a configured provider
 * GET  /kobold/api/v1/model              model name reported to KoboldAI clients
 * POST /{provider}/v1/chat/completions   admitted through the request queue, assigned
 *                                        a key and prompt-logged; answered 501 since
 *                                        nothing is forwarded upstream
 *
 * Access is checked by the configured gatekeeper before any route runs.
 */
class ProxyHandler final : public RouteGroup {
public:
  ProxyHandler(const GatewayConfig& config, KeyPool& keyPool, UserStore& users,
               RequestQueue& queue, PromptLogWriter& promptLog);

  void registerRoutes(Router& router) override;

  /**
   * Enforce the gatekeeper for a request.
   * @throws kj::Exception with status 401 when access is denied
   */
  void checkAccess(const RequestContext& ctx);

  static kj::Maybe<kj::StringPtr> bearerToken(const RequestContext& ctx);

private:
  kj::Promise<void> handleListModels(RequestContext& ctx);
  kj::Promise<void> handleKoboldModel(RequestContext& ctx);
  kj::Promise<void> handleCompletion(RequestContext& ctx);

  const GatewayConfig& config_;
  KeyPool& keyPool_;
  UserStore& users_;
  RequestQueue& queue_;
  PromptLogWriter& promptLog_;
};

} // namespace tollgate::gateway
