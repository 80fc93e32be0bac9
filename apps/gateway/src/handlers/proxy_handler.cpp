#include "handlers/proxy_handler.h"

#include "middleware/redaction.h"

#include <kj/debug.h>
#include <tollgate/core/error.h>
#include <tollgate/core/json.h>
#include <tollgate/core/time.h>

namespace tollgate::gateway {

using core::JsonBuilder;

namespace {

struct ModelFamily {
  kj::StringPtr provider;
  kj::StringPtr owner;
  kj::ArrayPtr<const kj::StringPtr> models;
};

constexpr kj::StringPtr kOpenAiModels[] = {"gpt-3.5-turbo"_kj, "gpt-4"_kj, "gpt-4-32k"_kj};
constexpr kj::StringPtr kAnthropicModels[] = {"claude-v1"_kj, "claude-v1-100k"_kj,
                                              "claude-instant-v1"_kj};

kj::Maybe<ModelFamily> familyFor(kj::StringPtr provider) {
  if (provider == "openai"_kj) {
    return ModelFamily{"openai"_kj, "openai"_kj, kj::arrayPtr(kOpenAiModels)};
  }
  if (provider == "anthropic"_kj) {
    return ModelFamily{"anthropic"_kj, "anthropic"_kj, kj::arrayPtr(kAnthropicModels)};
  }
  return kj::none;
}

// Prompt and message contents are censored like in request logs
kj::String promptRecord(const RequestContext& ctx, kj::StringPtr provider) {
  auto model = kj::str("unknown");
  KJ_IF_SOME(doc, ctx.parsedBody.tryGet<core::JsonDocument>()) {
    model = doc.root()["model"].get_string("unknown"_kj);
  }
  auto& bookkeeping = ctx.bookkeeping();
  return JsonBuilder::object()
      .put("time", core::format_iso8601(bookkeeping.arrivalTimestamp).asPtr())
      .put("requestId", static_cast<uint64_t>(ctx.requestId))
      .put("provider", provider)
      .put("endpoint", ctx.path.asPtr())
      .put("model", model.asPtr())
      .put("retries", static_cast<int64_t>(bookkeeping.retryCount))
      .put_raw("body", redaction::bodyJson(ctx.parsedBody))
      .build();
}

} // namespace

ProxyHandler::ProxyHandler(const GatewayConfig& config, KeyPool& keyPool, UserStore& users,
                           RequestQueue& queue, PromptLogWriter& promptLog)
    : config_(config), keyPool_(keyPool), users_(users), queue_(queue), promptLog_(promptLog) {}

void ProxyHandler::registerRoutes(Router& router) {
  router.add_route(kj::HttpMethod::GET, "/kobold/api/v1/model"_kj,
                   [this](RequestContext& ctx) { return handleKoboldModel(ctx); });
  router.add_route(kj::HttpMethod::GET, "/{provider}/v1/models"_kj,
                   [this](RequestContext& ctx) { return handleListModels(ctx); });
  router.add_route(kj::HttpMethod::POST, "/{provider}/v1/chat/completions"_kj,
                   [this](RequestContext& ctx) { return handleCompletion(ctx); });
}

kj::Maybe<kj::StringPtr> ProxyHandler::bearerToken(const RequestContext& ctx) {
  KJ_IF_SOME(header, ctx.getHeader("Authorization"_kj)) {
    if (header.startsWith("Bearer "_kj)) {
      return header.slice(7);
    }
  }
  return ctx.getHeader("X-Api-Key"_kj);
}

void ProxyHandler::checkAccess(const RequestContext& ctx) {
  switch (config_.gatekeeper) {
  case GatekeeperMode::None:
    return;
  case GatekeeperMode::ProxyKey:
    KJ_IF_SOME(token, bearerToken(ctx)) {
      if (token == config_.proxy_key) {
        return;
      }
    }
    break;
  case GatekeeperMode::UserToken:
    KJ_IF_SOME(token, bearerToken(ctx)) {
      if (users_.authenticate(token) != kj::none) {
        return;
      }
    }
    break;
  }
  core::throw_http_error(401, "Unauthorized"_kj);
}

kj::Promise<void> ProxyHandler::handleListModels(RequestContext& ctx) {
  checkAccess(ctx);

  auto provider = KJ_ASSERT_NONNULL(ctx.getPathParam("provider"_kj));
  KJ_IF_SOME(family, familyFor(provider)) {
    bool available = keyPool_.keyCount(family.provider) > 0;
    auto body = JsonBuilder::object()
                    .put("object", "list")
                    .put_array("data",
                               [&](JsonBuilder& data) {
                                 if (!available) {
                                   return;
                                 }
                                 for (auto model : family.models) {
                                   data.add_object([&](JsonBuilder& entry) {
                                     entry.put("id", model)
                                         .put("object", "model")
                                         .put("owned_by", family.owner);
                                   });
                                 }
                               })
                    .build();
    return ctx.sendJson(200, body);
  }
  core::throw_http_error(404, kj::str("Unknown provider: ", provider));
}

kj::Promise<void> ProxyHandler::handleKoboldModel(RequestContext& ctx) {
  checkAccess(ctx);
  return ctx.sendJson(200, R"({"result":"oai-proxy"})"_kj);
}

kj::Promise<void> ProxyHandler::handleCompletion(RequestContext& ctx) {
  checkAccess(ctx);

  auto provider = kj::str(KJ_ASSERT_NONNULL(ctx.getPathParam("provider"_kj)));
  if (familyFor(provider) == kj::none) {
    core::throw_http_error(404, kj::str("Unknown provider: ", provider));
  }

  bool admitted = false;
  KJ_DEFER(if (admitted) { queue_.release(provider); });
  if (queue_.isRunning()) {
    co_await queue_.enqueue(ctx, provider);
    admitted = true;
  }

  if (keyPool_.select(provider) == kj::none) {
    core::throw_http_error(503, kj::str("No keys available for ", provider));
  }
  if (promptLog_.isRunning()) {
    promptLog_.enqueue(promptRecord(ctx, provider));
  }

  core::throw_http_error(501, kj::str("Forwarding to ", provider, " is not available"));
}

} // namespace tollgate::gateway
