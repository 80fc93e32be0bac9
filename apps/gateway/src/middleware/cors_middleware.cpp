#include "middleware/cors_middleware.h"

#include <kj/debug.h>

namespace tollgate::gateway {

CorsMiddleware::Config CorsMiddleware::Config::permissive() {
  Config config;
  for (auto method : {"GET", "HEAD", "PUT", "PATCH", "POST", "DELETE"}) {
    config.allowedMethods.add(kj::str(method));
  }
  return config;
}

CorsMiddleware::CorsMiddleware(Config&& config) : config_(kj::mv(config)) {
  methodsHeader_ = kj::strArray(config_.allowedMethods, ",");
  headersHeader_ = kj::strArray(config_.allowedHeaders, ",");
}

CorsMiddleware::~CorsMiddleware() noexcept = default;

kj::Promise<FilterOutcome> CorsMiddleware::process(RequestContext& ctx) {
  ctx.response.addHeader("Access-Control-Allow-Origin"_kj, config_.allowedOrigin);
  if (config_.allowCredentials) {
    ctx.response.addHeader("Access-Control-Allow-Credentials"_kj, "true"_kj);
  }

  // Every OPTIONS request is answered here; routes never see OPTIONS
  if (ctx.method != kj::HttpMethod::OPTIONS) {
    return FilterOutcome(Continue{});
  }

  if (methodsHeader_.size() > 0) {
    ctx.response.addHeader("Access-Control-Allow-Methods"_kj, methodsHeader_);
  }

  if (headersHeader_.size() > 0) {
    ctx.response.addHeader("Access-Control-Allow-Headers"_kj, headersHeader_);
  } else {
    KJ_IF_SOME(requested, ctx.getHeader("Access-Control-Request-Headers"_kj)) {
      ctx.response.addHeader("Access-Control-Allow-Headers"_kj, requested);
      ctx.response.addHeader("Vary"_kj, "Access-Control-Request-Headers"_kj);
    }
  }

  KJ_IF_SOME(maxAge, config_.maxAge) {
    ctx.response.addHeader("Access-Control-Max-Age"_kj, kj::str(maxAge));
  }

  KJ_LOG(DBG, "CORS: answered preflight", ctx.path);
  return FilterOutcome(ShortCircuit{204, kj::str(), "text/plain"_kj});
}

} // namespace tollgate::gateway
