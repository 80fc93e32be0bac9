#pragma once

#include "middleware.h"

#include <kj/string.h>
#include <kj/vector.h>

namespace tollgate::gateway {

/**
 * Cross-origin policy stage.
 *
 * Adds Access-Control-Allow-Origin to every response that passes this stage and
 * answers preflight requests directly.
 */
class CorsMiddleware final : public Middleware {
public:
  struct Config {
    kj::String allowedOrigin = kj::str("*");
    kj::Vector<kj::String> allowedMethods;
    // Empty means reflect Access-Control-Request-Headers
    kj::Vector<kj::String> allowedHeaders;
    bool allowCredentials = false;
    kj::Maybe<int32_t> maxAge;

    /**
     * Permissive defaults: any origin, GET,HEAD,PUT,PATCH,POST,DELETE.
     */
    static Config permissive();
  };

  explicit CorsMiddleware(Config&& config);
  ~CorsMiddleware() noexcept override;

  [[nodiscard]] kj::StringPtr name() const override {
    return "cors"_kj;
  }

  kj::Promise<FilterOutcome> process(RequestContext& ctx) override;

private:
  Config config_;
  kj::String methodsHeader_;
  kj::String headersHeader_;
};

} // namespace tollgate::gateway
