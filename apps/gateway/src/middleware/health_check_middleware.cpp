#include "middleware/health_check_middleware.h"

namespace tollgate::gateway {

kj::Promise<FilterOutcome> HealthCheckMiddleware::process(RequestContext& ctx) {
  bool readOnly = ctx.method == kj::HttpMethod::GET || ctx.method == kj::HttpMethod::HEAD;
  if (readOnly && ctx.path == kHealthPath) {
    return FilterOutcome(ShortCircuit{200, kj::str(), "text/plain"_kj});
  }
  return FilterOutcome(Continue{});
}

} // namespace tollgate::gateway
