#include "middleware/context_init_middleware.h"

namespace tollgate::gateway {

kj::Promise<FilterOutcome> ContextInitMiddleware::process(RequestContext& ctx) {
  ctx.initBookkeeping(clock_.now(), timer_.now());
  return FilterOutcome(Continue{});
}

} // namespace tollgate::gateway
