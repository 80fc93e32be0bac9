#include "route_dispatcher.h"

#include <kj/debug.h>

namespace tollgate::gateway {

void RouteDispatcher::mount(kj::StringPtr prefix, RouteGroup& group) {
  KJ_REQUIRE(!sealed_, "routes are frozen once the server is listening", prefix);
  KJ_REQUIRE(prefix.size() == 0 || (prefix.startsWith("/") && !prefix.endsWith("/"_kj)),
             "mount prefix must be empty or start with '/' and not end with '/'", prefix);
  for (auto& existing : mounts_) {
    KJ_REQUIRE(existing.prefix != prefix, "prefix already mounted", prefix);
  }

  auto router = kj::heap<Router>();
  group.registerRoutes(*router);
  mounts_.add(Mount{kj::str(prefix), kj::mv(router)});
}

void RouteDispatcher::seal() {
  sealed_ = true;
}

kj::Maybe<RouteDispatcher::Mount&> RouteDispatcher::findMount(kj::StringPtr path,
                                                               kj::StringPtr& relative) {
  kj::Maybe<Mount&> best;
  size_t bestLength = 0;
  for (auto& mount : mounts_) {
    auto& prefix = mount.prefix;
    bool matches = prefix.size() == 0 ||
                   (path.startsWith(prefix) &&
                    (path.size() == prefix.size() || path[prefix.size()] == '/'));
    if (matches && (best == kj::none || prefix.size() > bestLength)) {
      best = mount;
      bestLength = prefix.size();
    }
  }

  if (best != kj::none) {
    relative = path.slice(bestLength);
    if (relative.size() == 0) {
      relative = "/"_kj;
    }
  }
  return best;
}

kj::Promise<bool> RouteDispatcher::dispatch(RequestContext& ctx) {
  kj::StringPtr relative;
  KJ_IF_SOME(mount, findMount(ctx.path, relative)) {
    auto found = mount.router->match(ctx.method, relative);
    KJ_IF_SOME(match, found) {
      ctx.path_params = kj::mv(match.params);
      co_await match.handler(ctx);
      co_return true;
    }
  }
  co_return false;
}

} // namespace tollgate::gateway
