#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/compat/http.h>
#include <kj/function.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace tollgate::gateway {

/**
 * Routing table for one mounted group.
 *
 * A pattern segment written as "{name}" matches any non-empty segment and binds it
 * under that name. The first registered route that fits wins, and a trailing '/' on
 * the request path is ignored. HEAD requests fall back to GET routes when no HEAD
 * route fits.
 */
class Router {
public:
  using Handler = kj::Function<kj::Promise<void>(RequestContext&)>;

  struct Match {
    Handler& handler;
    kj::HashMap<kj::String, kj::String> params;
  };

  void add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler);

  kj::Maybe<Match> match(kj::HttpMethod method, kj::StringPtr path);

  [[nodiscard]] size_t route_count() const {
    return routes_.size();
  }

private:
  struct Route {
    kj::HttpMethod method;
    kj::Array<kj::String> segments;
    Handler handler;
  };

  kj::Maybe<Match> matchSegments(kj::HttpMethod method,
                                 kj::ArrayPtr<const kj::ArrayPtr<const char>> parts);

  kj::Vector<Route> routes_;
};

} // namespace tollgate::gateway
