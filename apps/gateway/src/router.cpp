#include "router.h"

#include <kj/debug.h>

namespace tollgate::gateway {

namespace {

// "/a/b/" -> ["a", "b"]; "/" and "" -> []
kj::Vector<kj::ArrayPtr<const char>> splitPath(kj::StringPtr path) {
  kj::Vector<kj::ArrayPtr<const char>> parts;
  auto rest = path.asArray();
  if (rest.size() > 0 && rest[0] == '/') {
    rest = rest.slice(1, rest.size());
  }
  if (rest.size() > 0 && rest[rest.size() - 1] == '/') {
    rest = rest.slice(0, rest.size() - 1);
  }
  if (rest.size() == 0) {
    return parts;
  }

  size_t start = 0;
  for (size_t i = 0; i <= rest.size(); ++i) {
    if (i == rest.size() || rest[i] == '/') {
      parts.add(rest.slice(start, i));
      start = i + 1;
    }
  }
  return parts;
}

kj::Maybe<kj::StringPtr> paramName(kj::StringPtr segment) {
  if (segment.startsWith("{") && segment.endsWith("}"_kj)) {
    return segment.slice(1, segment.size() - 1);
  }
  return kj::none;
}

} // namespace

void Router::add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler) {
  KJ_REQUIRE(pattern.startsWith("/"), "Pattern must start with '/'", pattern);

  auto parts = splitPath(pattern);
  auto segments = kj::heapArrayBuilder<kj::String>(parts.size());
  for (auto part : parts) {
    auto segment = kj::heapString(part);
    KJ_IF_SOME(name, paramName(segment)) {
      KJ_REQUIRE(name.size() > 0, "Parameter name cannot be empty", pattern);
    }
    segments.add(kj::mv(segment));
  }

  routes_.add(Route{method, segments.finish(), kj::mv(handler)});
}

kj::Maybe<Router::Match> Router::match(kj::HttpMethod method, kj::StringPtr path) {
  auto parts = splitPath(path);
  auto found = matchSegments(method, parts);
  if (found == kj::none && method == kj::HttpMethod::HEAD) {
    // kj::HttpServer drops the body of a HEAD response
    return matchSegments(kj::HttpMethod::GET, parts);
  }
  return found;
}

kj::Maybe<Router::Match>
Router::matchSegments(kj::HttpMethod method, kj::ArrayPtr<const kj::ArrayPtr<const char>> parts) {
  for (auto& route : routes_) {
    if (route.method != method || route.segments.size() != parts.size()) {
      continue;
    }

    kj::HashMap<kj::String, kj::String> params;
    bool fits = true;
    for (size_t i = 0; fits && i < parts.size(); ++i) {
      KJ_IF_SOME(name, paramName(route.segments[i])) {
        fits = parts[i].size() > 0;
        if (fits) {
          params.upsert(kj::str(name), kj::heapString(parts[i]));
        }
      } else {
        fits = parts[i] == route.segments[i].asArray();
      }
    }

    if (fits) {
      return Match{route.handler, kj::mv(params)};
    }
  }

  return kj::none;
}

} // namespace tollgate::gateway
