#pragma once

#include "router.h"

#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace tollgate::gateway {

/**
 * A set of routes registered relative to a mount prefix.
 */
class RouteGroup {
public:
  virtual ~RouteGroup() noexcept = default;

  virtual void registerRoutes(Router& router) = 0;
};

/**
 * Maps path prefixes to route groups.
 *
 * Mounting is only allowed until seal() is called; the gateway seals the table
 * before it starts listening. The longest matching prefix wins and the group sees
 * the path with the prefix removed.
 */
class RouteDispatcher {
public:
  /**
   * @param prefix "" for the root group, otherwise "/name"
   */
  void mount(kj::StringPtr prefix, RouteGroup& group);
  void seal();

  [[nodiscard]] bool isSealed() const {
    return sealed_;
  }
  [[nodiscard]] size_t mountCount() const {
    return mounts_.size();
  }

  /**
   * Run the matching route handler.
   * @return false when no route matches the method and path
   */
  kj::Promise<bool> dispatch(RequestContext& ctx);

private:
  struct Mount {
    kj::String prefix;
    kj::Own<Router> router;
  };

  kj::Maybe<Mount&> findMount(kj::StringPtr path, kj::StringPtr& relative);

  kj::Vector<Mount> mounts_;
  bool sealed_ = false;
};

} // namespace tollgate::gateway
