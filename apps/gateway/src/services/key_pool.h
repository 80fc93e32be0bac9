#pragma once

#include <cstdint>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace tollgate::gateway {

/**
 * Upstream provider API keys.
 *
 * Keys are supplied as comma-separated lists per provider and handed out round
 * robin. The pool must be initialized before any lookup.
 */
class KeyPool {
public:
  struct ProviderKeys {
    kj::String provider;
    kj::String keys; ///< comma-separated
  };

  explicit KeyPool(kj::Vector<ProviderKeys> sources);

  /**
   * Parse the configured keys. Initializing twice is an error.
   */
  void init();

  [[nodiscard]] bool isInitialized() const {
    return initialized_;
  }

  [[nodiscard]] size_t keyCount(kj::StringPtr provider) const;
  [[nodiscard]] size_t totalKeys() const;
  [[nodiscard]] kj::Vector<kj::StringPtr> providers() const;

  /**
   * Next key for provider, or kj::none if it has no keys.
   */
  kj::Maybe<kj::StringPtr> select(kj::StringPtr provider);

private:
  struct Provider {
    kj::Vector<kj::String> keys;
    size_t next = 0;
  };

  kj::Vector<ProviderKeys> sources_;
  kj::HashMap<kj::String, Provider> providers_;
  kj::Vector<kj::String> order_;
  bool initialized_ = false;
};

} // namespace tollgate::gateway
