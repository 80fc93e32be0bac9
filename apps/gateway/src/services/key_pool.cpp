#include "services/key_pool.h"

#include "util/http_utils.h"

#include <kj/debug.h>

namespace tollgate::gateway {

KeyPool::KeyPool(kj::Vector<ProviderKeys> sources) : sources_(kj::mv(sources)) {}

void KeyPool::init() {
  KJ_REQUIRE(!initialized_, "key pool already initialized");

  for (auto& source : sources_) {
    Provider provider;
    provider.keys = util::splitList(source.keys);
    order_.add(kj::str(source.provider));
    providers_.insert(kj::str(source.provider), kj::mv(provider));
  }
  initialized_ = true;
}

size_t KeyPool::keyCount(kj::StringPtr provider) const {
  KJ_REQUIRE(initialized_, "key pool not initialized");
  KJ_IF_SOME(entry, providers_.find(provider)) {
    return entry.keys.size();
  }
  return 0;
}

size_t KeyPool::totalKeys() const {
  KJ_REQUIRE(initialized_, "key pool not initialized");
  size_t total = 0;
  for (auto& entry : providers_) {
    total += entry.value.keys.size();
  }
  return total;
}

kj::Vector<kj::StringPtr> KeyPool::providers() const {
  kj::Vector<kj::StringPtr> names;
  for (auto& name : order_) {
    names.add(name);
  }
  return names;
}

kj::Maybe<kj::StringPtr> KeyPool::select(kj::StringPtr provider) {
  KJ_REQUIRE(initialized_, "key pool not initialized");
  KJ_IF_SOME(entry, providers_.find(provider)) {
    if (entry.keys.size() == 0) {
      return kj::none;
    }
    auto& key = entry.keys[entry.next % entry.keys.size()];
    entry.next = (entry.next + 1) % entry.keys.size();
    return key.asPtr();
  }
  return kj::none;
}

} // namespace tollgate::gateway
