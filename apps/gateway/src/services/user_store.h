#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/async.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace tollgate::gateway {

/**
 * A user allowed through the user_token gatekeeper
 */
struct User {
  kj::String id;
  kj::String token_hash; // SHA256 hash, hex encoded
  kj::Date created_at;
  uint64_t request_count = 0;
};

/**
 * Result of user creation. The raw token is returned exactly once; only its hash
 * is stored.
 */
struct CreatedUser {
  kj::String id;
  kj::String token;
};

/**
 * In-memory store of user tokens.
 *
 * Tokens are 32 random bytes (hex encoded) generated with OpenSSL; lookups go
 * through their SHA-256 digest.
 */
class UserStore {
public:
  explicit UserStore(const kj::Clock& clock);

  kj::Promise<void> init();

  [[nodiscard]] bool isInitialized() const {
    return initialized_;
  }

  CreatedUser createUser();

  /**
   * @return The user id owning token, or kj::none if the token is unknown
   */
  kj::Maybe<kj::StringPtr> authenticate(kj::StringPtr token);

  [[nodiscard]] kj::ArrayPtr<const User> users() const {
    return users_.asPtr();
  }
  [[nodiscard]] size_t userCount() const {
    return users_.size();
  }

  static kj::String hashToken(kj::StringPtr token);

private:
  static kj::Array<kj::byte> generate_random_bytes(size_t length);
  static kj::Array<kj::byte> sha256_hash(kj::ArrayPtr<const kj::byte> data);

  const kj::Clock& clock_;
  bool initialized_ = false;
  kj::Vector<User> users_;
  // Map from token hash to index into users_
  kj::HashMap<kj::String, size_t> by_hash_;
};

} // namespace tollgate::gateway
