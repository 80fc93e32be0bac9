#include "services/user_store.h"

#include <kj/debug.h>
#include <kj/encoding.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace tollgate::gateway {

UserStore::UserStore(const kj::Clock& clock) : clock_(clock) {}

kj::Promise<void> UserStore::init() {
  KJ_REQUIRE(!initialized_, "user store already initialized");
  // Ensure the RNG is seeded before the first token is issued
  KJ_REQUIRE(RAND_status() == 1, "OpenSSL random generator is not seeded");
  initialized_ = true;
  return kj::READY_NOW;
}

CreatedUser UserStore::createUser() {
  KJ_REQUIRE(initialized_, "user store not initialized");

  auto token = kj::encodeHex(generate_random_bytes(32));
  auto id = kj::str("u-", kj::encodeHex(generate_random_bytes(6)));
  auto hash = hashToken(token);

  by_hash_.insert(kj::str(hash), users_.size());
  users_.add(User{kj::str(id), kj::mv(hash), clock_.now(), 0});

  return CreatedUser{kj::mv(id), kj::mv(token)};
}

kj::Maybe<kj::StringPtr> UserStore::authenticate(kj::StringPtr token) {
  KJ_REQUIRE(initialized_, "user store not initialized");
  if (token.size() == 0) {
    return kj::none;
  }

  KJ_IF_SOME(index, by_hash_.find(hashToken(token))) {
    auto& user = users_[index];
    ++user.request_count;
    return user.id.asPtr();
  }
  return kj::none;
}

kj::String UserStore::hashToken(kj::StringPtr token) {
  return kj::encodeHex(sha256_hash(token.asBytes()));
}

kj::Array<kj::byte> UserStore::generate_random_bytes(size_t length) {
  auto bytes = kj::heapArray<kj::byte>(length);
  KJ_REQUIRE(RAND_bytes(bytes.begin(), static_cast<int>(length)) == 1,
             "OpenSSL RAND_bytes failed");
  return bytes;
}

kj::Array<kj::byte> UserStore::sha256_hash(kj::ArrayPtr<const kj::byte> data) {
  auto digest = kj::heapArray<kj::byte>(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  KJ_REQUIRE(EVP_Digest(data.begin(), data.size(), digest.begin(), &digest_len, EVP_sha256(),
                        nullptr) == 1,
             "OpenSSL EVP_Digest failed");
  return digest.slice(0, digest_len).attach(kj::mv(digest));
}

} // namespace tollgate::gateway
