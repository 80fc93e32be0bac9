#pragma once

#include "middleware.h"

#include <cstddef>

namespace tollgate::gateway {

/**
 * Reads and parses JSON and form-encoded request bodies.
 *
 * Bodies are bounded: a declared or actual size above the limit fails the request
 * with 413 before any route sees it. Malformed JSON fails with 400. Other content
 * types are left unread for the route to consume.
 */
class BodyParserMiddleware final : public Middleware {
public:
  static constexpr size_t kDefaultLimit = 10 * 1024 * 1024;

  explicit BodyParserMiddleware(size_t limit = kDefaultLimit) : limit_(limit) {}

  [[nodiscard]] kj::StringPtr name() const override {
    return "body-parser"_kj;
  }

  kj::Promise<FilterOutcome> process(RequestContext& ctx) override;

  /**
   * Parse an application/x-www-form-urlencoded payload.
   * @throws kj::Exception with status 400 on invalid percent-encoding
   */
  static FormBody parseForm(kj::ArrayPtr<const char> text);

  /**
   * Parse a JSON payload. Only objects and arrays are accepted at the top level;
   * an empty payload is treated as {}.
   * @throws kj::Exception with status 400 on malformed JSON
   */
  static core::JsonDocument parseJson(kj::ArrayPtr<const char> text);

private:
  kj::Promise<kj::Array<char>> readBounded(kj::AsyncInputStream& input);

  size_t limit_;
};

} // namespace tollgate::gateway
