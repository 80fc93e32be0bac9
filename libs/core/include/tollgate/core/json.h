/**
 * @file json.h
 * @brief JSON reading and writing on top of yyjson
 *
 * JsonDocument owns an immutable parsed document; JsonValue is a non-owning view into
 * it and must not outlive the document. JsonBuilder produces serialized JSON.
 */

#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

struct yyjson_doc;
struct yyjson_val;

namespace tollgate::core {

class JsonValue;

/**
 * @brief Owning wrapper for a parsed yyjson document
 */
class JsonDocument {
public:
  JsonDocument() = default;
  ~JsonDocument() noexcept;

  KJ_DISALLOW_COPY(JsonDocument);
  JsonDocument(JsonDocument&& other) noexcept;
  JsonDocument& operator=(JsonDocument&& other) noexcept;

  /**
   * @brief Parse JSON text
   * @throws kj::Exception with the parser's position and message on malformed input
   */
  static JsonDocument parse(kj::StringPtr text);

  /**
   * @brief Parse a byte range that need not be NUL-terminated (e.g. a request body)
   */
  static JsonDocument parse_bytes(kj::ArrayPtr<const char> bytes);

  [[nodiscard]] JsonValue root() const;

private:
  explicit JsonDocument(yyjson_doc* doc) : doc_(doc) {}

  yyjson_doc* doc_ = nullptr;
};

/**
 * @brief Non-owning view of a JSON value
 *
 * A missing value behaves as absent: type checks are false and getters return their
 * defaults, so lookups can be chained without checking each step.
 */
class JsonValue {
public:
  JsonValue() = default;
  explicit JsonValue(yyjson_val* val) : val_(val) {}

  [[nodiscard]] bool is_null() const;
  [[nodiscard]] bool is_string() const;
  [[nodiscard]] bool is_array() const;
  [[nodiscard]] bool is_object() const;

  [[nodiscard]] bool get_bool(bool default_val = false) const;
  [[nodiscard]] int64_t get_int(int64_t default_val = 0) const;
  [[nodiscard]] double get_double(double default_val = 0.0) const;
  [[nodiscard]] kj::String get_string(kj::StringPtr default_val = ""_kj) const;

  // Element count for arrays and objects, 0 otherwise
  [[nodiscard]] size_t size() const;

  JsonValue operator[](size_t index) const;
  JsonValue operator[](kj::StringPtr key) const;
  JsonValue operator[](const char* key) const {
    return (*this)[kj::StringPtr(key)];
  }

  [[nodiscard]] kj::Maybe<JsonValue> get(kj::StringPtr key) const;

  void for_each_object(kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const;
  [[nodiscard]] kj::Vector<kj::String> keys() const;

  /**
   * @brief Serialize this value back to compact JSON ("null" when absent)
   */
  [[nodiscard]] kj::String to_json() const;

private:
  friend class JsonBuilder;

  yyjson_val* val_ = nullptr;
};

/**
 * @brief Fluent builder for JSON objects
 *
 * ```cpp
 * auto body = JsonBuilder::object()
 *                 .put_object("error", [&](JsonBuilder& e) {
 *                   e.put("type", "proxy_error").put("message", message);
 *                 })
 *                 .build();
 * ```
 * put() applies while building an object and add() while inside put_array(); the
 * other is a no-op.
 */
class JsonBuilder {
public:
  static JsonBuilder object();

  ~JsonBuilder() noexcept;
  JsonBuilder(JsonBuilder&& other) noexcept;

  JsonBuilder& put(kj::StringPtr key, const char* value);
  JsonBuilder& put(kj::StringPtr key, kj::StringPtr value);
  JsonBuilder& put(kj::StringPtr key, bool value);
  JsonBuilder& put(kj::StringPtr key, int value);
  JsonBuilder& put(kj::StringPtr key, int64_t value);
  JsonBuilder& put(kj::StringPtr key, uint64_t value);
  JsonBuilder& put(kj::StringPtr key, double value);
  JsonBuilder& put(kj::StringPtr key, std::nullptr_t);

  // Deep copy of an existing value; absent values become null
  JsonBuilder& put(kj::StringPtr key, const JsonValue& value);

  /**
   * @brief Insert already-serialized JSON under key
   * @throws kj::Exception if json is not valid JSON
   */
  JsonBuilder& put_raw(kj::StringPtr key, kj::StringPtr json);

  JsonBuilder& put_object(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> fill);
  JsonBuilder& put_array(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> fill);

  JsonBuilder& add(kj::StringPtr value);
  JsonBuilder& add(const char* value) {
    return add(kj::StringPtr(value));
  }
  JsonBuilder& add_object(kj::FunctionParam<void(JsonBuilder&)> fill);

  [[nodiscard]] kj::String build() const;

private:
  struct State;
  explicit JsonBuilder(kj::Own<State> state);

  kj::Own<State> state_;
};

} // namespace tollgate::core
