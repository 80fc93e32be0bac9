#include "tollgate/core/json.h"

#include <cstdlib>
#include <kj/debug.h>
#include <yyjson.h>

namespace tollgate::core {

namespace {

kj::StringPtr messageOf(const char* msg) {
  return msg == nullptr ? "unknown error"_kj : kj::StringPtr(msg);
}

// yyjson hands out malloc'd buffers from its writers
kj::String takeWritten(char* json, size_t len) {
  KJ_DEFER(std::free(json));
  return kj::heapString(json, len);
}

} // namespace

// ============================================================================
// JsonDocument
// ============================================================================

JsonDocument::~JsonDocument() noexcept {
  if (doc_ != nullptr) {
    yyjson_doc_free(doc_);
  }
}

JsonDocument::JsonDocument(JsonDocument&& other) noexcept : doc_(other.doc_) {
  other.doc_ = nullptr;
}

JsonDocument& JsonDocument::operator=(JsonDocument&& other) noexcept {
  auto* previous = doc_;
  doc_ = other.doc_;
  other.doc_ = nullptr;
  if (previous != nullptr && previous != doc_) {
    yyjson_doc_free(previous);
  }
  return *this;
}

JsonDocument JsonDocument::parse(kj::StringPtr text) {
  return parse_bytes(text.asArray());
}

JsonDocument JsonDocument::parse_bytes(kj::ArrayPtr<const char> bytes) {
  yyjson_read_err err;
  // Without YYJSON_READ_INSITU the input buffer is only read
  auto* doc = yyjson_read_opts(const_cast<char*>(bytes.begin()), bytes.size(), 0, nullptr, &err);
  KJ_REQUIRE(doc != nullptr, "JSON parse error", err.pos, messageOf(err.msg));
  return JsonDocument(doc);
}

JsonValue JsonDocument::root() const {
  return JsonValue(doc_ == nullptr ? nullptr : yyjson_doc_get_root(doc_));
}

// ============================================================================
// JsonValue
// ============================================================================

bool JsonValue::is_null() const {
  return yyjson_is_null(val_);
}

bool JsonValue::is_string() const {
  return yyjson_is_str(val_);
}

bool JsonValue::is_array() const {
  return yyjson_is_arr(val_);
}

bool JsonValue::is_object() const {
  return yyjson_is_obj(val_);
}

bool JsonValue::get_bool(bool default_val) const {
  return yyjson_is_bool(val_) ? yyjson_get_bool(val_) : default_val;
}

int64_t JsonValue::get_int(int64_t default_val) const {
  if (!yyjson_is_num(val_)) {
    return default_val;
  }
  switch (yyjson_get_subtype(val_)) {
  case YYJSON_SUBTYPE_SINT:
    return yyjson_get_sint(val_);
  case YYJSON_SUBTYPE_UINT:
    return static_cast<int64_t>(yyjson_get_uint(val_));
  case YYJSON_SUBTYPE_REAL:
    return static_cast<int64_t>(yyjson_get_real(val_));
  default:
    break;
  }
  return default_val;
}

double JsonValue::get_double(double default_val) const {
  return yyjson_is_num(val_) ? yyjson_get_num(val_) : default_val;
}

kj::String JsonValue::get_string(kj::StringPtr default_val) const {
  if (!is_string()) {
    return kj::str(default_val);
  }
  return kj::heapString(yyjson_get_str(val_), yyjson_get_len(val_));
}

size_t JsonValue::size() const {
  if (is_array()) {
    return yyjson_arr_size(val_);
  }
  return is_object() ? yyjson_obj_size(val_) : 0;
}

JsonValue JsonValue::operator[](size_t index) const {
  return JsonValue(is_array() ? yyjson_arr_get(val_, index) : nullptr);
}

JsonValue JsonValue::operator[](kj::StringPtr key) const {
  return JsonValue(is_object() ? yyjson_obj_getn(val_, key.begin(), key.size()) : nullptr);
}

kj::Maybe<JsonValue> JsonValue::get(kj::StringPtr key) const {
  auto child = (*this)[key];
  if (child.val_ == nullptr) {
    return kj::none;
  }
  return child;
}

void JsonValue::for_each_object(
    kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const {
  if (!is_object()) {
    return;
  }
  size_t idx, max;
  yyjson_val *key, *val;
  yyjson_obj_foreach(val_, idx, max, key, val) {
    callback(kj::StringPtr(yyjson_get_str(key), yyjson_get_len(key)), JsonValue(val));
  }
}

kj::Vector<kj::String> JsonValue::keys() const {
  kj::Vector<kj::String> names(size());
  for_each_object([&](kj::StringPtr key, const JsonValue&) { names.add(kj::str(key)); });
  return names;
}

kj::String JsonValue::to_json() const {
  if (val_ == nullptr) {
    return kj::str("null");
  }
  size_t len = 0;
  char* json = yyjson_val_write(val_, YYJSON_WRITE_NOFLAG, &len);
  KJ_REQUIRE(json != nullptr, "failed to serialize JSON value");
  return takeWritten(json, len);
}

// ============================================================================
// JsonBuilder
// ============================================================================

struct JsonBuilder::State {
  yyjson_mut_doc* doc;
  yyjson_mut_val* root;
  // Container that put()/add() currently write into
  yyjson_mut_val* target;

  State() : doc(yyjson_mut_doc_new(nullptr)) {
    KJ_REQUIRE(doc != nullptr, "failed to allocate JSON document");
    root = target = yyjson_mut_obj(doc);
  }

  ~State() noexcept {
    yyjson_mut_doc_free(doc);
  }

  KJ_DISALLOW_COPY_AND_MOVE(State);

  bool inObject() const {
    return yyjson_mut_is_obj(target);
  }

  void insert(kj::StringPtr key, yyjson_mut_val* val) {
    KJ_REQUIRE(val != nullptr, "failed to allocate JSON value");
    if (inObject()) {
      yyjson_mut_obj_add(target, yyjson_mut_strncpy(doc, key.begin(), key.size()), val);
    } else {
      yyjson_mut_arr_append(target, val);
    }
  }

  void fillNested(yyjson_mut_val* container, kj::FunctionParam<void(JsonBuilder&)>& fill,
                  JsonBuilder& builder) {
    auto* outer = target;
    target = container;
    KJ_DEFER(target = outer);
    fill(builder);
  }
};

JsonBuilder::JsonBuilder(kj::Own<State> state) : state_(kj::mv(state)) {}

JsonBuilder::~JsonBuilder() noexcept = default;

JsonBuilder::JsonBuilder(JsonBuilder&& other) noexcept = default;

JsonBuilder JsonBuilder::object() {
  return JsonBuilder(kj::heap<State>());
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, const char* value) {
  return put(key, kj::StringPtr(value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::StringPtr value) {
  if (state_->inObject()) {
    state_->insert(key, yyjson_mut_strncpy(state_->doc, value.begin(), value.size()));
  }
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, bool value) {
  if (state_->inObject()) {
    state_->insert(key, yyjson_mut_bool(state_->doc, value));
  }
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int value) {
  return put(key, static_cast<int64_t>(value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int64_t value) {
  if (state_->inObject()) {
    state_->insert(key, yyjson_mut_sint(state_->doc, value));
  }
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, uint64_t value) {
  if (state_->inObject()) {
    state_->insert(key, yyjson_mut_uint(state_->doc, value));
  }
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, double value) {
  if (state_->inObject()) {
    state_->insert(key, yyjson_mut_real(state_->doc, value));
  }
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, std::nullptr_t) {
  if (state_->inObject()) {
    state_->insert(key, yyjson_mut_null(state_->doc));
  }
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, const JsonValue& value) {
  if (state_->inObject()) {
    state_->insert(key, value.val_ == nullptr ? yyjson_mut_null(state_->doc)
                                              : yyjson_val_mut_copy(state_->doc, value.val_));
  }
  return *this;
}

JsonBuilder& JsonBuilder::put_raw(kj::StringPtr key, kj::StringPtr json) {
  auto parsed = JsonDocument::parse(json);
  return put(key, parsed.root());
}

JsonBuilder& JsonBuilder::put_object(kj::StringPtr key,
                                     kj::FunctionParam<void(JsonBuilder&)> fill) {
  if (state_->inObject()) {
    auto* nested = yyjson_mut_obj(state_->doc);
    state_->fillNested(nested, fill, *this);
    state_->insert(key, nested);
  }
  return *this;
}

JsonBuilder& JsonBuilder::put_array(kj::StringPtr key,
                                    kj::FunctionParam<void(JsonBuilder&)> fill) {
  if (state_->inObject()) {
    auto* nested = yyjson_mut_arr(state_->doc);
    state_->fillNested(nested, fill, *this);
    state_->insert(key, nested);
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(kj::StringPtr value) {
  if (!state_->inObject()) {
    state_->insert(nullptr, yyjson_mut_strncpy(state_->doc, value.begin(), value.size()));
  }
  return *this;
}

JsonBuilder& JsonBuilder::add_object(kj::FunctionParam<void(JsonBuilder&)> fill) {
  if (!state_->inObject()) {
    auto* nested = yyjson_mut_obj(state_->doc);
    state_->fillNested(nested, fill, *this);
    state_->insert(nullptr, nested);
  }
  return *this;
}

kj::String JsonBuilder::build() const {
  yyjson_mut_doc_set_root(state_->doc, state_->root);
  size_t len = 0;
  yyjson_write_err err;
  char* json = yyjson_mut_write_opts(state_->doc, YYJSON_WRITE_NOFLAG, nullptr, &len, &err);
  KJ_REQUIRE(json != nullptr, "JSON write error", messageOf(err.msg));
  return takeWritten(json, len);
}

} // namespace tollgate::core
