#include "middleware/redaction.h"

#include "util/http_utils.h"

#include <tollgate/core/json.h>

namespace tollgate::gateway::redaction {

using core::JsonBuilder;

namespace {

constexpr kj::StringPtr kSensitiveHeaders[] = {
    "cookie"_kj,          "set-cookie"_kj,     "authorization"_kj,  "x-api-key"_kj,
    "x-forwarded-for"_kj, "x-real-ip"_kj,      "true-client-ip"_kj, "cf-connecting-ip"_kj,
};

constexpr kj::StringPtr kSensitiveBodyFields[] = {"prompt"_kj, "messages"_kj};

} // namespace

bool isSensitiveHeader(kj::StringPtr name) {
  for (auto sensitive : kSensitiveHeaders) {
    if (util::equalsIgnoreCase(name, sensitive)) {
      return true;
    }
  }
  return false;
}

bool isSensitiveBodyField(kj::StringPtr name) {
  for (auto sensitive : kSensitiveBodyFields) {
    if (name == sensitive) {
      return true;
    }
  }
  return false;
}

kj::String headersJson(const kj::HttpHeaders& headers) {
  auto builder = JsonBuilder::object();
  headers.forEach([&](kj::StringPtr name, kj::StringPtr value) {
    auto lowered = util::toLower(name);
    if (isSensitiveHeader(lowered)) {
      builder.put(lowered, kCensor);
    } else {
      builder.put(lowered, value);
    }
  });
  return builder.build();
}

kj::String bodyJson(const ParsedBody& body) {
  KJ_SWITCH_ONEOF(body) {
    KJ_CASE_ONEOF(none, NoBody) {
      (void)none;
      return kj::str("null");
    }
    KJ_CASE_ONEOF(document, core::JsonDocument) {
      auto root = document.root();
      if (!root.is_object()) {
        return root.to_json();
      }
      auto builder = JsonBuilder::object();
      root.for_each_object([&](kj::StringPtr key, const core::JsonValue& value) {
        if (isSensitiveBodyField(key)) {
          builder.put(key, kCensor);
        } else {
          builder.put(key, value);
        }
      });
      return builder.build();
    }
    KJ_CASE_ONEOF(form, FormBody) {
      auto builder = JsonBuilder::object();
      for (auto& field : form.fields) {
        builder.put(field.name, isSensitiveBodyField(field.name) ? kCensor : field.value.asPtr());
      }
      return builder.build();
    }
  }
  KJ_UNREACHABLE;
}

kj::String requestSummaryJson(const RequestContext& ctx) {
  return JsonBuilder::object()
      .put("id", static_cast<uint64_t>(ctx.requestId))
      .put("method", util::methodName(ctx.method))
      .put("url", ctx.url)
      .put_raw("headers", headersJson(ctx.headers))
      .put("remoteAddress", ctx.peerAddress.asPtr())
      .build();
}

} // namespace tollgate::gateway::redaction
