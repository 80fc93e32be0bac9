#include "middleware/body_parser_middleware.h"

#include "util/http_utils.h"

#include <kj/debug.h>
#include <kj/encoding.h>
#include <tollgate/core/error.h>

namespace tollgate::gateway {

namespace {

constexpr kj::StringPtr kTooLarge = "request entity too large"_kj;

enum class BodyKind { Json, Form, Other };

BodyKind classify(const RequestContext& ctx) {
  KJ_IF_SOME(contentType, ctx.getHeader("Content-Type"_kj)) {
    auto media = util::mediaType(contentType);
    if (media == "application/json") {
      return BodyKind::Json;
    }
    if (media == "application/x-www-form-urlencoded") {
      return BodyKind::Form;
    }
  }
  return BodyKind::Other;
}

kj::String decodeComponent(kj::ArrayPtr<const char> raw) {
  auto decoded = kj::decodeWwwForm(raw);
  if (decoded.hadErrors) {
    core::throw_http_error(400, "invalid form encoding"_kj);
  }
  return kj::mv(decoded);
}

bool isJsonSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

kj::Promise<FilterOutcome> BodyParserMiddleware::process(RequestContext& ctx) {
  auto kind = classify(ctx);
  if (kind == BodyKind::Other) {
    co_return FilterOutcome(Continue{});
  }

  KJ_IF_SOME(declared, ctx.body.tryGetLength()) {
    if (declared > limit_) {
      co_return FilterOutcome(Fail{core::http_error(413, kTooLarge)});
    }
  }

  auto raw = co_await readBounded(ctx.body);
  if (kind == BodyKind::Json) {
    ctx.parsedBody.init<core::JsonDocument>(parseJson(raw));
  } else {
    ctx.parsedBody.init<FormBody>(parseForm(raw));
  }
  co_return FilterOutcome(Continue{});
}

kj::Promise<kj::Array<char>> BodyParserMiddleware::readBounded(kj::AsyncInputStream& input) {
  kj::Vector<char> data;
  auto buffer = kj::heapArray<char>(16 * 1024);
  for (;;) {
    size_t n = co_await input.tryRead(buffer.begin(), 1, buffer.size());
    if (n == 0) {
      break;
    }
    if (data.size() + n > limit_) {
      core::throw_http_error(413, kTooLarge);
    }
    data.addAll(buffer.slice(0, n));
  }
  co_return data.releaseAsArray();
}

core::JsonDocument BodyParserMiddleware::parseJson(kj::ArrayPtr<const char> text) {
  size_t start = 0;
  while (start < text.size() && isJsonSpace(text[start])) {
    ++start;
  }
  if (start == text.size()) {
    return core::JsonDocument::parse("{}"_kj);
  }
  if (text[start] != '{' && text[start] != '[') {
    core::throw_http_error(400, "JSON body must be an object or array"_kj);
  }

  kj::Maybe<core::JsonDocument> parsed;
  auto failure = kj::runCatchingExceptions([&]() { parsed = core::JsonDocument::parse_bytes(text); });
  KJ_IF_SOME(exception, failure) {
    KJ_LOG(DBG, "rejected malformed JSON body", exception.getDescription());
    core::throw_http_error(400, "malformed JSON body"_kj);
  }
  KJ_IF_SOME(document, parsed) {
    return kj::mv(document);
  }
  KJ_UNREACHABLE;
}

FormBody BodyParserMiddleware::parseForm(kj::ArrayPtr<const char> text) {
  FormBody form;
  size_t start = 0;
  for (size_t i = 0; i <= text.size(); ++i) {
    if (i < text.size() && text[i] != '&') {
      continue;
    }
    auto pair = text.slice(start, i);
    start = i + 1;
    if (pair.size() == 0) {
      continue;
    }

    size_t eq = pair.size();
    for (size_t j = 0; j < pair.size(); ++j) {
      if (pair[j] == '=') {
        eq = j;
        break;
      }
    }
    auto name = decodeComponent(pair.slice(0, eq));
    auto value = eq < pair.size() ? decodeComponent(pair.slice(eq + 1, pair.size())) : kj::str();
    form.fields.add(FormField{kj::mv(name), kj::mv(value)});
  }
  return form;
}

} // namespace tollgate::gateway
