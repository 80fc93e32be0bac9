#include "request_context.h"

#include "util/http_utils.h"

#include <kj/debug.h>

namespace tollgate::gateway {

// =============================================================================
// ResponseRecorder
// =============================================================================

kj::Own<kj::AsyncOutputStream> ResponseRecorder::send(kj::uint statusCode,
                                                      kj::StringPtr statusText,
                                                      const kj::HttpHeaders& headers,
                                                      kj::Maybe<uint64_t> expectedBodySize) {
  KJ_REQUIRE(status_ == kj::none, "response already sent");
  status_ = statusCode;

  auto merged = headers.clone();
  for (auto& header : extraHeaders_) {
    merged.addPtrPtr(header.name, header.value);
  }
  merged.forEach([&](kj::StringPtr name, kj::StringPtr value) {
    sentHeaders_.add(ExtraHeader{kj::str(name), kj::str(value)});
  });

  return inner_.send(statusCode, statusText, merged, expectedBodySize);
}

kj::Own<kj::WebSocket> ResponseRecorder::acceptWebSocket(const kj::HttpHeaders& headers) {
  KJ_REQUIRE(status_ == kj::none, "response already sent");
  status_ = 101u;
  return inner_.acceptWebSocket(headers);
}

void ResponseRecorder::addHeader(kj::StringPtr name, kj::StringPtr value) {
  KJ_REQUIRE(status_ == kj::none, "cannot add headers after the response was sent", name);
  extraHeaders_.add(ExtraHeader{kj::str(name), kj::str(value)});
}

kj::Maybe<kj::StringPtr> ResponseRecorder::sentHeader(kj::StringPtr name) const {
  for (auto& header : sentHeaders_) {
    if (util::equalsIgnoreCase(header.name, name)) {
      return header.value.asPtr();
    }
  }
  return kj::none;
}

// =============================================================================
// FormBody
// =============================================================================

kj::Maybe<kj::StringPtr> FormBody::get(kj::StringPtr name) const {
  for (auto& field : fields) {
    if (field.name == name) {
      return field.value.asPtr();
    }
  }
  return kj::none;
}

// =============================================================================
// RequestContext
// =============================================================================

RequestContext::RequestContext(kj::HttpMethod method, kj::StringPtr url,
                               const kj::HttpHeaders& headers, kj::AsyncInputStream& body,
                               ResponseRecorder& response, const kj::HttpHeaderTable& headerTable)
    : method(method), url(url), headers(headers), body(body), response(response),
      headerTable(headerTable), parsedBody(NoBody{}) {
  KJ_IF_SOME(queryPos, url.findFirst('?')) {
    path = kj::str(url.slice(0, queryPos));
    queryString = kj::str(url.slice(queryPos + 1));
  } else {
    path = kj::str(url);
    queryString = kj::str();
  }
  if (path.size() == 0) {
    path = kj::str("/");
  }
}

void RequestContext::initBookkeeping(kj::Date arrival, kj::TimePoint monotonic) {
  KJ_REQUIRE(bookkeeping_ == kj::none, "request bookkeeping already initialized", requestId);
  bookkeeping_ = RequestBookkeeping{arrival, monotonic, 0};
}

RequestBookkeeping& RequestContext::bookkeeping() {
  KJ_IF_SOME(b, bookkeeping_) {
    return b;
  }
  KJ_FAIL_REQUIRE("request bookkeeping not initialized", requestId);
}

const RequestBookkeeping& RequestContext::bookkeeping() const {
  KJ_IF_SOME(b, bookkeeping_) {
    return b;
  }
  KJ_FAIL_REQUIRE("request bookkeeping not initialized", requestId);
}

kj::Promise<void> RequestContext::sendJson(kj::uint status, kj::StringPtr body) {
  return sendBody(status, "application/json; charset=utf-8"_kj, body);
}

kj::Promise<void> RequestContext::sendError(kj::uint status, kj::StringPtr error) {
  auto body = core::JsonBuilder::object().put("error", error).build();
  co_await sendJson(status, body);
}

kj::Promise<void> RequestContext::sendEmpty(kj::uint status) {
  kj::HttpHeaders responseHeaders(headerTable);
  kj::Maybe<uint64_t> bodySize = uint64_t(0);
  if (status == 204) {
    // 204 responses carry no Content-Length
    bodySize = kj::none;
  }
  // Dropping the stream ends the (empty) body
  response.send(status, util::statusText(status), responseHeaders, bodySize);
  return kj::READY_NOW;
}

kj::Promise<void> RequestContext::sendBody(kj::uint status, kj::StringPtr contentType,
                                           kj::StringPtr body) {
  kj::HttpHeaders responseHeaders(headerTable);
  responseHeaders.setPtr(kj::HttpHeaderId::CONTENT_TYPE, contentType);

  auto owned = kj::str(body);
  auto stream = response.send(status, util::statusText(status), responseHeaders, owned.size());
  auto promise = stream->write(owned.asBytes());
  return promise.attach(kj::mv(stream), kj::mv(owned));
}

kj::Maybe<kj::StringPtr> RequestContext::getHeader(kj::StringPtr name) const {
  return util::findHeader(headers, name);
}

kj::Maybe<kj::StringPtr> RequestContext::getPathParam(kj::StringPtr name) const {
  KJ_IF_SOME(value, path_params.find(name)) {
    return value.asPtr();
  }
  return kj::none;
}

} // namespace tollgate::gateway
