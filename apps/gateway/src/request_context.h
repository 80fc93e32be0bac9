#pragma once

#include <cstdint>
#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/map.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>
#include <tollgate/core/json.h>

namespace tollgate::gateway {

/**
 * Response wrapper that remembers what was sent.
 *
 * Stages may queue extra headers (e.g. CORS) that are merged into whatever response
 * is eventually sent. The status is kept for request logging.
 */
class ResponseRecorder final : public kj::HttpService::Response {
public:
  explicit ResponseRecorder(kj::HttpService::Response& inner) : inner_(inner) {}

  kj::Own<kj::AsyncOutputStream> send(kj::uint statusCode, kj::StringPtr statusText,
                                      const kj::HttpHeaders& headers,
                                      kj::Maybe<uint64_t> expectedBodySize = kj::none) override;
  kj::Own<kj::WebSocket> acceptWebSocket(const kj::HttpHeaders& headers) override;

  /**
   * Queue a header for the eventual response. Must be called before send().
   */
  void addHeader(kj::StringPtr name, kj::StringPtr value);

  [[nodiscard]] bool sent() const {
    return status_ != kj::none;
  }
  [[nodiscard]] kj::Maybe<kj::uint> status() const {
    return status_;
  }
  [[nodiscard]] kj::Maybe<kj::StringPtr> sentHeader(kj::StringPtr name) const;

private:
  struct ExtraHeader {
    kj::String name;
    kj::String value;
  };

  kj::HttpService::Response& inner_;
  kj::Vector<ExtraHeader> extraHeaders_;
  kj::Vector<ExtraHeader> sentHeaders_;
  kj::Maybe<kj::uint> status_;
};

/**
 * Bookkeeping attached to every request when it enters the gateway.
 *
 * The queue uses the arrival time to order work. retryCount is carried into prompt
 * log records.
 */
struct RequestBookkeeping {
  kj::Date arrivalTimestamp;
  kj::TimePoint arrivalMonotonic;
  uint32_t retryCount = 0;
};

struct NoBody {};

struct FormField {
  kj::String name;
  kj::String value;
};

struct FormBody {
  kj::Vector<FormField> fields;

  [[nodiscard]] kj::Maybe<kj::StringPtr> get(kj::StringPtr name) const;
};

using ParsedBody = kj::OneOf<NoBody, core::JsonDocument, FormBody>;

/**
 * Per-request context containing request data and response helpers.
 *
 * Created by the gateway for each request and passed through every filter stage and
 * route handler. It lives exactly as long as the request's promise chain.
 */
struct RequestContext {
  RequestContext(kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
                 kj::AsyncInputStream& body, ResponseRecorder& response,
                 const kj::HttpHeaderTable& headerTable);

  // Request data
  kj::HttpMethod method;
  kj::StringPtr url;
  kj::String path;
  kj::String queryString;
  const kj::HttpHeaders& headers;
  kj::AsyncInputStream& body;

  // Response object (for sending responses)
  ResponseRecorder& response;

  // Header table reference (needed for creating response headers)
  const kj::HttpHeaderTable& headerTable;

  // Assigned by the gateway
  uint64_t requestId = 0;
  kj::String peerAddress;
  kj::String clientIP;

  // Extracted path parameters (e.g., {provider} from /proxy/{provider}/v1/models)
  kj::HashMap<kj::String, kj::String> path_params;

  // Filled by the body parsing stage
  ParsedBody parsedBody;

  // Number of filter stages that have started, maintained by AccessFilterChain
  size_t stagesEntered = 0;

  /**
   * Attach arrival bookkeeping. Calling this twice for one request is a bug.
   */
  void initBookkeeping(kj::Date arrival, kj::TimePoint monotonic);

  [[nodiscard]] bool hasBookkeeping() const {
    return bookkeeping_ != kj::none;
  }
  RequestBookkeeping& bookkeeping();
  const RequestBookkeeping& bookkeeping() const;

  // Response helpers
  kj::Promise<void> sendJson(kj::uint status, kj::StringPtr body);
  kj::Promise<void> sendError(kj::uint status, kj::StringPtr error);
  kj::Promise<void> sendEmpty(kj::uint status);
  kj::Promise<void> sendBody(kj::uint status, kj::StringPtr contentType, kj::StringPtr body);

  // Utilities
  kj::Maybe<kj::StringPtr> getHeader(kj::StringPtr name) const;
  kj::Maybe<kj::StringPtr> getPathParam(kj::StringPtr name) const;

private:
  kj::Maybe<RequestBookkeeping> bookkeeping_;
};

} // namespace tollgate::gateway
