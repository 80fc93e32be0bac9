#pragma once

#include "fault_boundary.h"
#include "filter_chain.h"
#include "route_dispatcher.h"

#include <cstdint>
#include <kj/async-io.h>
#include <kj/compat/http.h>

namespace tollgate::gateway {

/**
 * @brief HTTP service that runs every request through the gateway pipeline.
 *
 * Request flow:
 * 1. Wrap the response in a ResponseRecorder and create the RequestContext
 * 2. Run the AccessFilterChain
 * 3. Send a short-circuit reply, or dispatch to the mounted route groups
 * 4. Route errors and unmatched paths to the FaultBoundary
 * 5. Let every entered stage observe the finished request
 *
 * kj::HttpServer does not expose the peer of a connection, so the server is
 * normally installed through forConnection(), which captures the peer address once
 * per connection.
 */
class GatewayServer final : public kj::HttpService {
public:
  GatewayServer(const kj::HttpHeaderTable& headerTable, AccessFilterChain& chain,
                RouteDispatcher& dispatcher, FaultBoundary& faults, bool trustProxy);

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override;

  /**
   * @brief Service factory for kj::HttpServer
   */
  kj::Own<kj::HttpService> forConnection(kj::AsyncIoStream& connection);

  kj::Promise<void> handle(kj::StringPtr peerAddress, kj::HttpMethod method, kj::StringPtr url,
                           const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                           Response& response);

  [[nodiscard]] uint64_t requestCount() const {
    return requestCounter_;
  }

private:
  class ConnectionService;

  kj::Promise<void> runPipeline(RequestContext& ctx);
  void finishRequest(RequestContext& ctx, const kj::Maybe<kj::Exception>& failure);

  const kj::HttpHeaderTable& headerTable_;
  AccessFilterChain& chain_;
  RouteDispatcher& dispatcher_;
  FaultBoundary& faults_;
  bool trustProxy_;
  uint64_t requestCounter_ = 0;
};

} // namespace tollgate::gateway
