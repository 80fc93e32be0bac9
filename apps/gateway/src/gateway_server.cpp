#include "gateway_server.h"

#include "util/http_utils.h"

#include <kj/debug.h>
#include <kj/memory.h>

namespace tollgate::gateway {

class GatewayServer::ConnectionService final : public kj::HttpService {
public:
  ConnectionService(GatewayServer& server, kj::String peerAddress)
      : server_(server), peerAddress_(kj::mv(peerAddress)) {}

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override {
    return server_.handle(peerAddress_, method, url, headers, requestBody, response);
  }

private:
  GatewayServer& server_;
  kj::String peerAddress_;
};

GatewayServer::GatewayServer(const kj::HttpHeaderTable& headerTable, AccessFilterChain& chain,
                             RouteDispatcher& dispatcher, FaultBoundary& faults, bool trustProxy)
    : headerTable_(headerTable), chain_(chain), dispatcher_(dispatcher), faults_(faults),
      trustProxy_(trustProxy) {}

kj::Promise<void> GatewayServer::request(kj::HttpMethod method, kj::StringPtr url,
                                         const kj::HttpHeaders& headers,
                                         kj::AsyncInputStream& requestBody, Response& response) {
  return handle("unknown"_kj, method, url, headers, requestBody, response);
}

kj::Own<kj::HttpService> GatewayServer::forConnection(kj::AsyncIoStream& connection) {
  return kj::heap<ConnectionService>(*this, util::peerAddressOf(connection));
}

kj::Promise<void> GatewayServer::handle(kj::StringPtr peerAddress, kj::HttpMethod method,
                                        kj::StringPtr url, const kj::HttpHeaders& headers,
                                        kj::AsyncInputStream& requestBody, Response& response) {
  ResponseRecorder recorder(response);
  RequestContext ctx(method, url, headers, requestBody, recorder, headerTable_);
  ctx.requestId = ++requestCounter_;
  ctx.peerAddress = kj::str(peerAddress);
  ctx.clientIP = util::resolveClientIP(headers, peerAddress, trustProxy_);

  KJ_LOG(DBG, "Incoming request", util::methodName(method), url, ctx.requestId);

  kj::Maybe<kj::Exception> failure;
  // Runs on completion and on cancellation (client went away)
  KJ_DEFER(finishRequest(ctx, failure));

  try {
    co_await runPipeline(ctx);
    if (!recorder.sent()) {
      failure = KJ_EXCEPTION(FAILED, "route handler completed without sending a response",
                             ctx.path);
    }
  } catch (...) {
    failure = kj::getCaughtExceptionAsKj();
  }

  KJ_IF_SOME(error, failure) {
    co_await faults_.handleError(ctx, kj::cp(error));
  }
}

kj::Promise<void> GatewayServer::runPipeline(RequestContext& ctx) {
  auto outcome = co_await chain_.run(ctx);

  if (outcome.is<Fail>()) {
    kj::throwFatalException(kj::mv(outcome.get<Fail>().error));
  }

  if (outcome.is<ShortCircuit>()) {
    auto& reply = outcome.get<ShortCircuit>();
    if (reply.body.size() == 0) {
      co_await ctx.sendEmpty(reply.status);
    } else {
      co_await ctx.sendBody(reply.status, reply.contentType, reply.body);
    }
    co_return;
  }

  bool routed = co_await dispatcher_.dispatch(ctx);
  if (!routed) {
    co_await faults_.notFound(ctx);
  }
}

void GatewayServer::finishRequest(RequestContext& ctx, const kj::Maybe<kj::Exception>& failure) {
  kj::Maybe<const kj::Exception&> reported;
  KJ_IF_SOME(error, failure) {
    // Client errors were answered normally; only internal faults are reported as such
    if (FaultBoundary::isInternal(error)) {
      reported = error;
    }
  }
  chain_.finish(ctx, reported);
}

} // namespace tollgate::gateway
