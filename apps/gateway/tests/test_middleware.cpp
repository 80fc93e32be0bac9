#include "middleware/cors_middleware.h"
#include "middleware/health_check_middleware.h"
#include "middleware/origin_check_middleware.h"
#include "test_common.h"

#include <kj/test.h>
#include <tollgate/core/json.h>

namespace tollgate::gateway {
namespace {

using testing::CapturedLog;
using testing::RequestFixture;
using testing::TestIo;

// ============================================================================
// Health check
// ============================================================================

KJ_TEST("HealthCheckMiddleware: GET and HEAD /health short-circuit with an empty 200") {
  TestIo t;
  HealthCheckMiddleware health;

  for (auto method : {kj::HttpMethod::GET, kj::HttpMethod::HEAD}) {
    RequestFixture req(t.headerTable, method, "/health"_kj);
    auto outcome = health.process(req.ctx).wait(t.waitScope);
    KJ_ASSERT(outcome.is<ShortCircuit>());
    KJ_EXPECT(outcome.get<ShortCircuit>().status == 200);
    KJ_EXPECT(outcome.get<ShortCircuit>().body.size() == 0);
  }
}

KJ_TEST("HealthCheckMiddleware: other paths and methods pass") {
  TestIo t;
  HealthCheckMiddleware health;

  RequestFixture post(t.headerTable, kj::HttpMethod::POST, "/health"_kj);
  KJ_EXPECT(health.process(post.ctx).wait(t.waitScope).is<Continue>());

  RequestFixture nested(t.headerTable, kj::HttpMethod::GET, "/health/deep"_kj);
  KJ_EXPECT(health.process(nested.ctx).wait(t.waitScope).is<Continue>());

  RequestFixture query(t.headerTable, kj::HttpMethod::GET, "/health?verbose=1"_kj);
  KJ_EXPECT(health.process(query.ctx).wait(t.waitScope).is<ShortCircuit>());
}

// ============================================================================
// CORS
// ============================================================================

KJ_TEST("CorsMiddleware: permissive defaults") {
  auto config = CorsMiddleware::Config::permissive();
  KJ_EXPECT(config.allowedOrigin == "*");
  KJ_EXPECT(kj::strArray(config.allowedMethods, ",") == "GET,HEAD,PUT,PATCH,POST,DELETE");
  KJ_EXPECT(config.allowedHeaders.size() == 0);
  KJ_EXPECT(!config.allowCredentials);
}

KJ_TEST("CorsMiddleware: simple requests get the allow-origin header") {
  TestIo t;
  CorsMiddleware cors(CorsMiddleware::Config::permissive());
  RequestFixture req(t.headerTable, kj::HttpMethod::GET, "/"_kj);
  req.header("Origin"_kj, "https://client.example"_kj);

  auto outcome = cors.process(req.ctx).wait(t.waitScope);
  KJ_EXPECT(outcome.is<Continue>());

  req.ctx.sendJson(200, "{}"_kj).wait(t.waitScope);
  KJ_EXPECT(req.response.header("Access-Control-Allow-Origin"_kj).orDefault(""_kj) == "*");
  KJ_EXPECT(req.response.header("Access-Control-Allow-Methods"_kj) == kj::none);
}

KJ_TEST("CorsMiddleware: preflight answers 204 and reflects requested headers") {
  TestIo t;
  CorsMiddleware cors(CorsMiddleware::Config::permissive());
  RequestFixture req(t.headerTable, kj::HttpMethod::OPTIONS, "/proxy/openai/v1/chat"_kj);
  req.header("Origin"_kj, "https://client.example"_kj)
      .header("Access-Control-Request-Method"_kj, "POST"_kj)
      .header("Access-Control-Request-Headers"_kj, "content-type,x-api-key"_kj);

  auto outcome = cors.process(req.ctx).wait(t.waitScope);
  KJ_ASSERT(outcome.is<ShortCircuit>());
  KJ_EXPECT(outcome.get<ShortCircuit>().status == 204);

  req.ctx.sendEmpty(204).wait(t.waitScope);
  KJ_EXPECT(req.response.statusCode == 204);
  KJ_EXPECT(req.response.header("Access-Control-Allow-Methods"_kj).orDefault(""_kj) ==
            "GET,HEAD,PUT,PATCH,POST,DELETE");
  KJ_EXPECT(req.response.header("Access-Control-Allow-Headers"_kj).orDefault(""_kj) ==
            "content-type,x-api-key");
  KJ_EXPECT(req.response.header("Vary"_kj).orDefault(""_kj) == "Access-Control-Request-Headers");
}

KJ_TEST("CorsMiddleware: OPTIONS without a requested method is still answered with 204") {
  TestIo t;
  CorsMiddleware cors(CorsMiddleware::Config::permissive());
  RequestFixture req(t.headerTable, kj::HttpMethod::OPTIONS, "/"_kj);

  auto outcome = cors.process(req.ctx).wait(t.waitScope);
  KJ_ASSERT(outcome.is<ShortCircuit>());
  KJ_EXPECT(outcome.get<ShortCircuit>().status == 204);
  KJ_EXPECT(outcome.get<ShortCircuit>().body == "");
}

KJ_TEST("CorsMiddleware: other methods pass through with the origin header queued") {
  TestIo t;
  CorsMiddleware cors(CorsMiddleware::Config::permissive());
  RequestFixture req(t.headerTable, kj::HttpMethod::POST, "/proxy/openai/v1/chat"_kj);
  req.header("Access-Control-Request-Method"_kj, "POST"_kj);

  KJ_EXPECT(cors.process(req.ctx).wait(t.waitScope).is<Continue>());
  req.ctx.sendEmpty(200).wait(t.waitScope);
  KJ_EXPECT(req.response.header("Access-Control-Allow-Origin"_kj).orDefault(""_kj) == "*");
  KJ_EXPECT(req.response.header("Access-Control-Allow-Methods"_kj) == kj::none);
}

// ============================================================================
// Origin check
// ============================================================================

OriginCheckMiddleware::Config blocking(std::initializer_list<kj::StringPtr> origins) {
  OriginCheckMiddleware::Config config;
  for (auto origin : origins) {
    config.blockedOrigins.add(kj::str(origin));
  }
  config.message = kj::str("Not from here.");
  return config;
}

KJ_TEST("OriginCheckMiddleware: blocked Origin gets a 403 JSON body") {
  TestIo t;
  CapturedLog log;
  OriginCheckMiddleware check(blocking({"bad.example"_kj}), log.logger);
  RequestFixture req(t.headerTable, kj::HttpMethod::POST, "/proxy/openai/v1/chat"_kj);
  req.header("Origin"_kj, "https://www.bad.example"_kj);
  req.ctx.peerAddress = kj::str("203.0.113.9");
  req.ctx.clientIP = kj::str("198.51.100.77");

  auto outcome = check.process(req.ctx).wait(t.waitScope);
  KJ_ASSERT(outcome.is<ShortCircuit>());
  auto& reply = outcome.get<ShortCircuit>();
  KJ_EXPECT(reply.status == 403);

  auto doc = core::JsonDocument::parse(reply.body.asPtr());
  KJ_EXPECT(doc.root()["error"]["type"].get_string() == "blocked_origin");
  KJ_EXPECT(doc.root()["error"]["message"].get_string() == "Not from here.");

  KJ_IF_SOME(entry, log.find("Blocked request from origin"_kj)) {
    KJ_EXPECT(entry.level == core::LogLevel::Warn);
    KJ_EXPECT(entry.field("ip"_kj).orDefault(""_kj) == "203.0.113.9");
  } else {
    KJ_FAIL_EXPECT("blocked request was not logged");
  }
}

KJ_TEST("OriginCheckMiddleware: Referer is checked when Origin is clean") {
  TestIo t;
  CapturedLog log;
  OriginCheckMiddleware check(blocking({"bad.example"_kj, "other.example"_kj}), log.logger);
  RequestFixture req(t.headerTable, kj::HttpMethod::GET, "/"_kj);
  req.header("Origin"_kj, "https://good.example"_kj)
      .header("Referer"_kj, "https://other.example/page"_kj);

  auto outcome = check.process(req.ctx).wait(t.waitScope);
  KJ_EXPECT(outcome.is<ShortCircuit>());
  KJ_EXPECT(check.matchBlocked("https://other.example/page"_kj).orDefault(""_kj) ==
            "other.example");
}

KJ_TEST("OriginCheckMiddleware: unrelated and missing origins pass") {
  TestIo t;
  CapturedLog log;
  OriginCheckMiddleware check(blocking({"bad.example"_kj}), log.logger);

  RequestFixture clean(t.headerTable, kj::HttpMethod::GET, "/"_kj);
  clean.header("Origin"_kj, "https://good.example"_kj);
  KJ_EXPECT(check.process(clean.ctx).wait(t.waitScope).is<Continue>());

  RequestFixture bare(t.headerTable, kj::HttpMethod::GET, "/"_kj);
  KJ_EXPECT(check.process(bare.ctx).wait(t.waitScope).is<Continue>());
  KJ_EXPECT(log.entries.size() == 0);
}

} // namespace
} // namespace tollgate::gateway
