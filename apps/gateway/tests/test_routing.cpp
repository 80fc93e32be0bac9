#include "fault_boundary.h"
#include "route_dispatcher.h"
#include "router.h"
#include "test_common.h"

#include <kj/test.h>
#include <tollgate/core/error.h>
#include <tollgate/core/json.h>

namespace tollgate::gateway {
namespace {

using testing::CapturedLog;
using testing::RequestFixture;
using testing::TestIo;

// ============================================================================
// Router
// ============================================================================

KJ_TEST("Router: exact path matching") {
  Router router;
  router.add_route(kj::HttpMethod::GET, "/users", [](RequestContext&) { return kj::READY_NOW; });
  KJ_EXPECT(router.route_count() == 1);

  KJ_EXPECT(router.match(kj::HttpMethod::GET, "/users") != kj::none);
  KJ_EXPECT(router.match(kj::HttpMethod::GET, "/users/123") == kj::none);
  KJ_EXPECT(router.match(kj::HttpMethod::POST, "/users") == kj::none);
}

KJ_TEST("Router: parameter extraction") {
  Router router;
  router.add_route(kj::HttpMethod::GET, "/{provider}/v1/models",
                   [](RequestContext&) { return kj::READY_NOW; });

  KJ_IF_SOME(match, router.match(kj::HttpMethod::GET, "/anthropic/v1/models")) {
    KJ_IF_SOME(provider, match.params.find("provider"_kj)) {
      KJ_EXPECT(provider == "anthropic");
    } else {
      KJ_FAIL_EXPECT("provider parameter missing");
    }
  } else {
    KJ_FAIL_EXPECT("expected a match");
  }

  KJ_EXPECT(router.match(kj::HttpMethod::GET, "//v1/models") == kj::none);
}

KJ_TEST("Router: literal routes registered first win over parameters") {
  Router router;
  int hit = 0;
  router.add_route(kj::HttpMethod::GET, "/kobold/api/v1/model", [&hit](RequestContext&) {
    hit = 1;
    return kj::READY_NOW;
  });
  router.add_route(kj::HttpMethod::GET, "/{provider}/api/v1/model", [&hit](RequestContext&) {
    hit = 2;
    return kj::READY_NOW;
  });

  TestIo t;
  RequestFixture req(t.headerTable, kj::HttpMethod::GET, "/kobold/api/v1/model"_kj);
  KJ_IF_SOME(match, router.match(kj::HttpMethod::GET, "/kobold/api/v1/model")) {
    match.handler(req.ctx).wait(t.waitScope);
  }
  KJ_EXPECT(hit == 1);
}

KJ_TEST("Router: root path and normalization") {
  Router router;
  router.add_route(kj::HttpMethod::GET, "/", [](RequestContext&) { return kj::READY_NOW; });
  router.add_route(kj::HttpMethod::POST, "/users", [](RequestContext&) { return kj::READY_NOW; });

  KJ_EXPECT(router.match(kj::HttpMethod::GET, "/") != kj::none);
  KJ_EXPECT(router.match(kj::HttpMethod::GET, "") != kj::none);
  KJ_EXPECT(router.match(kj::HttpMethod::POST, "/users/") != kj::none);
  KJ_EXPECT(router.match(kj::HttpMethod::GET, "/other") == kj::none);
}

KJ_TEST("Router: segment counts must agree") {
  Router router;
  router.add_route(kj::HttpMethod::GET, "/{provider}", [](RequestContext&) { return kj::READY_NOW; });

  KJ_EXPECT(router.match(kj::HttpMethod::GET, "/openai") != kj::none);
  KJ_EXPECT(router.match(kj::HttpMethod::GET, "/openai/") != kj::none);
  KJ_EXPECT(router.match(kj::HttpMethod::GET, "/") == kj::none);
  KJ_EXPECT(router.match(kj::HttpMethod::GET, "/openai/v1") == kj::none);
}

KJ_TEST("Router: HEAD falls back to GET routes") {
  Router router;
  int hit = 0;
  router.add_route(kj::HttpMethod::GET, "/{provider}/v1/models", [&hit](RequestContext&) {
    hit = 1;
    return kj::READY_NOW;
  });
  router.add_route(kj::HttpMethod::GET, "/status", [&hit](RequestContext&) {
    hit = 2;
    return kj::READY_NOW;
  });
  router.add_route(kj::HttpMethod::HEAD, "/status", [&hit](RequestContext&) {
    hit = 3;
    return kj::READY_NOW;
  });
  router.add_route(kj::HttpMethod::POST, "/users", [](RequestContext&) { return kj::READY_NOW; });

  TestIo t;
  RequestFixture req(t.headerTable, kj::HttpMethod::HEAD, "/openai/v1/models"_kj);
  KJ_IF_SOME(match, router.match(kj::HttpMethod::HEAD, "/openai/v1/models")) {
    KJ_EXPECT(KJ_ASSERT_NONNULL(match.params.find("provider"_kj)) == "openai");
    match.handler(req.ctx).wait(t.waitScope);
  } else {
    KJ_FAIL_EXPECT("HEAD did not reach the GET route");
  }
  KJ_EXPECT(hit == 1);

  // An explicit HEAD route wins even when the GET route was registered first
  KJ_IF_SOME(match, router.match(kj::HttpMethod::HEAD, "/status")) {
    match.handler(req.ctx).wait(t.waitScope);
  }
  KJ_EXPECT(hit == 3);

  KJ_EXPECT(router.match(kj::HttpMethod::HEAD, "/users") == kj::none);
  KJ_EXPECT(router.match(kj::HttpMethod::POST, "/status") == kj::none);
}

KJ_TEST("Router: invalid patterns are rejected") {
  Router router;
  KJ_EXPECT_THROW_MESSAGE("Pattern must start with '/'",
                          router.add_route(kj::HttpMethod::GET, "users",
                                           [](RequestContext&) { return kj::READY_NOW; }));
  KJ_EXPECT_THROW_MESSAGE("Parameter name cannot be empty",
                          router.add_route(kj::HttpMethod::GET, "/{}",
                                           [](RequestContext&) { return kj::READY_NOW; }));
}

// ============================================================================
// RouteDispatcher
// ============================================================================

/**
 * Route group answering with its own name and the path it saw.
 */
class EchoGroup final : public RouteGroup {
public:
  explicit EchoGroup(kj::StringPtr label) : label_(label) {}

  void registerRoutes(Router& router) override {
    router.add_route(kj::HttpMethod::GET, "/", [this](RequestContext& ctx) {
      return ctx.sendJson(200, kj::str("{\"group\":\"", label_, "\",\"route\":\"root\"}"));
    });
    router.add_route(kj::HttpMethod::GET, "/items/{id}", [this](RequestContext& ctx) {
      auto id = ctx.getPathParam("id"_kj).orDefault(""_kj);
      return ctx.sendJson(200, kj::str("{\"group\":\"", label_, "\",\"id\":\"", id, "\"}"));
    });
  }

private:
  kj::StringPtr label_;
};

KJ_TEST("RouteDispatcher: longest prefix wins and groups see relative paths") {
  TestIo t;
  EchoGroup root("root"_kj);
  EchoGroup admin("admin"_kj);
  EchoGroup proxy("proxy"_kj);

  RouteDispatcher dispatcher;
  dispatcher.mount(""_kj, root);
  dispatcher.mount("/admin"_kj, admin);
  dispatcher.mount("/proxy"_kj, proxy);
  dispatcher.seal();
  KJ_EXPECT(dispatcher.mountCount() == 3);

  struct Case {
    kj::StringPtr url;
    kj::StringPtr body;
  };
  Case cases[] = {
      {"/"_kj, R"({"group":"root","route":"root"})"_kj},
      {"/admin"_kj, R"({"group":"admin","route":"root"})"_kj},
      {"/admin/items/7"_kj, R"({"group":"admin","id":"7"})"_kj},
      {"/proxy/items/abc?x=1"_kj, R"({"group":"proxy","id":"abc"})"_kj},
      {"/items/3"_kj, R"({"group":"root","id":"3"})"_kj},
  };

  for (auto& c : cases) {
    RequestFixture req(t.headerTable, kj::HttpMethod::GET, c.url);
    bool routed = dispatcher.dispatch(req.ctx).wait(t.waitScope);
    KJ_EXPECT(routed, c.url);
    KJ_EXPECT(req.response.body == c.body, c.url, req.response.body);
  }
}

KJ_TEST("RouteDispatcher: prefix must match a whole segment") {
  TestIo t;
  EchoGroup admin("admin"_kj);
  RouteDispatcher dispatcher;
  dispatcher.mount("/admin"_kj, admin);

  RequestFixture req(t.headerTable, kj::HttpMethod::GET, "/administrator"_kj);
  KJ_EXPECT(!dispatcher.dispatch(req.ctx).wait(t.waitScope));
  KJ_EXPECT(!req.recorder.sent());

  RequestFixture post(t.headerTable, kj::HttpMethod::POST, "/admin"_kj);
  KJ_EXPECT(!dispatcher.dispatch(post.ctx).wait(t.waitScope));
}

KJ_TEST("RouteDispatcher: mounting is frozen once sealed") {
  EchoGroup a("a"_kj);
  EchoGroup b("b"_kj);
  RouteDispatcher dispatcher;
  dispatcher.mount("/a"_kj, a);
  KJ_EXPECT_THROW_MESSAGE("prefix already mounted", dispatcher.mount("/a"_kj, b));
  KJ_EXPECT_THROW_MESSAGE("mount prefix must be empty", dispatcher.mount("/b/"_kj, b));

  dispatcher.seal();
  KJ_EXPECT(dispatcher.isSealed());
  KJ_EXPECT_THROW_MESSAGE("routes are frozen", dispatcher.mount("/b"_kj, b));
}

// ============================================================================
// FaultBoundary
// ============================================================================

KJ_TEST("FaultBoundary: explicit status errors answer with their message") {
  TestIo t;
  CapturedLog log;
  FaultBoundary faults(log.logger);
  RequestFixture req(t.headerTable, kj::HttpMethod::POST, "/"_kj);

  auto error = core::http_error(413, "request entity too large"_kj);
  KJ_EXPECT(!FaultBoundary::isInternal(error));
  faults.handleError(req.ctx, kj::mv(error)).wait(t.waitScope);

  KJ_EXPECT(req.response.statusCode == 413);
  KJ_EXPECT(req.response.body == R"({"error":"request entity too large"})");
  KJ_EXPECT(log.entries.size() == 0);
}

KJ_TEST("FaultBoundary: internal errors become proxy_error 500s") {
  TestIo t;
  CapturedLog log;
  FaultBoundary faults(log.logger);
  RequestFixture req(t.headerTable, kj::HttpMethod::POST, "/proxy/openai/v1/chat"_kj);
  req.header("Authorization"_kj, "Bearer sk-secret"_kj);

  auto error = KJ_EXCEPTION(FAILED, "upstream socket closed");
  KJ_EXPECT(FaultBoundary::isInternal(error));
  faults.handleError(req.ctx, kj::mv(error)).wait(t.waitScope);

  KJ_EXPECT(req.response.statusCode == 500);
  auto doc = core::JsonDocument::parse(req.response.body.asPtr());
  auto body = doc.root()["error"];
  KJ_EXPECT(body["type"].get_string() == "proxy_error");
  KJ_EXPECT(body["message"].get_string().find("upstream socket closed"_kj) != kj::none);
  KJ_EXPECT(body["stack"].is_string());
  KJ_EXPECT(body["proxy_note"].get_string() == FaultBoundary::kProxyNote);

  KJ_IF_SOME(entry, log.find("Unhandled error in request"_kj)) {
    KJ_EXPECT(entry.level == core::LogLevel::Error);
  } else {
    KJ_FAIL_EXPECT("internal error was not logged");
  }
  KJ_EXPECT(!log.anyContains("sk-secret"_kj));
}

KJ_TEST("FaultBoundary: errors after the response started are logged and rethrown") {
  TestIo t;
  CapturedLog log;
  FaultBoundary faults(log.logger);
  RequestFixture req(t.headerTable, kj::HttpMethod::GET, "/"_kj);

  req.ctx.sendJson(200, "{}"_kj).wait(t.waitScope);
  KJ_EXPECT_THROW_MESSAGE("late failure",
                          faults.handleError(req.ctx, KJ_EXCEPTION(FAILED, "late failure"))
                              .wait(t.waitScope));

  KJ_EXPECT(req.response.statusCode == 200);
  KJ_EXPECT(req.response.body == "{}");
  KJ_EXPECT(log.find("Error after response was sent"_kj) != kj::none);
}

KJ_TEST("FaultBoundary: not found") {
  TestIo t;
  CapturedLog log;
  FaultBoundary faults(log.logger);
  RequestFixture req(t.headerTable, kj::HttpMethod::DELETE, "/nowhere"_kj);

  faults.notFound(req.ctx).wait(t.waitScope);
  KJ_EXPECT(req.response.statusCode == 404);
  KJ_EXPECT(req.response.body == R"({"error":"Not found"})");
}

} // namespace
} // namespace tollgate::gateway
