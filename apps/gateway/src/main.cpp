/**
 * @file main.cpp
 * @brief Entry point for the Tollgate gateway
 *
 * Components are constructed up front; StartupOrchestrator then brings them up in
 * order and binds the listener last. Configuration is read from TOLLGATE_*
 * environment variables (see gateway_config.h).
 *
 * Exit status is 1 when startup fails, 0 after a signal-driven shutdown.
 */

#include "build_info.h"
#include "crash_containment.h"
#include "fault_boundary.h"
#include "filter_chain.h"
#include "gateway_config.h"
#include "gateway_server.h"
#include "handlers/admin_handler.h"
#include "handlers/info_page_handler.h"
#include "handlers/proxy_handler.h"
#include "middleware/body_parser_middleware.h"
#include "middleware/context_init_middleware.h"
#include "middleware/cors_middleware.h"
#include "middleware/health_check_middleware.h"
#include "middleware/origin_check_middleware.h"
#include "middleware/request_log_middleware.h"
#include "process/subprocess.h"
#include "route_dispatcher.h"
#include "services/key_pool.h"
#include "services/prompt_log_writer.h"
#include "services/request_queue.h"
#include "services/user_store.h"
#include "startup_orchestrator.h"

#include <atomic>
#include <csignal>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<int> g_shutdown_signal{0};

void signal_handler(int signal) {
  // Only async-signal-safe operations here
  g_shutdown_signal.store(signal, std::memory_order_release);
  g_shutdown_requested.store(true, std::memory_order_release);
}

kj::Vector<KeyPool::ProviderKeys> providerKeys(const GatewayConfig& config) {
  kj::Vector<KeyPool::ProviderKeys> keys;
  keys.add(KeyPool::ProviderKeys{kj::str("openai"), kj::str(config.openai_key)});
  keys.add(KeyPool::ProviderKeys{kj::str("anthropic"), kj::str(config.anthropic_key)});
  return keys;
}

OriginCheckMiddleware::Config originConfig(const GatewayConfig& config) {
  OriginCheckMiddleware::Config result;
  for (auto& origin : config.blocked_origins) {
    result.blockedOrigins.add(kj::str(origin));
  }
  result.message = kj::str(config.block_message);
  return result;
}

} // namespace

/**
 * @brief Owns every gateway component for the lifetime of the process
 *
 * Members are declared in dependency order so that destruction runs in reverse:
 * the listener and HTTP server go first, the services their tasks use last.
 */
class GatewayApp {
public:
  GatewayApp(const GatewayConfig& config, kj::AsyncIoContext& io, core::Logger& logger)
      : config_(config), io_(io), logger_(logger), faults_(logger), chain_(logger),
        keyPool_(providerKeys(config)), userStore_(kj::systemPreciseCalendarClock()),
        promptLog_(io.provider->getTimer(), config.prompt_log_path,
                   config.prompt_log_flush_ms * kj::MILLISECONDS, logger),
        requestQueue_(config.queue_mode, config.queue_concurrency, logger), crash_(logger),
        runner_(*io.lowLevelProvider, io.unixEventPort, io.provider->getTimer(),
                config.git_command_timeout),
        resolver_(HostingEnv::fromProcess(), runner_, logger),
        orchestrator_(config, resolver_,
                      StartupOrchestrator::Subsystems{keyPool_, userStore_, promptLog_,
                                                      requestQueue_},
                      crash_, io.provider->getTimer(), logger) {
    auto& timer = io.provider->getTimer();
    chain_.add(kj::heap<ContextInitMiddleware>(kj::systemPreciseCalendarClock(), timer));
    chain_.add(kj::heap<RequestLogMiddleware>(logger, timer));
    chain_.add(kj::heap<HealthCheckMiddleware>());
    chain_.add(kj::heap<CorsMiddleware>(CorsMiddleware::Config::permissive()));
    chain_.add(kj::heap<BodyParserMiddleware>(GatewayConfig::kDefaultBodyLimit));
    chain_.add(kj::heap<OriginCheckMiddleware>(originConfig(config), logger));
  }

  KJ_DISALLOW_COPY_AND_MOVE(GatewayApp);

  kj::Promise<void> start() {
    return orchestrator_.run([this]() { return bind(); });
  }

  kj::Promise<void> waitForShutdown() {
    while (!g_shutdown_requested.load(std::memory_order_acquire)) {
      co_await io_.provider->getTimer().afterDelay(100 * kj::MILLISECONDS);
    }
    logger_.info("Shutdown signal received",
                 {core::kv("signal", g_shutdown_signal.load(std::memory_order_acquire))});
  }

  void shutdown() {
    // Stop accepting connections, then flush what is still buffered
    listenTask_ = kj::none;
    listener_ = kj::none;
    if (promptLog_.isRunning()) {
      promptLog_.flush();
    }
    logger_.flush();
  }

private:
  kj::Promise<kj::uint> bind() {
    auto& timer = io_.provider->getTimer();

    auto infoPage = kj::heap<InfoPageHandler>(orchestrator_.buildInfo(), config_, keyPool_,
                                              requestQueue_, userStore_, timer);
    auto admin = kj::heap<AdminHandler>(config_, userStore_);
    auto proxy =
        kj::heap<ProxyHandler>(config_, keyPool_, userStore_, requestQueue_, promptLog_);

    dispatcher_.mount(""_kj, *infoPage);
    dispatcher_.mount("/admin"_kj, *admin);
    dispatcher_.mount("/proxy"_kj, *proxy);
    dispatcher_.seal();

    auto server =
        kj::heap<GatewayServer>(headerTable_, chain_, dispatcher_, faults_, config_.trust_proxy);

    kj::HttpServerSettings settings;
    settings.errorHandler = static_cast<kj::HttpServerErrorHandler&>(crash_);
    auto httpServer = kj::heap<kj::HttpServer>(
        timer, headerTable_,
        [&service = *server](kj::AsyncIoStream& connection) {
          return service.forConnection(connection);
        },
        settings);

    auto address = co_await io_.provider->getNetwork().parseAddress(config_.host, config_.port);
    auto listener = address->listen();
    kj::uint port = listener->getPort();

    listenTask_ = httpServer->listenHttp(*listener).eagerlyEvaluate(
        [this](kj::Exception&& exception) { crash_.taskFailed(kj::mv(exception)); });

    infoPage_ = kj::mv(infoPage);
    admin_ = kj::mv(admin);
    proxy_ = kj::mv(proxy);
    server_ = kj::mv(server);
    httpServer_ = kj::mv(httpServer);
    listener_ = kj::mv(listener);
    co_return port;
  }

  const GatewayConfig& config_;
  kj::AsyncIoContext& io_;
  core::Logger& logger_;

  kj::HttpHeaderTable headerTable_;
  FaultBoundary faults_;
  AccessFilterChain chain_;
  RouteDispatcher dispatcher_;

  KeyPool keyPool_;
  UserStore userStore_;
  PromptLogWriter promptLog_;
  RequestQueue requestQueue_;

  // Background tasks reference the services above
  CrashContainment crash_;

  process::SubprocessRunner runner_;
  BuildInfoResolver resolver_;
  StartupOrchestrator orchestrator_;

  kj::Maybe<kj::Own<InfoPageHandler>> infoPage_;
  kj::Maybe<kj::Own<AdminHandler>> admin_;
  kj::Maybe<kj::Own<ProxyHandler>> proxy_;
  kj::Maybe<kj::Own<GatewayServer>> server_;
  kj::Maybe<kj::Own<kj::HttpServer>> httpServer_;
  kj::Maybe<kj::Own<kj::ConnectionReceiver>> listener_;
  kj::Maybe<kj::Promise<void>> listenTask_;
};

} // namespace tollgate::gateway

int main(int argc, char** argv) {
  using namespace tollgate;
  using namespace tollgate::gateway;
  (void)argc;
  (void)argv;

  core::Logger logger;
  auto config = GatewayConfig::loadFromEnv();
  logger.set_level(config.log_level);
  if (config.log_format == LogFormat::Json) {
    logger.set_formatter(kj::heap<core::JsonFormatter>());
  }

  // Must precede setupAsyncIo(); git children are reaped through SIGCHLD
  kj::UnixEventPort::captureChildExit();

  std::signal(SIGTERM, signal_handler);
  std::signal(SIGINT, signal_handler);

  auto io = kj::setupAsyncIo();
  auto app = kj::heap<GatewayApp>(config, io, logger);

  auto started = app->start().then([]() { return true; }, [](kj::Exception&&) {
    // Already logged by the orchestrator
    return false;
  });
  if (!started.wait(io.waitScope)) {
    logger.flush();
    return 1;
  }

  auto maybeError = kj::runCatchingExceptions([&]() { app->waitForShutdown().wait(io.waitScope); });
  KJ_IF_SOME(error, maybeError) {
    logger.critical(CrashContainment::kUncaughtException,
                    {core::kv("error", error.getDescription())});
  }

  app->shutdown();
  logger.info("Gateway shutdown complete");
  return 0;
}
