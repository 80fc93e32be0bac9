#include "startup_orchestrator.h"

#include <kj/debug.h>
#include <tollgate/core/error.h>

namespace tollgate::gateway {

using core::kv;

kj::StringPtr KJ_STRINGIFY(StartupState state) {
  switch (state) {
  case StartupState::Init:
    return "Init"_kj;
  case StartupState::BuildInfoResolved:
    return "BuildInfoResolved"_kj;
  case StartupState::ConfigValidated:
    return "ConfigValidated"_kj;
  case StartupState::KeyPoolReady:
    return "KeyPoolReady"_kj;
  case StartupState::AuthStoreReady:
    return "AuthStoreReady"_kj;
  case StartupState::PromptLogRunning:
    return "PromptLogRunning"_kj;
  case StartupState::QueueRunning:
    return "QueueRunning"_kj;
  case StartupState::Listening:
    return "Listening"_kj;
  case StartupState::FailedStartup:
    return "FailedStartup"_kj;
  }
  KJ_UNREACHABLE;
}

StartupOrchestrator::StartupOrchestrator(const GatewayConfig& config,
                                         BuildInfoResolver& resolver, Subsystems subsystems,
                                         CrashContainment& crash, kj::Timer& timer,
                                         core::Logger& logger)
    : config_(config), resolver_(resolver), subsystems_(subsystems), crash_(crash),
      timer_(timer), logger_(logger) {
  history_.add(state_);
}

const BuildInfo& StartupOrchestrator::buildInfo() const {
  KJ_IF_SOME(info, buildInfo_) {
    return info;
  }
  KJ_FAIL_REQUIRE("build info requested before it was resolved", state_);
}

void StartupOrchestrator::advance(StartupState next) {
  KJ_LOG(DBG, "startup state", state_, next);
  state_ = next;
  history_.add(next);
}

kj::Promise<void> StartupOrchestrator::run(BindListener bind) {
  KJ_REQUIRE(state_ == StartupState::Init, "startup already ran", state_);

  kj::Maybe<kj::Exception> failure;
  try {
    co_await runSteps(bind);
  } catch (...) {
    failure = kj::getCaughtExceptionAsKj();
  }

  KJ_IF_SOME(error, failure) {
    auto failedAt = state_;
    advance(StartupState::FailedStartup);
    logger_.error("Failed to start server.", {kv("lastState", kj::str(failedAt)),
                                              kv("error", error.getDescription())});
    kj::throwFatalException(kj::mv(error));
  }
}

kj::Promise<void> StartupOrchestrator::runSteps(BindListener& bind) {
  logger_.info("Server starting up...");

  buildInfo_ = co_await resolver_.resolve();
  advance(StartupState::BuildInfoResolved);

  logger_.info("Checking configs and external dependencies...");
  config_.validate();
  config_.logWarnings(logger_);
  advance(StartupState::ConfigValidated);

  subsystems_.keyPool.init();
  advance(StartupState::KeyPoolReady);

  if (config_.gatekeeper == GatekeeperMode::UserToken) {
    co_await subsystems_.userStore.init();
    advance(StartupState::AuthStoreReady);
  }

  if (config_.prompt_logging) {
    logger_.info("Starting prompt logging...");
    subsystems_.promptLog.start(crash_.tasks());
    advance(StartupState::PromptLogRunning);
  }

  if (config_.queue_mode != QueueMode::None) {
    logger_.info("Starting request queue...");
    subsystems_.requestQueue.start(crash_.tasks(), timer_);
    advance(StartupState::QueueRunning);
  }

  kj::uint port = co_await bind();
  boundPort_ = port;
  advance(StartupState::Listening);
  logger_.info("Now listening for connections.", {kv("port", port)});

  crash_.install();
  logger_.info("Startup complete.", {kv("build", buildInfo().text())});
}

} // namespace tollgate::gateway
