#pragma once

#include "build_info.h"
#include "crash_containment.h"
#include "gateway_config.h"
#include "services/key_pool.h"
#include "services/prompt_log_writer.h"
#include "services/request_queue.h"
#include "services/user_store.h"

#include <cstdint>
#include <kj/async.h>
#include <kj/function.h>
#include <kj/timer.h>
#include <kj/vector.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

enum class StartupState : uint8_t {
  Init,
  BuildInfoResolved,
  ConfigValidated,
  KeyPoolReady,
  AuthStoreReady,
  PromptLogRunning,
  QueueRunning,
  Listening,
  FailedStartup,
};

kj::StringPtr KJ_STRINGIFY(StartupState state);

/**
 * @brief Brings the gateway up in a fixed order
 *
 * Build info, configuration validation, key pool, then the optional subsystems
 * selected by configuration, and finally the listener. Each step completes before
 * the next begins. Crash containment is installed only once the listener is bound.
 *
 * A failing step moves the orchestrator to FailedStartup and run() rejects with the
 * step's error; nothing after the failed step runs.
 */
class StartupOrchestrator {
public:
  /**
   * Binds the listener and starts serving.
   * @return The port actually bound
   */
  using BindListener = kj::Function<kj::Promise<kj::uint>()>;

  struct Subsystems {
    KeyPool& keyPool;
    UserStore& userStore;
    PromptLogWriter& promptLog;
    RequestQueue& requestQueue;
  };

  StartupOrchestrator(const GatewayConfig& config, BuildInfoResolver& resolver,
                      Subsystems subsystems, CrashContainment& crash, kj::Timer& timer,
                      core::Logger& logger);

  KJ_DISALLOW_COPY_AND_MOVE(StartupOrchestrator);

  kj::Promise<void> run(BindListener bind);

  [[nodiscard]] StartupState state() const {
    return state_;
  }
  /**
   * Every state entered so far, starting with Init.
   */
  [[nodiscard]] kj::ArrayPtr<const StartupState> history() const {
    return history_.asPtr();
  }

  /**
   * The resolved build info. Only valid once BuildInfoResolved was reached.
   */
  const BuildInfo& buildInfo() const;

  [[nodiscard]] kj::Maybe<kj::uint> boundPort() const {
    return boundPort_;
  }

private:
  kj::Promise<void> runSteps(BindListener& bind);
  void advance(StartupState next);

  const GatewayConfig& config_;
  BuildInfoResolver& resolver_;
  Subsystems subsystems_;
  CrashContainment& crash_;
  kj::Timer& timer_;
  core::Logger& logger_;

  StartupState state_ = StartupState::Init;
  kj::Vector<StartupState> history_;
  kj::Maybe<BuildInfo> buildInfo_;
  kj::Maybe<kj::uint> boundPort_;
};

} // namespace tollgate::gateway
