#pragma once

#include <cstdint>
#include <kj/async.h>
#include <kj/compat/http.h>
#include <kj/exception.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

/**
 * Process-wide fault supervisor.
 *
 * Owns the task set for background work (flush loops, the listener) and is the
 * HTTP server's error handler. Faults reaching it are logged and the process keeps
 * running. install() additionally hooks std::terminate so that a fault escaping
 * the event loop is at least logged before the process dies.
 */
class CrashContainment final : public kj::TaskSet::ErrorHandler,
                               public kj::HttpServerErrorHandler {
public:
  static constexpr kj::StringPtr kUncaughtException =
      "UNCAUGHT EXCEPTION. Please report this error trace."_kj;
  static constexpr kj::StringPtr kUncaughtRejection =
      "UNCAUGHT PROMISE REJECTION. Please report this error trace."_kj;

  explicit CrashContainment(core::Logger& logger);
  ~CrashContainment() noexcept(false);

  KJ_DISALLOW_COPY_AND_MOVE(CrashContainment);

  void install();
  [[nodiscard]] bool isInstalled() const {
    return installed_;
  }

  kj::TaskSet& tasks() {
    return tasks_;
  }

  // kj::TaskSet::ErrorHandler
  void taskFailed(kj::Exception&& exception) override;

  // kj::HttpServerErrorHandler
  kj::Promise<void> handleApplicationError(kj::Exception exception,
                                           kj::Maybe<kj::HttpService::Response&> response) override;

  /**
   * Log a fault that escaped a request or the main loop.
   */
  void reportUncaughtException(const kj::Exception& exception);

  [[nodiscard]] uint64_t faultCount() const {
    return faultCount_;
  }

private:
  core::Logger& logger_;
  kj::TaskSet tasks_;
  bool installed_ = false;
  uint64_t faultCount_ = 0;
};

} // namespace tollgate::gateway
