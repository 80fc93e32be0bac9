#include "crash_containment.h"

#include <exception>
#include <kj/debug.h>
#include <tollgate/core/error.h>

namespace tollgate::gateway {

using core::kv;

namespace {

core::Logger* g_terminate_logger = nullptr;

[[noreturn]] void logAndAbort() {
  if (g_terminate_logger != nullptr) {
    kj::String description = kj::str("unknown");
    if (std::current_exception() != nullptr) {
      try {
        throw;
      } catch (...) {
        description = kj::str(kj::getCaughtExceptionAsKj());
      }
    }
    g_terminate_logger->critical(CrashContainment::kUncaughtException,
                                 {kv("error", description)});
    g_terminate_logger->flush();
  }
  std::abort();
}

} // namespace

CrashContainment::CrashContainment(core::Logger& logger) : logger_(logger), tasks_(*this) {}

CrashContainment::~CrashContainment() noexcept(false) {
  if (g_terminate_logger == &logger_) {
    g_terminate_logger = nullptr;
  }
}

void CrashContainment::install() {
  g_terminate_logger = &logger_;
  std::set_terminate(&logAndAbort);
  installed_ = true;
}

void CrashContainment::taskFailed(kj::Exception&& exception) {
  ++faultCount_;
  logger_.error(kUncaughtRejection, {kv("error", exception.getDescription()),
                                     kv("stack", core::describe_stack(exception))});
}

kj::Promise<void>
CrashContainment::handleApplicationError(kj::Exception exception,
                                         kj::Maybe<kj::HttpService::Response&> response) {
  reportUncaughtException(exception);
  KJ_IF_SOME(unsent, response) {
    return kj::HttpServerErrorHandler::handleApplicationError(kj::mv(exception), unsent);
  }
  // The response already started; the server closes the connection
  return kj::READY_NOW;
}

void CrashContainment::reportUncaughtException(const kj::Exception& exception) {
  ++faultCount_;
  logger_.error(kUncaughtException, {kv("error", exception.getDescription()),
                                     kv("stack", core::describe_stack(exception))});
}

} // namespace tollgate::gateway
