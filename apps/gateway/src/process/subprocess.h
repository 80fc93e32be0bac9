/**
 * @file subprocess.h
 * @brief Child process execution for version-control queries
 *
 * Spawns short-lived commands with fork/exec, reads their stdout through KJ's
 * async I/O and waits for exit through kj::UnixEventPort::onChildExit().
 * kj::UnixEventPort::captureChildExit() must be called before the event loop is
 * created.
 */

#pragma once

#include <kj/array.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/timer.h>
#include <sys/types.h>

#ifdef stdout
#undef stdout
#endif

namespace tollgate::gateway::process {

/**
 * @brief Outcome of a finished command
 */
struct CommandResult {
  int exit_code;
  kj::String output; ///< everything the command wrote to stdout
};

/**
 * @brief Runs a command to completion
 *
 * Implementations reject the returned promise when the command cannot be
 * started or does not finish in time. A non-zero exit is reported through
 * CommandResult, not as a failure.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() noexcept = default;

  virtual kj::Promise<CommandResult> run(kj::Array<kj::String> argv) = 0;
};

/**
 * @brief Handle for a single child process with a piped stdout
 *
 * stdin and stderr are connected to /dev/null. Destroying a handle whose child
 * is still running kills and reaps it.
 */
class Subprocess {
public:
  Subprocess(kj::LowLevelAsyncIoProvider& lowLevel, kj::UnixEventPort& eventPort);
  ~Subprocess() noexcept(false);

  KJ_DISALLOW_COPY_AND_MOVE(Subprocess);

  /**
   * @brief Fork and exec argv[0] (looked up on PATH)
   * @throws kj::Exception if the pipe or fork fails
   */
  void spawn(kj::ArrayPtr<const kj::String> argv);

  kj::AsyncInputStream& stdout();

  /**
   * @brief Wait for the child to exit
   * @return Exit code, or 128 + signal number if the child was killed
   */
  kj::Promise<int> waitExit();

  /**
   * @brief Send SIGKILL and reap the child
   */
  void kill();

  [[nodiscard]] bool isRunning() const {
    return pid_ != kj::none;
  }

private:
  kj::LowLevelAsyncIoProvider& lowLevel_;
  kj::UnixEventPort& eventPort_;

  // Cleared by onChildExit() once the child has been reaped
  kj::Maybe<pid_t> pid_;
  kj::Maybe<kj::Own<kj::AsyncInputStream>> stdout_stream_;
};

/**
 * @brief CommandRunner backed by real child processes
 */
class SubprocessRunner final : public CommandRunner {
public:
  SubprocessRunner(kj::LowLevelAsyncIoProvider& lowLevel, kj::UnixEventPort& eventPort,
                   kj::Timer& timer, kj::Maybe<kj::Duration> timeout = kj::none);

  kj::Promise<CommandResult> run(kj::Array<kj::String> argv) override;

private:
  kj::Promise<CommandResult> runToCompletion(kj::Array<kj::String> argv);

  kj::LowLevelAsyncIoProvider& lowLevel_;
  kj::UnixEventPort& eventPort_;
  kj::Timer& timer_;
  kj::Maybe<kj::Duration> timeout_;
};

} // namespace tollgate::gateway::process
