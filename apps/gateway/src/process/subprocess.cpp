#include "process/subprocess.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tollgate::gateway::process {

// ============================================================================
// Subprocess Implementation
// ============================================================================

Subprocess::Subprocess(kj::LowLevelAsyncIoProvider& lowLevel, kj::UnixEventPort& eventPort)
    : lowLevel_(lowLevel), eventPort_(eventPort) {}

Subprocess::~Subprocess() noexcept(false) {
  stdout_stream_ = kj::none;
  kill();
}

void Subprocess::spawn(kj::ArrayPtr<const kj::String> argv) {
  KJ_REQUIRE(pid_ == kj::none, "Subprocess already running");
  KJ_REQUIRE(argv.size() > 0, "Command must not be empty");

  int stdout_pipe[2];
  if (::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
    KJ_FAIL_SYSCALL("pipe2", errno);
  }

  // Prepared before fork; the child must not allocate
  kj::Vector<char*> args(argv.size() + 1);
  for (auto& arg : argv) {
    args.add(const_cast<char*>(arg.cStr()));
  }
  args.add(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    int saved_errno = errno;
    ::close(stdout_pipe[0]);
    ::close(stdout_pipe[1]);
    KJ_FAIL_SYSCALL("fork", saved_errno);
  }

  if (pid == 0) {
    // Child process: the event loop blocks signals, so restore a clean mask
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    int null_fd = ::open("/dev/null", O_RDWR);
    if (null_fd < 0 || ::dup2(null_fd, STDIN_FILENO) < 0 || ::dup2(null_fd, STDERR_FILENO) < 0 ||
        ::dup2(stdout_pipe[1], STDOUT_FILENO) < 0) {
      _exit(127);
    }

    ::execvp(args[0], args.begin());

    // If execvp returns, it failed
    _exit(127);
  }

  // Parent process
  ::close(stdout_pipe[1]);
  pid_ = pid;
  stdout_stream_ = lowLevel_.wrapInputFd(stdout_pipe[0],
                                         kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                                             kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC);
}

kj::AsyncInputStream& Subprocess::stdout() {
  KJ_IF_SOME(stream, stdout_stream_) {
    return *stream;
  }
  KJ_FAIL_REQUIRE("stdout stream not available");
}

kj::Promise<int> Subprocess::waitExit() {
  KJ_REQUIRE(pid_ != kj::none, "Process not running");

  return eventPort_.onChildExit(pid_).then([](int status) -> int {
    if (WIFEXITED(status)) {
      return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      return 128 + WTERMSIG(status);
    }
    return -1;
  });
}

void Subprocess::kill() {
  KJ_IF_SOME(pid, pid_) {
    ::kill(pid, SIGKILL);

    // Wait for process to avoid zombie
    int status;
    ::waitpid(pid, &status, 0);
    pid_ = kj::none;
  }
}

// ============================================================================
// SubprocessRunner Implementation
// ============================================================================

SubprocessRunner::SubprocessRunner(kj::LowLevelAsyncIoProvider& lowLevel,
                                   kj::UnixEventPort& eventPort, kj::Timer& timer,
                                   kj::Maybe<kj::Duration> timeout)
    : lowLevel_(lowLevel), eventPort_(eventPort), timer_(timer), timeout_(timeout) {}

kj::Promise<CommandResult> SubprocessRunner::run(kj::Array<kj::String> argv) {
  auto promise = runToCompletion(kj::mv(argv));
  KJ_IF_SOME(timeout, timeout_) {
    // Cancelling runToCompletion() destroys the Subprocess, which kills the child
    return timer_.timeoutAfter(timeout, kj::mv(promise));
  }
  return promise;
}

kj::Promise<CommandResult> SubprocessRunner::runToCompletion(kj::Array<kj::String> argv) {
  auto child = kj::heap<Subprocess>(lowLevel_, eventPort_);
  child->spawn(argv);

  auto output = co_await child->stdout().readAllText();
  int exit_code = co_await child->waitExit();

  co_return CommandResult{exit_code, kj::mv(output)};
}

} // namespace tollgate::gateway::process
