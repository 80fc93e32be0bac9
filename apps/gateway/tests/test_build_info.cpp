#include "build_info.h"
#include "test_common.h"

#include <kj/test.h>

namespace tollgate::gateway {
namespace {

using testing::CapturedLog;

/**
 * Answers commands from a table; unknown commands exit with 128.
 */
class FakeRunner final : public process::CommandRunner {
public:
  struct Reply {
    kj::String command;
    int exitCode;
    kj::String output;
  };

  void reply(kj::StringPtr command, kj::StringPtr output, int exitCode = 0) {
    replies_.add(Reply{kj::str(command), exitCode, kj::str(output)});
  }

  void failSpawn(kj::StringPtr command) {
    spawnFailures_.add(kj::str(command));
  }

  kj::Promise<process::CommandResult> run(kj::Array<kj::String> argv) override {
    auto command = kj::strArray(argv, " ");
    commands.add(kj::str(command));
    for (auto& failure : spawnFailures_) {
      if (failure == command) {
        return KJ_EXCEPTION(FAILED, "execvp failed", command);
      }
    }
    for (auto& entry : replies_) {
      if (entry.command == command) {
        return process::CommandResult{entry.exitCode, kj::str(entry.output)};
      }
    }
    return process::CommandResult{128, kj::str()};
  }

  kj::Vector<kj::String> commands;

private:
  kj::Vector<Reply> replies_;
  kj::Vector<kj::String> spawnFailures_;
};

void replyWithRepo(FakeRunner& runner, kj::StringPtr status = ""_kj) {
  runner.reply("git rev-parse --short HEAD"_kj, "abc1234\n"_kj);
  runner.reply("git rev-parse --abbrev-ref HEAD"_kj, "main\n"_kj);
  runner.reply("git config --get remote.origin.url"_kj,
               "https://github.com/example/tollgate.git\n"_kj);
  runner.reply("git status --porcelain"_kj, status);
}

bool ran(const FakeRunner& runner, kj::StringPtr command) {
  for (auto& c : runner.commands) {
    if (c == command) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// Render
// ============================================================================

KJ_TEST("BuildInfoResolver: Render variables take precedence over git") {
  auto io = kj::setupAsyncIo();
  CapturedLog log;
  FakeRunner runner;
  replyWithRepo(runner);

  HostingEnv env;
  env.render = kj::str("true");
  env.render_git_commit = kj::str("0123456789abcdef");
  env.render_git_branch = kj::str("release");
  env.render_git_repo_slug = kj::str("example/tollgate");

  BuildInfoResolver resolver(kj::mv(env), runner, log.logger);
  auto info = resolver.resolve().wait(io.waitScope);

  KJ_EXPECT(info.text() == "0123456 (release@example/tollgate)");
  KJ_EXPECT(info.source() == BuildInfo::Source::Render);
  KJ_EXPECT(runner.commands.size() == 0);
  KJ_EXPECT(log.find("Got build info from Render config."_kj) != kj::none);
}

KJ_TEST("BuildInfoResolver: missing Render variables use placeholders") {
  HostingEnv env;
  env.render = kj::str("true");
  KJ_EXPECT(BuildInfoResolver::fromRender(env) == "unknown SHA (unknown branch@unknown repo)");

  env.render_git_commit = kj::str("abc");
  env.render_git_branch = kj::str("");
  KJ_EXPECT(BuildInfoResolver::fromRender(env) == "abc (unknown branch@unknown repo)");
}

// ============================================================================
// Git probing
// ============================================================================

KJ_TEST("BuildInfoResolver: clean checkout") {
  auto io = kj::setupAsyncIo();
  CapturedLog log;
  FakeRunner runner;
  replyWithRepo(runner);

  BuildInfoResolver resolver(HostingEnv{}, runner, log.logger);
  auto info = resolver.resolve().wait(io.waitScope);

  KJ_EXPECT(info.text() == "abc1234 (main@example/tollgate)", info.text());
  KJ_EXPECT(info.source() == BuildInfo::Source::Git);
  KJ_EXPECT(!ran(runner, "git config --global --add safe.directory /app"_kj));

  KJ_IF_SOME(entry, log.find("Got build info from Git."_kj)) {
    KJ_EXPECT(entry.field("changes"_kj).orDefault(""_kj) == "false");
  } else {
    KJ_FAIL_EXPECT("expected the git build info line");
  }
}

KJ_TEST("BuildInfoResolver: modified checkout ignores Dockerfile changes") {
  auto io = kj::setupAsyncIo();
  CapturedLog log;

  {
    FakeRunner runner;
    replyWithRepo(runner, " M Dockerfile\n\n"_kj);
    BuildInfoResolver resolver(HostingEnv{}, runner, log.logger);
    auto info = resolver.resolve().wait(io.waitScope);
    KJ_EXPECT(info.text() == "abc1234 (main@example/tollgate)", info.text());
  }
  {
    FakeRunner runner;
    replyWithRepo(runner, " M Dockerfile\n M src/main.cpp\n"_kj);
    BuildInfoResolver resolver(HostingEnv{}, runner, log.logger);
    auto info = resolver.resolve().wait(io.waitScope);
    KJ_EXPECT(info.text() == "abc1234 (modified) (main@example/tollgate)", info.text());
  }
}

KJ_TEST("BuildInfoResolver: Spaces checkout marks the repo safe first") {
  auto io = kj::setupAsyncIo();
  CapturedLog log;
  FakeRunner runner;
  replyWithRepo(runner);
  runner.reply("git config --global --add safe.directory /app"_kj, ""_kj);

  HostingEnv env;
  env.space_id = kj::str("example/space");
  BuildInfoResolver resolver(kj::mv(env), runner, log.logger);
  auto info = resolver.resolve().wait(io.waitScope);

  KJ_EXPECT(info.source() == BuildInfo::Source::Git);
  KJ_ASSERT(runner.commands.size() == 5);
  KJ_EXPECT(runner.commands[0] == "git config --global --add safe.directory /app");
}

KJ_TEST("BuildInfoResolver: a failing git command yields unknown") {
  auto io = kj::setupAsyncIo();
  CapturedLog log;
  FakeRunner runner;
  runner.reply("git rev-parse --short HEAD"_kj, "fatal: not a git repository"_kj, 128);
  runner.reply("git rev-parse --abbrev-ref HEAD"_kj, "main"_kj);
  runner.reply("git config --get remote.origin.url"_kj, "git@github.com:a/b.git"_kj);
  runner.reply("git status --porcelain"_kj, ""_kj);

  BuildInfoResolver resolver(HostingEnv{}, runner, log.logger);
  auto info = resolver.resolve().wait(io.waitScope);

  KJ_EXPECT(info.text() == "unknown");
  KJ_EXPECT(info.source() == BuildInfo::Source::Unknown);
  KJ_IF_SOME(entry, log.find("Failed to get commit SHA."_kj)) {
    KJ_EXPECT(entry.level == core::LogLevel::Error);
  } else {
    KJ_FAIL_EXPECT("expected the failure to be logged");
  }
}

KJ_TEST("BuildInfoResolver: spawn failure yields unknown") {
  auto io = kj::setupAsyncIo();
  CapturedLog log;
  FakeRunner runner;
  replyWithRepo(runner);
  runner.failSpawn("git status --porcelain"_kj);

  BuildInfoResolver resolver(HostingEnv{}, runner, log.logger);
  auto info = resolver.resolve().wait(io.waitScope);
  KJ_EXPECT(info.text() == "unknown");
}

// ============================================================================
// Helpers
// ============================================================================

KJ_TEST("BuildInfoResolver: remote slug parsing") {
  KJ_EXPECT(BuildInfoResolver::parseRemoteSlug("https://github.com/owner/repo.git"_kj) ==
            "owner/repo");
  KJ_EXPECT(BuildInfoResolver::parseRemoteSlug("https://github.com/owner/repo"_kj) == "owner/repo");
  KJ_EXPECT(BuildInfoResolver::parseRemoteSlug("git@github.com:owner/my-repo.git"_kj) ==
            "owner/my-repo");
  KJ_EXPECT(BuildInfoResolver::parseRemoteSlug("not a remote"_kj) == "");
  KJ_EXPECT(BuildInfoResolver::parseRemoteSlug(""_kj) == "");
}

KJ_TEST("BuildInfoResolver: build id formatting") {
  KJ_EXPECT(BuildInfoResolver::formatBuildId("abc1234"_kj, false, "main"_kj, "o/r"_kj) ==
            "abc1234 (main@o/r)");
  KJ_EXPECT(BuildInfoResolver::formatBuildId("abc1234"_kj, true, "dev"_kj, ""_kj) ==
            "abc1234 (modified) (dev@)");
}

} // namespace
} // namespace tollgate::gateway
