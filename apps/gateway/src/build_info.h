#pragma once

#include "process/subprocess.h"

#include <kj/async.h>
#include <kj/string.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

/**
 * @brief Human-readable identifier of the running build
 *
 * Resolved once during startup and passed by const reference to its consumers.
 */
class BuildInfo {
public:
  enum class Source : uint8_t { Render, Git, Unknown };

  BuildInfo(kj::String text, Source source) : text_(kj::mv(text)), source_(source) {}

  [[nodiscard]] kj::StringPtr text() const {
    return text_;
  }
  [[nodiscard]] Source source() const {
    return source_;
  }

private:
  kj::String text_;
  Source source_;
};

/**
 * @brief Hosting platform variables consulted by BuildInfoResolver
 */
struct HostingEnv {
  kj::Maybe<kj::String> render;
  kj::Maybe<kj::String> render_git_commit;
  kj::Maybe<kj::String> render_git_branch;
  kj::Maybe<kj::String> render_git_repo_slug;
  kj::Maybe<kj::String> space_id;

  static HostingEnv fromProcess();
};

/**
 * @brief Determines the build identifier
 *
 * Render deployments describe themselves through environment variables. Everywhere
 * else git is asked for the commit, branch, remote and working tree status. Any
 * failing git command yields "unknown"; resolve() never rejects.
 */
class BuildInfoResolver {
public:
  static constexpr kj::StringPtr kUnknown = "unknown"_kj;

  BuildInfoResolver(HostingEnv env, process::CommandRunner& runner, core::Logger& logger);

  kj::Promise<BuildInfo> resolve();

  /**
   * @brief "<sha> (<branch>@<repo>)" from the Render variables
   */
  static kj::String fromRender(const HostingEnv& env);

  /**
   * @brief Extract "owner/repo" from a git remote URL
   *
   * Accepts https and scp-style remotes; a trailing ".git" is dropped.
   * Returns an empty string when the URL has no owner/repo tail.
   */
  static kj::String parseRemoteSlug(kj::StringPtr remote);

  /**
   * @brief Status lines that count as local modifications
   *
   * Changes to the Dockerfile are expected in deployments and are ignored.
   */
  static kj::Vector<kj::String> significantChanges(kj::StringPtr porcelainStatus);

  static kj::String formatBuildId(kj::StringPtr sha, bool modified, kj::StringPtr branch,
                                  kj::StringPtr slug);

private:
  kj::Promise<BuildInfo> queryGit();
  kj::Promise<kj::String> runGit(std::initializer_list<kj::StringPtr> argv);

  HostingEnv env_;
  process::CommandRunner& runner_;
  core::Logger& logger_;
};

} // namespace tollgate::gateway
