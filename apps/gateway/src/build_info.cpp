#include "build_info.h"

#include "util/http_utils.h"

#include <cstdlib>
#include <kj/debug.h>
#include <tollgate/core/json.h>

namespace tollgate::gateway {

using core::kv;

namespace {

kj::Maybe<kj::String> envValue(const char* name) {
  if (const char* value = std::getenv(name)) {
    return kj::heapString(value);
  }
  return kj::none;
}

// Empty variables are treated the same as unset ones
kj::StringPtr orFallback(const kj::Maybe<kj::String>& value, kj::StringPtr fallback) {
  KJ_IF_SOME(v, value) {
    if (v.size() > 0) {
      return v;
    }
  }
  return fallback;
}

bool isWordChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

} // namespace

HostingEnv HostingEnv::fromProcess() {
  HostingEnv env;
  env.render = envValue("RENDER");
  env.render_git_commit = envValue("RENDER_GIT_COMMIT");
  env.render_git_branch = envValue("RENDER_GIT_BRANCH");
  env.render_git_repo_slug = envValue("RENDER_GIT_REPO_SLUG");
  env.space_id = envValue("SPACE_ID");
  return env;
}

BuildInfoResolver::BuildInfoResolver(HostingEnv env, process::CommandRunner& runner,
                                     core::Logger& logger)
    : env_(kj::mv(env)), runner_(runner), logger_(logger) {}

kj::Promise<BuildInfo> BuildInfoResolver::resolve() {
  if (env_.render != kj::none) {
    auto text = fromRender(env_);
    logger_.info("Got build info from Render config.", {kv("build", text)});
    co_return BuildInfo(kj::mv(text), BuildInfo::Source::Render);
  }

  kj::Maybe<kj::Exception> failure;
  try {
    co_return co_await queryGit();
  } catch (...) {
    failure = kj::getCaughtExceptionAsKj();
  }

  KJ_IF_SOME(exception, failure) {
    logger_.error("Failed to get commit SHA.",
                  {kv("error", exception.getDescription()), kv("stack", kj::str(exception))});
  }
  co_return BuildInfo(kj::str(kUnknown), BuildInfo::Source::Unknown);
}

kj::Promise<BuildInfo> BuildInfoResolver::queryGit() {
  // Hugging Face checks the repo out with an owner git refuses to trust
  if (env_.space_id != kj::none) {
    co_await runGit({"git"_kj, "config"_kj, "--global"_kj, "--add"_kj, "safe.directory"_kj,
                       "/app"_kj});
  }

  auto queries = kj::heapArrayBuilder<kj::Promise<kj::String>>(4);
  queries.add(runGit({"git"_kj, "rev-parse"_kj, "--short"_kj, "HEAD"_kj}));
  queries.add(runGit({"git"_kj, "rev-parse"_kj, "--abbrev-ref"_kj, "HEAD"_kj}));
  queries.add(runGit({"git"_kj, "config"_kj, "--get"_kj, "remote.origin.url"_kj}));
  queries.add(runGit({"git"_kj, "status"_kj, "--porcelain"_kj}));
  auto results = co_await kj::joinPromises(queries.finish());

  auto& sha = results[0];
  auto& branch = results[1];
  auto slug = parseRemoteSlug(results[2]);
  auto changes = significantChanges(results[3]);
  bool modified = changes.size() > 0;

  auto text = formatBuildId(sha, modified, branch, slug);
  logger_.info("Got build info from Git.",
               {kv("build", text), kv("status", kj::strArray(changes, "\n")),
                kv("changes", modified)});
  co_return BuildInfo(kj::mv(text), BuildInfo::Source::Git);
}

kj::Promise<kj::String> BuildInfoResolver::runGit(std::initializer_list<kj::StringPtr> argv) {
  auto args = kj::heapArrayBuilder<kj::String>(argv.size());
  for (auto arg : argv) {
    args.add(kj::str(arg));
  }
  auto command = kj::strArray(args, " ");

  auto result = co_await runner_.run(args.finish());
  if (result.exit_code != 0) {
    KJ_FAIL_REQUIRE("command failed", command, result.exit_code);
  }
  co_return util::trim(result.output);
}

kj::String BuildInfoResolver::fromRender(const HostingEnv& env) {
  auto sha = kj::str("unknown SHA");
  KJ_IF_SOME(commit, env.render_git_commit) {
    if (commit.size() > 0) {
      sha = kj::str(commit.slice(0, kj::min(commit.size(), size_t(7))));
    }
  }
  return kj::str(sha, " (", orFallback(env.render_git_branch, "unknown branch"_kj), "@",
                 orFallback(env.render_git_repo_slug, "unknown repo"_kj), ")");
}

kj::String BuildInfoResolver::parseRemoteSlug(kj::StringPtr remote) {
  KJ_IF_SOME(lastSlash, remote.findLast('/')) {
    kj::ArrayPtr<const char> repo = remote.slice(lastSlash + 1).asArray();
    auto suffix = ".git"_kj.asArray();
    if (repo.size() > suffix.size() && repo.slice(repo.size() - suffix.size(), repo.size()) == suffix) {
      repo = repo.slice(0, repo.size() - suffix.size());
    }
    if (repo.size() == 0) {
      return kj::str();
    }
    for (char c : repo) {
      if (!isWordChar(c) && c != '-' && c != '.') {
        return kj::str();
      }
    }

    size_t ownerStart = lastSlash;
    while (ownerStart > 0 && (isWordChar(remote[ownerStart - 1]) || remote[ownerStart - 1] == '-')) {
      --ownerStart;
    }
    // The owner must be non-empty and follow a '/' or ':'
    if (ownerStart == lastSlash || ownerStart == 0) {
      return kj::str();
    }
    char separator = remote[ownerStart - 1];
    if (separator != '/' && separator != ':') {
      return kj::str();
    }

    return kj::str(remote.slice(ownerStart, lastSlash), "/", repo);
  }
  return kj::str();
}

kj::Vector<kj::String> BuildInfoResolver::significantChanges(kj::StringPtr porcelainStatus) {
  kj::Vector<kj::String> changes;
  for (auto& line : util::splitList(porcelainStatus, '\n')) {
    if (!line.endsWith("Dockerfile"_kj)) {
      changes.add(kj::mv(line));
    }
  }
  return changes;
}

kj::String BuildInfoResolver::formatBuildId(kj::StringPtr sha, bool modified,
                                            kj::StringPtr branch, kj::StringPtr slug) {
  return kj::str(sha, modified ? " (modified)" : "", " (", branch, "@", slug, ")");
}

} // namespace tollgate::gateway
