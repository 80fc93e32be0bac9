#include "gateway_config.h"

#include "util/http_utils.h"

#include <cstdlib>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <unistd.h>

namespace tollgate::gateway {

namespace {

constexpr kj::StringPtr kEnvPrefix = "TOLLGATE_"_kj;

// One hour; keeps the conversion to kj::Duration far from overflow
constexpr uint64_t kMaxGitTimeoutMs = 60 * 60 * 1000;

kj::Maybe<kj::StringPtr> readEnv(kj::StringPtr name) {
  auto fullName = kj::str(kEnvPrefix, name);
  if (const char* value = std::getenv(fullName.cStr())) {
    return kj::StringPtr(value);
  }
  return kj::none;
}

void readString(kj::StringPtr name, kj::String& target) {
  KJ_IF_SOME(value, readEnv(name)) {
    target = kj::heapString(value);
  }
}

void readBool(kj::StringPtr name, bool& target, kj::Vector<kj::String>& errors) {
  KJ_IF_SOME(value, readEnv(name)) {
    auto lowered = util::toLower(util::trim(value));
    if (lowered == "true" || lowered == "1" || lowered == "yes") {
      target = true;
    } else if (lowered == "false" || lowered == "0" || lowered == "no") {
      target = false;
    } else {
      errors.add(kj::str(kEnvPrefix, name, " must be true or false, got '", value, "'"));
    }
  }
}

template <typename T>
void readUnsigned(kj::StringPtr name, T& target, uint64_t max, kj::Vector<kj::String>& errors) {
  KJ_IF_SOME(value, readEnv(name)) {
    auto trimmed = util::trim(value);
    KJ_IF_SOME(parsed, trimmed.tryParseAs<uint64_t>()) {
      if (parsed <= max) {
        target = static_cast<T>(parsed);
        return;
      }
    }
    errors.add(kj::str(kEnvPrefix, name, " must be an integer between 0 and ", max, ", got '",
                       value, "'"));
  }
}

} // namespace

kj::StringPtr KJ_STRINGIFY(GatekeeperMode mode) {
  switch (mode) {
  case GatekeeperMode::None:
    return "none"_kj;
  case GatekeeperMode::ProxyKey:
    return "proxy_key"_kj;
  case GatekeeperMode::UserToken:
    return "user_token"_kj;
  }
  KJ_UNREACHABLE;
}

kj::StringPtr KJ_STRINGIFY(QueueMode mode) {
  switch (mode) {
  case QueueMode::None:
    return "none"_kj;
  case QueueMode::Fair:
    return "fair"_kj;
  case QueueMode::Random:
    return "random"_kj;
  }
  KJ_UNREACHABLE;
}

GatewayConfig GatewayConfig::loadFromEnv() {
  GatewayConfig config;

  // Server settings
  readString("HOST"_kj, config.host);
  readUnsigned("PORT"_kj, config.port, 65535, config.errors);
  readBool("TRUST_PROXY"_kj, config.trust_proxy, config.errors);

  // Access control
  KJ_IF_SOME(mode, readEnv("GATEKEEPER"_kj)) {
    auto lowered = util::toLower(util::trim(mode));
    if (lowered == "none") {
      config.gatekeeper = GatekeeperMode::None;
    } else if (lowered == "proxy_key") {
      config.gatekeeper = GatekeeperMode::ProxyKey;
    } else if (lowered == "user_token") {
      config.gatekeeper = GatekeeperMode::UserToken;
    } else {
      config.errors.add(kj::str("Unknown ", kEnvPrefix, "GATEKEEPER mode '", mode,
                                "' (expected none, proxy_key or user_token)"));
    }
  }
  readString("PROXY_KEY"_kj, config.proxy_key);
  readString("ADMIN_KEY"_kj, config.admin_key);

  // Providers
  readString("OPENAI_KEY"_kj, config.openai_key);
  readString("ANTHROPIC_KEY"_kj, config.anthropic_key);

  // Prompt logging
  readBool("PROMPT_LOGGING"_kj, config.prompt_logging, config.errors);
  readString("PROMPT_LOG_PATH"_kj, config.prompt_log_path);
  readUnsigned("PROMPT_LOG_FLUSH_MS"_kj, config.prompt_log_flush_ms, UINT32_MAX, config.errors);

  // Queue
  KJ_IF_SOME(mode, readEnv("QUEUE_MODE"_kj)) {
    auto lowered = util::toLower(util::trim(mode));
    if (lowered == "none") {
      config.queue_mode = QueueMode::None;
    } else if (lowered == "fair") {
      config.queue_mode = QueueMode::Fair;
    } else if (lowered == "random") {
      config.queue_mode = QueueMode::Random;
    } else {
      config.errors.add(kj::str("Unknown ", kEnvPrefix, "QUEUE_MODE '", mode,
                                "' (expected none, fair or random)"));
    }
  }
  readUnsigned("QUEUE_CONCURRENCY"_kj, config.queue_concurrency, 1024, config.errors);

  // Origin blocking
  KJ_IF_SOME(origins, readEnv("BLOCKED_ORIGINS"_kj)) {
    config.blocked_origins = util::splitList(origins);
  }
  readString("BLOCK_MESSAGE"_kj, config.block_message);

  // Build info
  kj::Maybe<uint64_t> gitTimeoutMs;
  readUnsigned("GIT_TIMEOUT_MS"_kj, gitTimeoutMs, kMaxGitTimeoutMs, config.errors);
  KJ_IF_SOME(ms, gitTimeoutMs) {
    config.git_command_timeout = static_cast<int64_t>(ms) * kj::MILLISECONDS;
  }

  // Logging
  KJ_IF_SOME(level, readEnv("LOG_LEVEL"_kj)) {
    KJ_IF_SOME(parsed, core::parse_log_level(util::trim(level))) {
      config.log_level = parsed;
    } else {
      config.errors.add(kj::str("Unknown ", kEnvPrefix, "LOG_LEVEL '", level, "'"));
    }
  }
  KJ_IF_SOME(format, readEnv("LOG_FORMAT"_kj)) {
    auto lowered = util::toLower(util::trim(format));
    if (lowered == "json") {
      config.log_format = LogFormat::Json;
    } else if (lowered == "text") {
      config.log_format = LogFormat::Text;
    } else {
      config.errors.add(kj::str("Unknown ", kEnvPrefix, "LOG_FORMAT '", format, "'"));
    }
  }

  return config;
}

kj::Vector<kj::String> GatewayConfig::problems() const {
  kj::Vector<kj::String> result;
  for (auto& error : errors) {
    result.add(kj::str(error));
  }

  if (port == 0) {
    result.add(kj::str("Invalid port number: 0"));
  }
  if (queue_mode != QueueMode::None && queue_concurrency == 0) {
    result.add(kj::str(kEnvPrefix, "QUEUE_CONCURRENCY must be > 0"));
  }
  if (gatekeeper == GatekeeperMode::ProxyKey && proxy_key.size() == 0) {
    result.add(kj::str("Gatekeeper mode 'proxy_key' requires ", kEnvPrefix, "PROXY_KEY"));
  }
  if (gatekeeper == GatekeeperMode::UserToken && admin_key.size() == 0) {
    result.add(kj::str("Gatekeeper mode 'user_token' requires ", kEnvPrefix, "ADMIN_KEY"));
  }

  if (prompt_logging) {
    auto fs = kj::newDiskFilesystem();
    auto failure = kj::runCatchingExceptions([&]() {
      auto path = fs->getCurrentPath().evalNative(prompt_log_path);
      auto directory = path.parent();
      if (!fs->getRoot().exists(directory)) {
        result.add(kj::str("Prompt log directory does not exist: ", directory.toNativeString(true)));
      } else if (::access(directory.toNativeString(true).cStr(), W_OK) != 0) {
        result.add(kj::str("Prompt log directory is not writable: ",
                           directory.toNativeString(true)));
      }
    });
    KJ_IF_SOME(exception, failure) {
      result.add(kj::str("Invalid prompt log path '", prompt_log_path,
                         "': ", exception.getDescription()));
    }
  }

  return result;
}

void GatewayConfig::validate() const {
  auto found = problems();
  if (found.size() > 0) {
    KJ_FAIL_REQUIRE("Invalid configuration", kj::strArray(found, "; "));
  }
}

void GatewayConfig::logWarnings(core::Logger& logger) const {
  if (openai_key.size() == 0 && anthropic_key.size() == 0) {
    logger.warn("No provider keys configured. Proxy routes will report no available models.");
  }
  if (gatekeeper == GatekeeperMode::None) {
    logger.warn("Gatekeeper is disabled. Anyone who can reach the proxy can use it.");
  }
  if (admin_key.size() > 0 && admin_key.size() < 16) {
    logger.warn("Admin key is shorter than 16 characters.",
                {core::kv("length", static_cast<uint64_t>(admin_key.size()))});
  }
}

} // namespace tollgate::gateway
