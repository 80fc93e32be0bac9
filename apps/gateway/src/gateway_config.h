#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway {

enum class GatekeeperMode : uint8_t { None, ProxyKey, UserToken };
enum class QueueMode : uint8_t { None, Fair, Random };
enum class LogFormat : uint8_t { Json, Text };

kj::StringPtr KJ_STRINGIFY(GatekeeperMode mode);
kj::StringPtr KJ_STRINGIFY(QueueMode mode);

/**
 * @brief Gateway configuration loaded from TOLLGATE_* environment variables
 *
 * Parse errors are collected while loading and reported together by validate(),
 * so a misconfigured deployment shows every problem at once.
 */
struct GatewayConfig {
  static constexpr size_t kDefaultBodyLimit = 10 * 1024 * 1024;

  // Server settings
  kj::String host = kj::str("0.0.0.0");
  uint16_t port = 7860;
  bool trust_proxy = true;

  // Access control
  GatekeeperMode gatekeeper = GatekeeperMode::None;
  kj::String proxy_key;
  kj::String admin_key;

  // Upstream provider keys (comma-separated lists)
  kj::String openai_key;
  kj::String anthropic_key;

  // Prompt logging
  bool prompt_logging = false;
  kj::String prompt_log_path = kj::str("./prompt-log.jsonl");
  uint32_t prompt_log_flush_ms = 5000;

  // Request queue
  QueueMode queue_mode = QueueMode::Fair;
  uint32_t queue_concurrency = 1;

  // Origin blocking
  kj::Vector<kj::String> blocked_origins;
  kj::String block_message =
      kj::str("You must be over the age of majority in your country to use this service.");

  // Build info probing; kj::none means no timeout
  kj::Maybe<kj::Duration> git_command_timeout;

  // Logging
  core::LogLevel log_level = core::LogLevel::Info;
  LogFormat log_format = LogFormat::Json;

  // Problems found while reading the environment
  kj::Vector<kj::String> errors;

  /**
   * @brief Load configuration from environment variables
   *
   * Unset variables keep their defaults. Unparsable values are recorded in
   * errors and also keep their defaults.
   */
  static GatewayConfig loadFromEnv();

  /**
   * @brief Validate configuration
   *
   * @throws kj::Exception listing every problem if the gateway cannot start
   */
  void validate() const;

  /**
   * @brief Log non-fatal configuration concerns
   */
  void logWarnings(core::Logger& logger) const;

  [[nodiscard]] kj::Vector<kj::String> problems() const;
};

} // namespace tollgate::gateway
