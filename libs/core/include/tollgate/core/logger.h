/**
 * @file logger.h
 * @brief Structured logging for Tollgate
 *
 * Fields are attached per call:
 * ```cpp
 * logger.info("Now listening for connections.", {kv("port", 7860)});
 * ```
 * JSON output places every field at the top level of the record. A field created with
 * json_field() carries pre-serialized JSON and is emitted without quoting.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <source_location>

namespace tollgate::core {

/**
 * @brief Severity, from most detailed (Trace) to most severe (Critical)
 *
 * Off as a threshold disables output.
 */
enum class LogLevel : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Critical,
  Off,
};

[[nodiscard]] kj::StringPtr to_string(LogLevel level);

/**
 * @brief Parse a level name such as "info" or "WARN"
 * @return The level, or kj::none if the name is not recognized
 */
[[nodiscard]] kj::Maybe<LogLevel> parse_log_level(kj::StringPtr name);

struct LogField {
  kj::String key;
  kj::String value;
  bool is_json = false; ///< value is already serialized JSON

  [[nodiscard]] LogField clone() const {
    return LogField{kj::str(key), kj::str(value), is_json};
  }
};

[[nodiscard]] LogField kv(kj::StringPtr key, kj::StringPtr value);
[[nodiscard]] LogField kv(kj::StringPtr key, const char* value);
[[nodiscard]] LogField kv(kj::StringPtr key, bool value);
[[nodiscard]] LogField kv(kj::StringPtr key, int value);
[[nodiscard]] LogField kv(kj::StringPtr key, unsigned int value);
[[nodiscard]] LogField kv(kj::StringPtr key, int64_t value);
[[nodiscard]] LogField kv(kj::StringPtr key, uint64_t value);
[[nodiscard]] LogField kv(kj::StringPtr key, double value);

/**
 * @brief Field whose value is raw JSON (object, array or literal)
 */
[[nodiscard]] LogField json_field(kj::StringPtr key, kj::String json);

struct LogEntry {
  LogLevel level;
  kj::String timestamp; ///< ISO 8601, UTC
  kj::String file;      ///< base name only
  uint32_t line;
  kj::String message;
  kj::Array<LogField> fields;
};

class LogFormatter {
public:
  virtual ~LogFormatter() noexcept = default;

  [[nodiscard]] virtual kj::String format(const LogEntry& entry) const = 0;
};

/**
 * @brief Human-readable lines
 *
 * Format: TIMESTAMP LEVEL file:line - message key=value ...
 */
class TextFormatter final : public LogFormatter {
public:
  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
};

/**
 * @brief One JSON object per entry
 *
 * Keys: time, level, file, line, msg, then every field.
 */
class JsonFormatter final : public LogFormatter {
public:
  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
};

class LogOutput {
public:
  virtual ~LogOutput() noexcept = default;

  virtual void write(kj::StringPtr formatted, const LogEntry& entry) = 0;
  virtual void flush() = 0;
};

/**
 * @brief Writes to stdout, or stderr for Error and Critical
 */
class ConsoleOutput final : public LogOutput {
public:
  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
};

/**
 * @brief Thread-safe logger writing to a single output
 *
 * Entries below the threshold are dropped before any formatting happens.
 */
class Logger final {
public:
  explicit Logger(kj::Own<LogFormatter> formatter = kj::heap<TextFormatter>(),
                  kj::Own<LogOutput> output = kj::heap<ConsoleOutput>());

  KJ_DISALLOW_COPY_AND_MOVE(Logger);

  void set_level(LogLevel level);
  [[nodiscard]] bool enabled(LogLevel level) const;

  void set_formatter(kj::Own<LogFormatter> formatter);

  /**
   * @param fields Copied into the entry
   * @param location Defaults to the caller
   */
  void log(LogLevel level, kj::StringPtr message, kj::ArrayPtr<const LogField> fields = nullptr,
           const std::source_location& location = std::source_location::current());

  void trace(kj::StringPtr message, std::initializer_list<LogField> fields = {},
             const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Trace, message, kj::arrayPtr(fields.begin(), fields.size()), location);
  }
  void debug(kj::StringPtr message, std::initializer_list<LogField> fields = {},
             const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Debug, message, kj::arrayPtr(fields.begin(), fields.size()), location);
  }
  void info(kj::StringPtr message, std::initializer_list<LogField> fields = {},
            const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Info, message, kj::arrayPtr(fields.begin(), fields.size()), location);
  }
  void warn(kj::StringPtr message, std::initializer_list<LogField> fields = {},
            const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Warn, message, kj::arrayPtr(fields.begin(), fields.size()), location);
  }
  void error(kj::StringPtr message, std::initializer_list<LogField> fields = {},
             const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Error, message, kj::arrayPtr(fields.begin(), fields.size()), location);
  }
  void critical(kj::StringPtr message, std::initializer_list<LogField> fields = {},
                const std::source_location& location = std::source_location::current()) {
    log(LogLevel::Critical, message, kj::arrayPtr(fields.begin(), fields.size()), location);
  }

  void flush();

private:
  struct Sink {
    kj::Own<LogFormatter> formatter;
    kj::Own<LogOutput> output;
    LogLevel threshold = LogLevel::Info;
  };

  kj::MutexGuarded<Sink> sink_;
};

} // namespace tollgate::core
