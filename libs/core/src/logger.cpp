#include "tollgate/core/logger.h"

#include "tollgate/core/time.h"

#include <cmath>
#include <cstdio>
#include <kj/debug.h>
#include <kj/string-tree.h>
#include <kj/vector.h>

namespace tollgate::core {

namespace {

struct LevelName {
  kj::StringPtr name;
  LogLevel level;
};

constexpr LevelName kLevelNames[] = {
    {"trace"_kj, LogLevel::Trace},       {"debug"_kj, LogLevel::Debug},
    {"info"_kj, LogLevel::Info},         {"warn"_kj, LogLevel::Warn},
    {"warning"_kj, LogLevel::Warn},      {"error"_kj, LogLevel::Error},
    {"critical"_kj, LogLevel::Critical}, {"fatal"_kj, LogLevel::Critical},
    {"off"_kj, LogLevel::Off},           {"silent"_kj, LogLevel::Off},
};

char asciiLower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

// Appends s to out as the body of a JSON string literal
void appendEscaped(kj::Vector<char>& out, kj::StringPtr s) {
  for (char c : s) {
    kj::StringPtr escape;
    switch (c) {
    case '"':
      escape = "\\\""_kj;
      break;
    case '\\':
      escape = "\\\\"_kj;
      break;
    case '\n':
      escape = "\\n"_kj;
      break;
    case '\r':
      escape = "\\r"_kj;
      break;
    case '\t':
      escape = "\\t"_kj;
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        int n = std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
        out.addAll(kj::arrayPtr(buf, static_cast<size_t>(n)));
      } else {
        out.add(c);
      }
      continue;
    }
    out.addAll(escape);
  }
}

void appendQuoted(kj::Vector<char>& out, kj::StringPtr s) {
  out.add('"');
  appendEscaped(out, s);
  out.add('"');
}

kj::StringPtr baseName(kj::StringPtr path) {
  KJ_IF_SOME(slash, path.findLast('/')) {
    return path.slice(slash + 1);
  }
  return path;
}

} // namespace

kj::StringPtr to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE"_kj;
  case LogLevel::Debug:
    return "DEBUG"_kj;
  case LogLevel::Info:
    return "INFO"_kj;
  case LogLevel::Warn:
    return "WARN"_kj;
  case LogLevel::Error:
    return "ERROR"_kj;
  case LogLevel::Critical:
    return "CRITICAL"_kj;
  case LogLevel::Off:
    return "OFF"_kj;
  }
  KJ_UNREACHABLE;
}

kj::Maybe<LogLevel> parse_log_level(kj::StringPtr name) {
  auto lowered = kj::heapString(name);
  for (char& c : lowered) {
    c = asciiLower(c);
  }
  for (auto& entry : kLevelNames) {
    if (entry.name == lowered) {
      return entry.level;
    }
  }
  return kj::none;
}

LogField kv(kj::StringPtr key, kj::StringPtr value) {
  return LogField{kj::str(key), kj::str(value)};
}

LogField kv(kj::StringPtr key, const char* value) {
  return kv(key, kj::StringPtr(value));
}

LogField kv(kj::StringPtr key, bool value) {
  return LogField{kj::str(key), kj::str(value ? "true" : "false"), true};
}

LogField kv(kj::StringPtr key, int value) {
  return LogField{kj::str(key), kj::str(value), true};
}

LogField kv(kj::StringPtr key, unsigned int value) {
  return LogField{kj::str(key), kj::str(value), true};
}

LogField kv(kj::StringPtr key, int64_t value) {
  return LogField{kj::str(key), kj::str(value), true};
}

LogField kv(kj::StringPtr key, uint64_t value) {
  return LogField{kj::str(key), kj::str(value), true};
}

LogField kv(kj::StringPtr key, double value) {
  // NaN and infinity have no JSON form
  return LogField{kj::str(key), std::isfinite(value) ? kj::str(value) : kj::str("null"), true};
}

LogField json_field(kj::StringPtr key, kj::String json) {
  return LogField{kj::str(key), kj::mv(json), true};
}

// ============================================================================
// Formatters
// ============================================================================

kj::String TextFormatter::format(const LogEntry& entry) const {
  auto line = kj::strTree(entry.timestamp, " ", to_string(entry.level), " ", entry.file, ":",
                          entry.line, " - ", entry.message);
  for (auto& field : entry.fields) {
    line = kj::strTree(kj::mv(line), " ", field.key, "=", field.value);
  }
  return line.flatten();
}

kj::String JsonFormatter::format(const LogEntry& entry) const {
  kj::Vector<char> out(128 + entry.message.size());
  out.addAll("{\"time\":"_kj);
  appendQuoted(out, entry.timestamp);
  out.addAll(",\"level\":"_kj);
  appendQuoted(out, to_string(entry.level));
  out.addAll(",\"file\":"_kj);
  appendQuoted(out, entry.file);
  out.addAll(kj::str(",\"line\":", entry.line, ",\"msg\":"));
  appendQuoted(out, entry.message);

  for (auto& field : entry.fields) {
    out.add(',');
    appendQuoted(out, field.key);
    out.add(':');
    if (field.is_json) {
      out.addAll(field.value);
    } else {
      appendQuoted(out, field.value);
    }
  }
  out.add('}');
  out.add('\0');
  return kj::String(out.releaseAsArray());
}

// ============================================================================
// ConsoleOutput
// ============================================================================

void ConsoleOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  FILE* stream = entry.level >= LogLevel::Error ? stderr : stdout;
  std::fwrite(formatted.begin(), 1, formatted.size(), stream);
  std::fputc('\n', stream);
}

void ConsoleOutput::flush() {
  std::fflush(stdout);
  std::fflush(stderr);
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(kj::Own<LogFormatter> formatter, kj::Own<LogOutput> output)
    : sink_(Sink{kj::mv(formatter), kj::mv(output)}) {}

void Logger::set_level(LogLevel level) {
  sink_.lockExclusive()->threshold = level;
}

bool Logger::enabled(LogLevel level) const {
  auto threshold = sink_.lockShared()->threshold;
  return threshold != LogLevel::Off && level >= threshold;
}

void Logger::set_formatter(kj::Own<LogFormatter> formatter) {
  sink_.lockExclusive()->formatter = kj::mv(formatter);
}

void Logger::log(LogLevel level, kj::StringPtr message, kj::ArrayPtr<const LogField> fields,
                 const std::source_location& location) {
  if (!enabled(level)) {
    return;
  }

  auto copies = kj::heapArrayBuilder<LogField>(fields.size());
  for (auto& field : fields) {
    copies.add(field.clone());
  }
  LogEntry entry{level,
                 now_utc_iso8601(),
                 kj::str(baseName(location.file_name())),
                 static_cast<uint32_t>(location.line()),
                 kj::str(message),
                 copies.finish()};

  auto sink = sink_.lockExclusive();
  auto formatted = sink->formatter->format(entry);
  sink->output->write(formatted, entry);
}

void Logger::flush() {
  sink_.lockExclusive()->output->flush();
}

} // namespace tollgate::core
