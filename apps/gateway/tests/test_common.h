#pragma once

#include "request_context.h"
#include "util/http_utils.h"

#include <cstring>
#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/string.h>
#include <kj/tuple.h>
#include <kj/vector.h>
#include <tollgate/core/logger.h>

namespace tollgate::gateway::testing {

// =============================================================================
// Response capture
// =============================================================================

/**
 * Output stream that appends everything written to a string.
 */
class StringSink final : public kj::AsyncOutputStream {
public:
  explicit StringSink(kj::String& target) : target_(target) {}

  kj::Promise<void> write(kj::ArrayPtr<const kj::byte> data) override {
    target_ = kj::str(target_, data.asChars());
    return kj::READY_NOW;
  }

  kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) override {
    for (auto piece : pieces) {
      target_ = kj::str(target_, piece.asChars());
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> whenWriteDisconnected() override {
    return kj::NEVER_DONE;
  }

private:
  kj::String& target_;
};

/**
 * Response that keeps status, headers and body for inspection.
 */
class MockResponse final : public kj::HttpService::Response {
public:
  kj::uint statusCode = 0;
  kj::String statusText;
  kj::Vector<kj::Tuple<kj::String, kj::String>> sentHeaders;
  kj::String body;
  kj::Maybe<uint64_t> expectedBodySize;

  explicit MockResponse(const kj::HttpHeaderTable&) {}

  kj::Own<kj::AsyncOutputStream> send(kj::uint status, kj::StringPtr text,
                                      const kj::HttpHeaders& headers,
                                      kj::Maybe<uint64_t> bodySize) override {
    statusCode = status;
    statusText = kj::str(text);
    expectedBodySize = bodySize;
    headers.forEach([this](kj::StringPtr name, kj::StringPtr value) {
      sentHeaders.add(kj::tuple(kj::str(name), kj::str(value)));
    });
    return kj::heap<StringSink>(body);
  }

  kj::Own<kj::WebSocket> acceptWebSocket(const kj::HttpHeaders&) override {
    KJ_UNIMPLEMENTED("test responses do not upgrade");
  }

  // Last value sent under name, compared case-insensitively
  kj::Maybe<kj::StringPtr> header(kj::StringPtr name) const {
    kj::Maybe<kj::StringPtr> found;
    for (auto& sent : sentHeaders) {
      if (util::equalsIgnoreCase(kj::get<0>(sent), name)) {
        found = kj::get<1>(sent).asPtr();
      }
    }
    return found;
  }
};

// =============================================================================
// In-memory request body
// =============================================================================

class MemoryInputStream final : public kj::AsyncInputStream {
public:
  explicit MemoryInputStream(kj::StringPtr content) : data_(kj::str(content)) {
    declaredLength_ = static_cast<uint64_t>(data_.size());
  }

  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override {
    (void)minBytes;
    size_t n = kj::min(maxBytes, data_.size() - offset_);
    memcpy(buffer, data_.begin() + offset_, n);
    offset_ += n;
    return n;
  }

  kj::Maybe<uint64_t> tryGetLength() override {
    return declaredLength_;
  }

  // Content-Length as announced by the client, independent of the actual data
  void declareLength(kj::Maybe<uint64_t> length) {
    declaredLength_ = length;
  }

  [[nodiscard]] size_t consumed() const {
    return offset_;
  }

private:
  kj::String data_;
  size_t offset_ = 0;
  kj::Maybe<uint64_t> declaredLength_;
};

// =============================================================================
// Log capture
// =============================================================================

struct CapturedEntry {
  core::LogLevel level;
  kj::String message;
  kj::Array<core::LogField> fields;
  kj::String formatted;

  kj::Maybe<kj::StringPtr> field(kj::StringPtr key) const {
    for (auto& f : fields) {
      if (f.key == key) {
        return f.value.asPtr();
      }
    }
    return kj::none;
  }
};

class CaptureOutput final : public core::LogOutput {
public:
  explicit CaptureOutput(kj::Vector<CapturedEntry>& sink) : sink_(sink) {}

  void write(kj::StringPtr formatted, const core::LogEntry& entry) override {
    auto fields = kj::heapArrayBuilder<core::LogField>(entry.fields.size());
    for (auto& field : entry.fields) {
      fields.add(field.clone());
    }
    sink_.add(CapturedEntry{entry.level, kj::str(entry.message), fields.finish(),
                            kj::str(formatted)});
  }
  void flush() override {}

private:
  kj::Vector<CapturedEntry>& sink_;
};

/**
 * Logger writing JSON lines into memory.
 */
struct CapturedLog {
  kj::Vector<CapturedEntry> entries;
  core::Logger logger;

  explicit CapturedLog(core::LogLevel level = core::LogLevel::Trace)
      : logger(kj::heap<core::JsonFormatter>(), kj::heap<CaptureOutput>(entries)) {
    logger.set_level(level);
  }

  kj::Maybe<const CapturedEntry&> find(kj::StringPtr message) const {
    for (auto& entry : entries) {
      if (entry.message == message) {
        return entry;
      }
    }
    return kj::none;
  }

  size_t count(kj::StringPtr message) const {
    size_t n = 0;
    for (auto& entry : entries) {
      if (entry.message == message) {
        ++n;
      }
    }
    return n;
  }

  bool anyContains(kj::StringPtr text) const {
    for (auto& entry : entries) {
      if (entry.formatted.find(text) != kj::none) {
        return true;
      }
    }
    return false;
  }
};

// =============================================================================
// Request fixture
// =============================================================================

struct TestIo {
  kj::AsyncIoContext io;
  kj::HttpHeaderTable headerTable;
  kj::WaitScope& waitScope;

  TestIo() : io(kj::setupAsyncIo()), waitScope(io.waitScope) {}

  kj::Timer& timer() {
    return io.provider->getTimer();
  }
};

/**
 * Everything a RequestContext refers to, owned in one place.
 */
struct RequestFixture {
  kj::String url;
  kj::HttpHeaders headers;
  MemoryInputStream body;
  MockResponse response;
  ResponseRecorder recorder;
  RequestContext ctx;

  RequestFixture(const kj::HttpHeaderTable& table, kj::HttpMethod method, kj::StringPtr target,
                 kj::StringPtr bodyText = ""_kj)
      : url(kj::str(target)), headers(table), body(bodyText), response(table),
        recorder(response), ctx(method, url, headers, body, recorder, table) {}

  RequestFixture& header(kj::StringPtr name, kj::StringPtr value) {
    headers.add(kj::str(name), kj::str(value));
    return *this;
  }
};

} // namespace tollgate::gateway::testing
