#include "tollgate/core/error.h"

#include <kj/debug.h>

namespace tollgate::core {

kj::Exception http_error(kj::uint status, kj::StringPtr message,
                         const std::source_location& location) {
  KJ_REQUIRE(status >= 400 && status <= 599, "HTTP error status out of range", status);

  kj::Exception exception(kj::Exception::Type::FAILED, location.file_name(),
                          static_cast<int>(location.line()), kj::str(message));

  auto bytes = kj::heapArray<kj::byte>(4);
  for (size_t i = 0; i < 4; ++i) {
    bytes[i] = static_cast<kj::byte>((status >> (i * 8)) & 0xFF);
  }
  exception.setDetail(HTTP_STATUS_DETAIL_ID, kj::mv(bytes));
  return exception;
}

void throw_http_error(kj::uint status, kj::StringPtr message,
                      const std::source_location& location) {
  kj::throwFatalException(http_error(status, message, location));
}

kj::Maybe<kj::uint> http_status_of(const kj::Exception& exception) {
  KJ_IF_SOME(bytes, exception.getDetail(HTTP_STATUS_DETAIL_ID)) {
    if (bytes.size() != 4) {
      return kj::none;
    }
    kj::uint status = 0;
    for (size_t i = 0; i < 4; ++i) {
      status |= static_cast<kj::uint>(bytes[i]) << (i * 8);
    }
    return status;
  }
  return kj::none;
}

kj::String describe_stack(const kj::Exception& exception) {
  return kj::str(exception);
}

} // namespace tollgate::core
