/**
 * @file error.h
 * @brief HTTP-aware errors carried as kj::Exception
 *
 * Request-scoped client errors (payload too large, malformed body, forbidden origin)
 * are ordinary kj::Exceptions with the HTTP status attached as an exception detail.
 * Anything without that detail is treated as an internal failure.
 */

#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <source_location>

namespace tollgate::core {

// Detail id under which the HTTP status is stored on a kj::Exception.
inline constexpr uint64_t HTTP_STATUS_DETAIL_ID = 0x7f4c2a91d3b85e06ull;

/**
 * @brief Build an exception that carries an explicit HTTP status
 *
 * The description is exactly message, so it can be returned to clients verbatim.
 */
[[nodiscard]] kj::Exception
http_error(kj::uint status, kj::StringPtr message,
           const std::source_location& location = std::source_location::current());

[[noreturn]] void
throw_http_error(kj::uint status, kj::StringPtr message,
                 const std::source_location& location = std::source_location::current());

/**
 * @brief The explicit HTTP status of an exception, if it has one
 */
[[nodiscard]] kj::Maybe<kj::uint> http_status_of(const kj::Exception& exception);

/**
 * @brief Render an exception's trace for diagnostics: location, description and stack
 */
[[nodiscard]] kj::String describe_stack(const kj::Exception& exception);

} // namespace tollgate::core
