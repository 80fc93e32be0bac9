#pragma once

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace tollgate::gateway::util {

/**
 * @brief HTTP and string helpers shared by the gateway.
 */

/**
 * @brief Find a request header by name, ignoring case.
 *
 * kj::HttpHeaders only supports id-based lookup, so unregistered headers are
 * found by walking the header list.
 */
kj::Maybe<kj::StringPtr> findHeader(const kj::HttpHeaders& headers, kj::StringPtr name);

/**
 * @brief Resolve the client address for a request.
 *
 * When trustProxy is set the first X-Forwarded-For entry wins, then X-Real-IP.
 * Otherwise, or when neither header is present, the peer address is used.
 */
kj::String resolveClientIP(const kj::HttpHeaders& headers, kj::StringPtr peerAddress,
                           bool trustProxy);

/**
 * @brief Numeric address of the remote end of a connection, or "unknown".
 */
kj::String peerAddressOf(kj::AsyncIoStream& connection);

/**
 * @brief Split a delimited list, trimming entries and dropping empty ones.
 */
kj::Vector<kj::String> splitList(kj::StringPtr value, char delimiter = ',');

kj::String trim(kj::StringPtr value);
kj::String toLower(kj::StringPtr value);
bool equalsIgnoreCase(kj::StringPtr a, kj::StringPtr b);

/**
 * @brief Media type of a Content-Type value, lowercased and without parameters.
 */
kj::String mediaType(kj::StringPtr contentType);

/**
 * @brief Reason phrase for a status code ("Unknown" for unlisted codes).
 */
kj::StringPtr statusText(kj::uint status);

kj::StringPtr methodName(kj::HttpMethod method);

} // namespace tollgate::gateway::util
