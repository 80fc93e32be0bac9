#pragma once

#include "request_context.h"

#include <kj/string.h>

namespace tollgate::gateway::redaction {

constexpr kj::StringPtr kCensor = "********"_kj;

/**
 * Credential and client-address headers that never reach the logs.
 */
bool isSensitiveHeader(kj::StringPtr name);

/**
 * Top-level body fields holding prompt content.
 */
bool isSensitiveBodyField(kj::StringPtr name);

/**
 * Request headers as a JSON object with lowercased names and sensitive values
 * censored.
 */
kj::String headersJson(const kj::HttpHeaders& headers);

/**
 * Parsed request body as JSON with prompt fields censored ("null" when no body
 * was parsed).
 */
kj::String bodyJson(const ParsedBody& body);

/**
 * Request summary for log lines: id, method, url, redacted headers and the
 * client address.
 */
kj::String requestSummaryJson(const RequestContext& ctx);

} // namespace tollgate::gateway::redaction
