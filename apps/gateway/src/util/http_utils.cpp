#include "util/http_utils.h"

#include <arpa/inet.h>
#include <kj/debug.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace tollgate::gateway::util {

namespace {

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

char lowerChar(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace

kj::Maybe<kj::StringPtr> findHeader(const kj::HttpHeaders& headers, kj::StringPtr name) {
  kj::Maybe<kj::StringPtr> result = kj::none;
  headers.forEach([&](kj::StringPtr headerName, kj::StringPtr headerValue) {
    if (result == kj::none && equalsIgnoreCase(headerName, name)) {
      result = headerValue;
    }
  });
  return result;
}

kj::String resolveClientIP(const kj::HttpHeaders& headers, kj::StringPtr peerAddress,
                           bool trustProxy) {
  if (trustProxy) {
    KJ_IF_SOME(forwarded, findHeader(headers, "X-Forwarded-For"_kj)) {
      auto entries = splitList(forwarded);
      if (entries.size() > 0) {
        return kj::mv(entries[0]);
      }
    }
    KJ_IF_SOME(realIp, findHeader(headers, "X-Real-IP"_kj)) {
      auto trimmed = trim(realIp);
      if (trimmed.size() > 0) {
        return trimmed;
      }
    }
  }
  return kj::str(peerAddress);
}

kj::String peerAddressOf(kj::AsyncIoStream& connection) {
  struct sockaddr_storage addr;
  kj::uint length = sizeof(addr);
  auto failure = kj::runCatchingExceptions([&]() {
    connection.getpeername(reinterpret_cast<struct sockaddr*>(&addr), &length);
  });
  KJ_IF_SOME(exception, failure) {
    KJ_LOG(DBG, "peer address unavailable", exception.getDescription());
    return kj::str("unknown");
  }

  char buffer[INET6_ADDRSTRLEN];
  switch (addr.ss_family) {
  case AF_INET: {
    auto* in = reinterpret_cast<struct sockaddr_in*>(&addr);
    if (::inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)) != nullptr) {
      return kj::str(buffer);
    }
    break;
  }
  case AF_INET6: {
    auto* in6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
    if (::inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer)) != nullptr) {
      return kj::str(buffer);
    }
    break;
  }
  case AF_UNIX:
    return kj::str("unix");
  default:
    break;
  }
  return kj::str("unknown");
}

kj::Vector<kj::String> splitList(kj::StringPtr value, char delimiter) {
  kj::Vector<kj::String> parts;
  size_t start = 0;
  for (size_t i = 0; i <= value.size(); ++i) {
    if (i == value.size() || value[i] == delimiter) {
      auto part = trim(value.slice(start, i));
      if (part.size() > 0) {
        parts.add(kj::mv(part));
      }
      start = i + 1;
    }
  }
  return parts;
}

kj::String trim(kj::StringPtr value) {
  size_t begin = 0;
  size_t end = value.size();
  while (begin < end && isSpace(value[begin])) {
    ++begin;
  }
  while (end > begin && isSpace(value[end - 1])) {
    --end;
  }
  return kj::str(value.slice(begin, end));
}

kj::String toLower(kj::StringPtr value) {
  auto result = kj::heapString(value);
  for (auto& c : result) {
    c = lowerChar(c);
  }
  return result;
}

bool equalsIgnoreCase(kj::StringPtr a, kj::StringPtr b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (lowerChar(a[i]) != lowerChar(b[i])) {
      return false;
    }
  }
  return true;
}

kj::String mediaType(kj::StringPtr contentType) {
  KJ_IF_SOME(semicolon, contentType.findFirst(';')) {
    return toLower(trim(contentType.slice(0, semicolon)));
  }
  return toLower(trim(contentType));
}

kj::StringPtr statusText(kj::uint status) {
  switch (status) {
  case 200:
    return "OK"_kj;
  case 201:
    return "Created"_kj;
  case 202:
    return "Accepted"_kj;
  case 204:
    return "No Content"_kj;
  case 301:
    return "Moved Permanently"_kj;
  case 302:
    return "Found"_kj;
  case 304:
    return "Not Modified"_kj;
  case 400:
    return "Bad Request"_kj;
  case 401:
    return "Unauthorized"_kj;
  case 402:
    return "Payment Required"_kj;
  case 403:
    return "Forbidden"_kj;
  case 404:
    return "Not Found"_kj;
  case 405:
    return "Method Not Allowed"_kj;
  case 406:
    return "Not Acceptable"_kj;
  case 408:
    return "Request Timeout"_kj;
  case 409:
    return "Conflict"_kj;
  case 410:
    return "Gone"_kj;
  case 411:
    return "Length Required"_kj;
  case 413:
    return "Payload Too Large"_kj;
  case 414:
    return "URI Too Long"_kj;
  case 415:
    return "Unsupported Media Type"_kj;
  case 418:
    return "I'm a Teapot"_kj;
  case 422:
    return "Unprocessable Entity"_kj;
  case 429:
    return "Too Many Requests"_kj;
  case 500:
    return "Internal Server Error"_kj;
  case 501:
    return "Not Implemented"_kj;
  case 502:
    return "Bad Gateway"_kj;
  case 503:
    return "Service Unavailable"_kj;
  case 504:
    return "Gateway Timeout"_kj;
  default:
    return "Unknown"_kj;
  }
}

kj::StringPtr methodName(kj::HttpMethod method) {
  switch (method) {
  case kj::HttpMethod::GET:
    return "GET"_kj;
  case kj::HttpMethod::HEAD:
    return "HEAD"_kj;
  case kj::HttpMethod::POST:
    return "POST"_kj;
  case kj::HttpMethod::PUT:
    return "PUT"_kj;
  case kj::HttpMethod::DELETE:
    return "DELETE"_kj;
  case kj::HttpMethod::PATCH:
    return "PATCH"_kj;
  case kj::HttpMethod::OPTIONS:
    return "OPTIONS"_kj;
  default:
    return "UNKNOWN"_kj;
  }
}

} // namespace tollgate::gateway::util
