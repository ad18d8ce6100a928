#include "rspd/request-parser.hpp"

#include <charconv>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "rspd/http-constants.hpp"
#include "rspd/http-method.hpp"
#include "rspd/http-status-code.hpp"
#include "rspd/request-context.hpp"
#include "rspd/string-equal-ignore-case.hpp"
#include "rspd/string-trim.hpp"
#include "rspd/timedef.hpp"
#include "rspd/url-decode.hpp"

namespace rspd {

namespace {

RequestParseResult MakeError(http::StatusCode status) {
  RequestParseResult result;
  result.status = RequestParseResult::Status::Error;
  result.errorStatus = status;
  return result;
}

// Returns true if the comma separated list 'value' contains 'token' (case-insensitive).
bool ContainsToken(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    if (CaseInsensitiveEqual(TrimOws(value.substr(0, commaPos)), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return false;
}

std::optional<std::size_t> ParseContentLength(std::string_view value) {
  std::size_t length{};
  const auto [ptr, errc] = std::from_chars(value.data(), value.data() + value.size(), length);
  if (errc != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
    return std::nullopt;
  }
  return length;
}

constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  if (name.empty()) {
    return false;
  }
  for (char ch : name) {
    if (ch <= ' ' || ch == ':' || ch == 0x7F) {
      return false;
    }
  }
  return true;
}

}  // namespace

RequestParseResult ParseRequest(std::string_view data, std::size_t maxHeaderBytes, std::size_t maxBodyBytes) {
  // Tolerate empty lines preceding the request line (RFC 9112 section 2.2).
  std::size_t nbLeadingBytes = 0;
  while (data.substr(nbLeadingBytes).starts_with(http::CRLF)) {
    nbLeadingBytes += http::CRLF.size();
  }
  data.remove_prefix(nbLeadingBytes);

  const auto headEnd = data.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    if (data.size() > maxHeaderBytes) {
      return MakeError(http::StatusCodeRequestHeaderFieldsTooLarge);
    }
    return {};
  }
  const std::size_t headSize = headEnd + http::DoubleCRLF.size();
  if (headSize > maxHeaderBytes) {
    return MakeError(http::StatusCodeRequestHeaderFieldsTooLarge);
  }

  std::string_view head = data.substr(0, headEnd + http::CRLF.size());

  // Request line: METHOD SP request-target SP HTTP-version CRLF
  const auto requestLineEnd = head.find(http::CRLF);
  const std::string_view requestLine = head.substr(0, requestLineEnd);
  head.remove_prefix(requestLineEnd + http::CRLF.size());

  const auto firstSpace = requestLine.find(' ');
  const auto lastSpace = requestLine.rfind(' ');
  if (firstSpace == std::string_view::npos || firstSpace == lastSpace || firstSpace == 0) {
    return MakeError(http::StatusCodeBadRequest);
  }
  const std::string_view methodStr = requestLine.substr(0, firstSpace);
  const std::string_view target = requestLine.substr(firstSpace + 1, lastSpace - firstSpace - 1);
  const std::string_view versionStr = requestLine.substr(lastSpace + 1);

  std::string_view version;
  if (versionStr == http::HTTP11Sv) {
    version = http::HTTP11Sv;
  } else if (versionStr == http::HTTP10Sv) {
    version = http::HTTP10Sv;
  } else if (versionStr.starts_with("HTTP/")) {
    return MakeError(http::StatusCodeHTTPVersionNotSupported);
  } else {
    return MakeError(http::StatusCodeBadRequest);
  }

  const auto method = http::ToMethodEnum(methodStr);
  if (!method) {
    return MakeError(http::StatusCodeNotImplemented);
  }

  if (target.empty() || target.front() != '/' || target.find(' ') != std::string_view::npos) {
    return MakeError(http::StatusCodeBadRequest);
  }

  auto ctx = std::make_shared<RequestContext>();
  ctx->_method = *method;
  ctx->_version = version;

  const auto questionMarkPos = target.find('?');
  ctx->_path.assign(target.substr(0, questionMarkPos));
  if (questionMarkPos != std::string_view::npos) {
    ctx->_query.assign(target.substr(questionMarkPos + 1));
  }
  char* pathBeg = ctx->_path.data();
  const char* pathEnd = url::DecodeInPlace(pathBeg, pathBeg + ctx->_path.size());
  if (pathEnd == nullptr) {
    return MakeError(http::StatusCodeBadRequest);
  }
  ctx->_path.resize(static_cast<std::size_t>(pathEnd - pathBeg));

  // Header fields
  std::optional<std::size_t> contentLength;
  std::string_view connectionValue;
  while (!head.empty()) {
    const auto lineEnd = head.find(http::CRLF);
    const std::string_view line = head.substr(0, lineEnd);
    head.remove_prefix(lineEnd + http::CRLF.size());

    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      return MakeError(http::StatusCodeBadRequest);
    }
    const std::string_view name = line.substr(0, colonPos);
    if (!IsValidHeaderName(name)) {
      return MakeError(http::StatusCodeBadRequest);
    }
    const std::string_view value = TrimOws(line.substr(colonPos + 1));

    if (CaseInsensitiveEqual(name, http::ContentLength)) {
      const auto length = ParseContentLength(value);
      if (!length || (contentLength && *contentLength != *length)) {
        return MakeError(http::StatusCodeBadRequest);
      }
      contentLength = length;
    } else if (CaseInsensitiveEqual(name, http::TransferEncoding)) {
      return MakeError(http::StatusCodeNotImplemented);
    } else if (CaseInsensitiveEqual(name, http::Connection)) {
      connectionValue = value;
    }
    ctx->_headers.emplace_back(name, value);
  }

  const std::size_t bodyLength = contentLength.value_or(0);
  if (bodyLength > maxBodyBytes) {
    return MakeError(http::StatusCodePayloadTooLarge);
  }
  if (data.size() - headSize < bodyLength) {
    return {};
  }
  ctx->_body.assign(data.substr(headSize, bodyLength));

  if (version == http::HTTP11Sv) {
    ctx->_keepAlive = !ContainsToken(connectionValue, http::close);
  } else {
    ctx->_keepAlive = ContainsToken(connectionValue, http::keepalive);
  }
  ctx->_startTime = SteadyClock::now();
  ctx->_receivedAt = SysClock::now();

  RequestParseResult result;
  result.status = RequestParseResult::Status::Complete;
  result.consumed = nbLeadingBytes + headSize + bodyLength;
  result.request = std::move(ctx);
  return result;
}

}  // namespace rspd
