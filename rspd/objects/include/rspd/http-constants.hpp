#pragma once

#include <string_view>

#include "rspd/http-status-code.hpp"

namespace rspd::http {

// Header field names are stored in their canonical form for emission.
// Parsing code compares them case-insensitively.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view DefaultServerName = "rspd";

inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view PUT = "PUT";
inline constexpr std::string_view DELETE = "DELETE";
inline constexpr std::string_view OPTIONS = "OPTIONS";
inline constexpr std::string_view PATCH = "PATCH";

inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view UserAgent = "User-Agent";
inline constexpr std::string_view Referer = "Referer";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Server = "Server";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view SetCookie = "Set-Cookie";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";

inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonNoContent = "No Content";
inline constexpr std::string_view ReasonMovedPermanently = "Moved Permanently";
inline constexpr std::string_view ReasonFound = "Found";
inline constexpr std::string_view ReasonSeeOther = "See Other";
inline constexpr std::string_view ReasonTemporaryRedirect = "Temporary Redirect";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";
inline constexpr std::string_view ReasonForbidden = "Forbidden";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";
inline constexpr std::string_view ReasonRequestTimeout = "Request Timeout";
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";
inline constexpr std::string_view ReasonHeadersTooLarge = "Request Header Fields Too Large";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";
inline constexpr std::string_view ReasonHTTPVersionNotSupported = "HTTP Version Not Supported";

// Return the canonical reason phrase for the status codes the server emits.
// Unknown codes yield an empty phrase.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeMovedPermanently:
      return ReasonMovedPermanently;
    case StatusCodeFound:
      return ReasonFound;
    case StatusCodeSeeOther:
      return ReasonSeeOther;
    case StatusCodeTemporaryRedirect:
      return ReasonTemporaryRedirect;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeRequestTimeout:
      return ReasonRequestTimeout;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeRequestHeaderFieldsTooLarge:
      return ReasonHeadersTooLarge;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeNotImplemented:
      return ReasonNotImplemented;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    case StatusCodeHTTPVersionNotSupported:
      return ReasonHTTPVersionNotSupported;
    default:
      return {};
  }
}

}  // namespace rspd::http
