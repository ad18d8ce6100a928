#include "rspd/response-writer.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

#include "rspd/http-constants.hpp"
#include "rspd/http-method.hpp"
#include "rspd/http-status-code.hpp"
#include "rspd/request-context.hpp"
#include "rspd/simple-charconv.hpp"
#include "rspd/timedef.hpp"
#include "rspd/timestring.hpp"

namespace rspd {

namespace {

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(http::HeaderSep);
  out.append(value);
  out.append(http::CRLF);
}

// Status line, Server, Date, Content-Type and Content-Length.
void AppendHead(std::string& out, http::StatusCode status, std::string_view serverName, SysTimePoint date,
                std::string_view contentType, std::size_t contentLength, bool withContentLength) {
  static constexpr std::size_t kStatusLen = 3U;

  const std::string_view reason = http::ReasonPhraseFor(status);

  // Status line: HTTP/1.1 404 Not Found\r\n
  out.append(http::HTTP11Sv);
  out.push_back(' ');
  const auto statusPos = out.size();
  out.append(kStatusLen, '0');
  write3(out.data() + statusPos, status);
  out.push_back(' ');
  out.append(reason);
  out.append(http::CRLF);

  AppendHeader(out, http::Server, serverName);

  // Date: Wed, 21 Oct 2015 07:28:00 GMT
  out.append(http::Date);
  out.append(http::HeaderSep);
  const auto datePos = out.size();
  out.append(kRFC7231DateStrLen, ' ');
  TimeToStringRFC7231(date, out.data() + datePos);
  out.append(http::CRLF);

  if (!contentType.empty()) {
    AppendHeader(out, http::ContentType, contentType);
  }
  if (withContentLength) {
    out.append(http::ContentLength);
    out.append(http::HeaderSep);
    fmt::format_to(std::back_inserter(out), "{}", contentLength);
    out.append(http::CRLF);
  }
}

void AppendUserHeaders(std::string& out, const RequestContext& ctx) {
  if (!ctx.redirectTarget().empty()) {
    AppendHeader(out, http::Location, ctx.redirectTarget());
  }
  for (const auto& [name, value] : ctx.responseHeaders()) {
    AppendHeader(out, name, value);
  }
  for (const auto& cookie : ctx.outgoingCookies()) {
    AppendHeader(out, http::SetCookie, cookie);
  }
  out.append(http::CRLF);
}

}  // namespace

void AppendResponse(std::string& out, const RequestContext& ctx, std::string_view serverName, SysTimePoint date,
                    bool keepAlive) {
  const bool noContent = ctx.status() == http::StatusCodeNoContent;
  const std::string& body = ctx.responseBody();

  AppendHead(out, ctx.status(), serverName, date, noContent ? std::string_view{} : ctx.contentType(), body.size(),
             !noContent);
  AppendHeader(out, http::Connection, keepAlive ? http::keepalive : http::close);
  AppendUserHeaders(out, ctx);

  if (!noContent && ctx.method() != http::Method::HEAD) {
    out.append(body);
  }
}

void AppendStreamHead(std::string& out, const RequestContext& ctx, std::string_view serverName, SysTimePoint date,
                      bool chunked) {
  AppendHead(out, ctx.status(), serverName, date, ctx.contentType(), 0, false);
  if (chunked) {
    AppendHeader(out, http::TransferEncoding, http::chunked);
  }
  AppendHeader(out, http::Connection, chunked ? http::keepalive : http::close);
  AppendUserHeaders(out, ctx);
}

void AppendStreamData(std::string& out, std::string_view data, bool chunked) {
  if (data.empty()) {
    return;
  }
  if (chunked) {
    fmt::format_to(std::back_inserter(out), "{:x}", data.size());
    out.append(http::CRLF);
    out.append(data);
    out.append(http::CRLF);
  } else {
    out.append(data);
  }
}

void AppendStreamEnd(std::string& out) {
  out.push_back('0');
  out.append(http::CRLF);
  out.append(http::CRLF);
}

void AppendErrorResponse(std::string& out, http::StatusCode status, std::string_view serverName, SysTimePoint date,
                         bool keepAlive) {
  const std::string body = fmt::format("{} {}", status, http::ReasonPhraseFor(status));
  AppendHead(out, status, serverName, date, http::ContentTypeTextPlain, body.size(), true);
  AppendHeader(out, http::Connection, keepAlive ? http::keepalive : http::close);
  out.append(http::CRLF);
  out.append(body);
}

}  // namespace rspd
