#pragma once

#include <string>
#include <string_view>

#include "rspd/http-status-code.hpp"
#include "rspd/request-context.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

// Appends to 'out' the HTTP/1.1 response built in 'ctx'.
// Emitted headers, in order: Server, Date, Content-Type, Content-Length, Connection, Location (redirects),
// user headers, Set-Cookie. The body is omitted for HEAD requests and 204 responses.
void AppendResponse(std::string& out, const RequestContext& ctx, std::string_view serverName, SysTimePoint date,
                    bool keepAlive);

// Head of a streamed response, with the headers of AppendResponse except Content-Length.
// If 'chunked', announces 'Transfer-Encoding: chunked' and keeps the connection alive, otherwise the body ends with the
// connection.
void AppendStreamHead(std::string& out, const RequestContext& ctx, std::string_view serverName, SysTimePoint date,
                      bool chunked);

// Appends one piece of a streamed body. Empty pieces are skipped as an empty chunk terminates a chunked body.
void AppendStreamData(std::string& out, std::string_view data, bool chunked);

// Terminating chunk of a chunked body.
void AppendStreamEnd(std::string& out);

// Appends to 'out' a minimal text/plain response whose body is '<status> <reason>'.
void AppendErrorResponse(std::string& out, http::StatusCode status, std::string_view serverName, SysTimePoint date,
                         bool keepAlive = false);

}  // namespace rspd
