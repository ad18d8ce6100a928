#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "rspd/http-status-code.hpp"
#include "rspd/request-context.hpp"

namespace rspd {

struct RequestParseResult {
  enum class Status : uint8_t { NeedMore, Complete, Error };

  Status status{Status::NeedMore};
  // Set when status is Error: 400, 413, 431, 501 or 505.
  http::StatusCode errorStatus{};
  // Number of bytes of the input making up the request, when complete.
  std::size_t consumed{};
  // Set when status is Complete.
  std::shared_ptr<RequestContext> request;
};

// Parses one HTTP/1.x request at the beginning of 'data'.
//  - NeedMore: the request head or body is not fully buffered yet.
//  - Complete: 'request' holds the parsed request spanning the first 'consumed' bytes.
//  - Error: the request is invalid and the connection should be answered with 'errorStatus' and closed.
// Only Content-Length delimited bodies are supported, a Transfer-Encoding header yields 501.
[[nodiscard]] RequestParseResult ParseRequest(std::string_view data, std::size_t maxHeaderBytes,
                                              std::size_t maxBodyBytes);

}  // namespace rspd
