#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "rspd/http-constants.hpp"

namespace rspd::http {

enum class Method : uint8_t { GET, HEAD, POST, PUT, DELETE, OPTIONS, PATCH };

// constexpr mapping from method token to enum. Method tokens are case-sensitive.
constexpr std::optional<Method> ToMethodEnum(std::string_view methodStr) {
  if (methodStr == http::GET) {
    return Method::GET;
  }
  if (methodStr == http::HEAD) {
    return Method::HEAD;
  }
  if (methodStr == http::POST) {
    return Method::POST;
  }
  if (methodStr == http::PUT) {
    return Method::PUT;
  }
  if (methodStr == http::DELETE) {
    return Method::DELETE;
  }
  if (methodStr == http::OPTIONS) {
    return Method::OPTIONS;
  }
  if (methodStr == http::PATCH) {
    return Method::PATCH;
  }
  return {};
}

constexpr std::string_view ToMethodStr(Method method) {
  switch (method) {
    case Method::GET:
      return http::GET;
    case Method::HEAD:
      return http::HEAD;
    case Method::POST:
      return http::POST;
    case Method::PUT:
      return http::PUT;
    case Method::DELETE:
      return http::DELETE;
    case Method::OPTIONS:
      return http::OPTIONS;
    case Method::PATCH:
      return http::PATCH;
    default:
      std::unreachable();
  }
}

}  // namespace rspd::http
