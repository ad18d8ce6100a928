#pragma once

#include <string>
#include <string_view>

#include "rspd/request-context.hpp"
#include "rspd/rsp-interpreter.hpp"
#include "rspd/rustlet-registry.hpp"

namespace rspd {

// Routes a parsed request to its handler:
//  1. the rustlet mapped to the path (exact, then longest prefix),
//  2. otherwise, for paths ending with '.rsp' (case-insensitive), the page 'pageRoot/<path>' through the interpreter,
//  3. otherwise 404.
// Failures never escape dispatch(): they are turned into an error response and logged. A failure after a partial
// flush abandons the response instead.
class Dispatcher {
 public:
  Dispatcher(const RustletRegistry& registry, RspInterpreter& interpreter, std::string pageRoot);

  void dispatch(RequestContext& ctx) const;

  [[nodiscard]] const std::string& pageRoot() const noexcept { return _pageRoot; }

 private:
  void invoke(RequestContext& ctx) const;

  const RustletRegistry& _registry;
  RspInterpreter& _interpreter;
  std::string _pageRoot;
};

// Replaces the response built so far by a short text/plain error response.
void SetErrorResponse(RequestContext& ctx, http::StatusCode status);

}  // namespace rspd
