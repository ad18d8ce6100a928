#include "rspd/dispatcher.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "rspd/errors.hpp"
#include "rspd/http-constants.hpp"
#include "rspd/http-status-code.hpp"
#include "rspd/log.hpp"
#include "rspd/request-context.hpp"
#include "rspd/rustlet.hpp"
#include "rspd/string-equal-ignore-case.hpp"

namespace rspd {

namespace {

constexpr std::string_view kRspExtension = ".rsp";

// Rejects '..' path segments so that pages cannot be loaded from outside the page root.
bool HasParentSegment(std::string_view path) {
  while (!path.empty()) {
    const auto slashPos = path.find('/');
    if (path.substr(0, slashPos) == "..") {
      return true;
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slashPos + 1);
  }
  return false;
}

}  // namespace

void SetErrorResponse(RequestContext& ctx, http::StatusCode status) {
  ctx.resetResponse();
  ctx.setStatus(status);
  ctx.setContentType(http::ContentTypeTextPlain);
  ctx.print("{} {}", status, http::ReasonPhraseFor(status));
}

Dispatcher::Dispatcher(const RustletRegistry& registry, RspInterpreter& interpreter, std::string pageRoot)
    : _registry(registry), _interpreter(interpreter), _pageRoot(std::move(pageRoot)) {
  while (_pageRoot.size() > 1 && _pageRoot.back() == '/') {
    _pageRoot.pop_back();
  }
}

void Dispatcher::invoke(RequestContext& ctx) const {
  const Rustlet* rustlet = _registry.resolve(ctx.path());
  if (rustlet != nullptr) {
    rustlet->invoke(ctx);
    return;
  }
  if (EndsWithCaseInsensitive(ctx.path(), kRspExtension) && !HasParentSegment(ctx.path())) {
    std::string pagePath(_pageRoot);
    pagePath.append(ctx.path());
    if (_interpreter.render(pagePath, ctx)) {
      return;
    }
  }
  SetErrorResponse(ctx, http::StatusCodeNotFound);
}

void Dispatcher::dispatch(RequestContext& ctx) const {
  http::StatusCode errorStatus;
  try {
    invoke(ctx);
    return;
  } catch (const MalformedDocument& ex) {
    log::warn("Unable to serve '{}': {}", ctx.path(), ex.what());
    errorStatus = http::StatusCodeBadRequest;
  } catch (const UnknownRustlet& ex) {
    log::error("Unable to serve '{}': {}", ctx.path(), ex.what());
    errorStatus = http::StatusCodeInternalServerError;
  } catch (const std::exception& ex) {
    log::error("Handler fault on '{}': {}", ctx.path(), ex.what());
    errorStatus = http::StatusCodeInternalServerError;
  } catch (...) {
    log::error("Handler fault on '{}': unknown exception", ctx.path());
    errorStatus = http::StatusCodeInternalServerError;
  }
  if (ctx.isAsync()) {
    // The response now belongs to the async context: the request completes (or times out) through it.
    log::warn("Exception after startAsync() on '{}', leaving the request detached", ctx.path());
    return;
  }
  if (ctx.isStreaming()) {
    log::warn("Response of '{}' already partially sent, dropping its connection", ctx.path());
    ctx.failStream();
    return;
  }
  SetErrorResponse(ctx, errorStatus);
}

}  // namespace rspd
