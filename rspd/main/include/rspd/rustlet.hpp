#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "rspd/request-context.hpp"

namespace rspd {

// A request handler. Rustlets are registered once, then shared read-only by all worker threads:
// invoke() may be called concurrently and must synchronize any state it mutates.
class Rustlet {
 public:
  Rustlet() noexcept = default;

  Rustlet(const Rustlet&) = delete;
  Rustlet(Rustlet&&) = delete;
  Rustlet& operator=(const Rustlet&) = delete;
  Rustlet& operator=(Rustlet&&) = delete;

  virtual ~Rustlet() = default;

  // Any exception escaping invoke() is turned into a 500 response by the server.
  virtual void invoke(RequestContext& ctx) const = 0;
};

using RustletPtr = std::shared_ptr<const Rustlet>;

// Adapts any callable taking a RequestContext& into a Rustlet.
class FunctionRustlet : public Rustlet {
 public:
  using Function = std::function<void(RequestContext&)>;

  explicit FunctionRustlet(Function func) : _func(std::move(func)) {}

  void invoke(RequestContext& ctx) const override { _func(ctx); }

 private:
  Function _func;
};

template <class Func>
RustletPtr MakeRustlet(Func&& func) {
  return std::make_shared<FunctionRustlet>(FunctionRustlet::Function(std::forward<Func>(func)));
}

}  // namespace rspd
