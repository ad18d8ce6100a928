#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rspd {

// Base of the domain errors raised by the request execution core.
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// An RSP page could not be parsed. Reported to the client as 400.
class MalformedDocument : public Error {
 public:
  MalformedDocument(std::string_view reason, std::size_t offset);

  // Byte offset in the page at which the problem was detected.
  [[nodiscard]] std::size_t offset() const noexcept { return _offset; }

 private:
  std::size_t _offset;
};

// An RSP page names a rustlet that is not registered. Reported to the client as 500.
class UnknownRustlet : public Error {
 public:
  explicit UnknownRustlet(std::string_view name);

  [[nodiscard]] const std::string& name() const noexcept { return _name; }

 private:
  std::string _name;
};

// Registration conflict (same name, same pattern, or same literal prefix). Fatal at startup.
class DuplicateMapping : public Error {
 public:
  using Error::Error;
};

// The async handoff contract was violated.
class ProtocolMisuse : public Error {
 public:
  using Error::Error;
};

}  // namespace rspd
