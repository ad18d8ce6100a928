#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "rspd/rustlet.hpp"

namespace rspd {

// Named rustlets and the URI patterns mapped to them.
//
// Two kinds of patterns are supported:
//  - exact paths: '/echo' matches only '/echo'
//  - prefix patterns ending with '/*': '/static/*' matches '/static' and every path below it ('/static/a/b').
//    '/*' matches every path.
// resolve() prefers an exact match, then the prefix pattern with the longest literal prefix.
//
// Registration is single threaded and happens before the server starts. Once frozen (at server start), the registry
// is read-only and may be queried concurrently; further registration throws std::logic_error.
class RustletRegistry {
 public:
  RustletRegistry() = default;

  RustletRegistry(const RustletRegistry&) = delete;
  RustletRegistry(RustletRegistry&&) = delete;
  RustletRegistry& operator=(const RustletRegistry&) = delete;
  RustletRegistry& operator=(RustletRegistry&&) = delete;

  ~RustletRegistry() = default;

  // Registers a rustlet under 'name', the name used by RSP tags.
  // Throws DuplicateMapping if the name is taken, std::invalid_argument if name is empty or rustlet null.
  void addRustlet(std::string_view name, RustletPtr rustlet);

  // Maps 'uriPattern' to the rustlet registered as 'name'.
  // Throws UnknownRustlet if no such rustlet, DuplicateMapping if the pattern (or, for prefix patterns, the literal
  // prefix) is already mapped, std::invalid_argument if the pattern is not valid.
  void addMapping(std::string_view uriPattern, std::string_view name);

  // Registers 'rustlet' with 'uriPattern' as its name, and maps the pattern to it.
  void registerRustlet(std::string_view uriPattern, RustletPtr rustlet);

  // Returns the rustlet mapped to 'path', or nullptr.
  [[nodiscard]] const Rustlet* resolve(std::string_view path) const noexcept;

  // Returns the rustlet registered as 'name', or nullptr.
  [[nodiscard]] const Rustlet* findByName(std::string_view name) const noexcept;

  [[nodiscard]] std::size_t nbRustlets() const noexcept { return _rustlets.size(); }

  [[nodiscard]] std::size_t nbMappings() const noexcept { return _exactMappings.size() + _prefixMappings.size(); }

  void freeze() noexcept { _frozen.store(true, std::memory_order_release); }

  [[nodiscard]] bool isFrozen() const noexcept { return _frozen.load(std::memory_order_acquire); }

 private:
  struct PrefixMapping {
    std::string prefix;
    const Rustlet* rustlet;
  };

  void checkNotFrozen() const;

  std::map<std::string, RustletPtr, std::less<>> _rustlets;
  std::map<std::string, const Rustlet*, std::less<>> _exactMappings;
  // Sorted by decreasing prefix length.
  std::vector<PrefixMapping> _prefixMappings;
  std::atomic<bool> _frozen{false};
};

}  // namespace rspd
