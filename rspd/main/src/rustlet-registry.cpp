#include "rspd/rustlet-registry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "rspd/errors.hpp"
#include "rspd/log.hpp"
#include "rspd/rustlet.hpp"

namespace rspd {

namespace {

constexpr std::string_view kPrefixWildcard = "/*";

// Validates the pattern and returns its literal prefix if it is a prefix pattern.
std::optional<std::string_view> CheckPattern(std::string_view uriPattern) {
  if (uriPattern.empty() || uriPattern.front() != '/') {
    throw std::invalid_argument(fmt::format("URI pattern '{}' should start with '/'", uriPattern));
  }
  const auto starPos = uriPattern.find('*');
  if (starPos == std::string_view::npos) {
    return std::nullopt;
  }
  if (!uriPattern.ends_with(kPrefixWildcard) || starPos != uriPattern.size() - 1U) {
    throw std::invalid_argument(
        fmt::format("URI pattern '{}' may only contain a wildcard as a final '/*' segment", uriPattern));
  }
  return uriPattern.substr(0, uriPattern.size() - kPrefixWildcard.size());
}

bool MatchesPrefix(std::string_view path, std::string_view prefix) {
  if (!path.starts_with(prefix)) {
    return false;
  }
  return path.size() == prefix.size() || path[prefix.size()] == '/';
}

}  // namespace

void RustletRegistry::checkNotFrozen() const {
  if (isFrozen()) {
    throw std::logic_error("Rustlets cannot be registered once the server is started");
  }
}

void RustletRegistry::addRustlet(std::string_view name, RustletPtr rustlet) {
  checkNotFrozen();
  if (name.empty()) {
    throw std::invalid_argument("Rustlet name should not be empty");
  }
  if (!rustlet) {
    throw std::invalid_argument(fmt::format("Rustlet '{}' is null", name));
  }
  const auto [it, inserted] = _rustlets.emplace(name, std::move(rustlet));
  if (!inserted) {
    throw DuplicateMapping(fmt::format("Rustlet '{}' is already registered", name));
  }
  log::debug("Registered rustlet '{}'", name);
}

void RustletRegistry::addMapping(std::string_view uriPattern, std::string_view name) {
  checkNotFrozen();
  const auto prefix = CheckPattern(uriPattern);
  const Rustlet* rustlet = findByName(name);
  if (rustlet == nullptr) {
    throw UnknownRustlet(name);
  }
  if (!prefix) {
    if (!_exactMappings.emplace(uriPattern, rustlet).second) {
      throw DuplicateMapping(fmt::format("URI '{}' is already mapped", uriPattern));
    }
  } else {
    const auto it = std::ranges::find_if(_prefixMappings, [prefix](const PrefixMapping& mapping) {
      return mapping.prefix == *prefix;
    });
    if (it != _prefixMappings.end()) {
      throw DuplicateMapping(fmt::format("URI prefix '{}' of '{}' is already mapped", *prefix, uriPattern));
    }
    const auto insertPos = std::ranges::find_if(_prefixMappings, [prefix](const PrefixMapping& mapping) {
      return mapping.prefix.size() < prefix->size();
    });
    _prefixMappings.insert(insertPos, PrefixMapping{std::string(*prefix), rustlet});
  }
  log::debug("Mapped '{}' to rustlet '{}'", uriPattern, name);
}

void RustletRegistry::registerRustlet(std::string_view uriPattern, RustletPtr rustlet) {
  checkNotFrozen();
  CheckPattern(uriPattern);
  if (_exactMappings.contains(uriPattern)) {
    throw DuplicateMapping(fmt::format("URI '{}' is already mapped", uriPattern));
  }
  addRustlet(uriPattern, std::move(rustlet));
  try {
    addMapping(uriPattern, uriPattern);
  } catch (const DuplicateMapping&) {
    _rustlets.erase(_rustlets.find(uriPattern));
    throw;
  }
}

const Rustlet* RustletRegistry::resolve(std::string_view path) const noexcept {
  const auto exactIt = _exactMappings.find(path);
  if (exactIt != _exactMappings.end()) {
    return exactIt->second;
  }
  for (const PrefixMapping& mapping : _prefixMappings) {
    if (MatchesPrefix(path, mapping.prefix)) {
      return mapping.rustlet;
    }
  }
  return nullptr;
}

const Rustlet* RustletRegistry::findByName(std::string_view name) const noexcept {
  const auto it = _rustlets.find(name);
  return it == _rustlets.end() ? nullptr : it->second.get();
}

}  // namespace rspd
