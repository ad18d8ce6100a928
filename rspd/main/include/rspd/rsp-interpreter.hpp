#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rspd/request-context.hpp"
#include "rspd/rustlet-registry.hpp"

namespace rspd {

struct RspSegment {
  enum class Kind : uint8_t { Static, Invoke };

  bool operator==(const RspSegment&) const noexcept = default;

  Kind kind{Kind::Static};
  // Literal bytes for Static segments, rustlet name for Invoke segments.
  std::string text;
};

// A parsed RSP page: literal segments and rustlet invocations, in page order.
struct RspDocument {
  std::vector<RspSegment> segments;
};

// Renders RSP pages: HTML (or any text) in which '<@=name>' tags are replaced by the output of the rustlet 'name',
// invoked inline with the RequestContext of the request.
//
// When the page cache is enabled, parsed pages are kept in memory keyed by path and invalidated on modification.
class RspInterpreter {
 public:
  static constexpr std::string_view kOpenTag = "<@=";
  static constexpr char kCloseTag = '>';
  static constexpr std::size_t kMaxPageSize = 10UL * 1024UL * 1024UL;

  explicit RspInterpreter(const RustletRegistry& registry, bool enableCache = false)
      : _registry(registry), _cacheEnabled(enableCache) {}

  // Single pass scan of 'page'. Throws MalformedDocument for an unterminated or empty tag.
  [[nodiscard]] static RspDocument Parse(std::string_view page);

  // Appends static segments to the response and invokes the named rustlets, in order.
  // All names are resolved before anything is written: throws UnknownRustlet without side effects.
  void execute(const RspDocument& doc, RequestContext& ctx) const;

  // Loads, parses and executes the page file at 'pagePath'.
  // Returns false if the file does not exist.
  // Throws std::length_error if the file is larger than kMaxPageSize, MalformedDocument, UnknownRustlet, or any
  // exception raised by the rustlets.
  bool render(const std::string& pagePath, RequestContext& ctx);

  [[nodiscard]] std::size_t nbCachedPages() const;

 private:
  struct CachedPage {
    int64_t modificationTimeNs;
    std::shared_ptr<const RspDocument> doc;
  };

  std::shared_ptr<const RspDocument> load(const std::string& pagePath);

  const RustletRegistry& _registry;
  bool _cacheEnabled;
  mutable std::mutex _cacheMutex;
  std::unordered_map<std::string, CachedPage> _cache;
};

}  // namespace rspd
