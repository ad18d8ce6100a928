#include "rspd/rsp-interpreter.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rspd/errors.hpp"
#include "rspd/file.hpp"
#include "rspd/log.hpp"
#include "rspd/request-context.hpp"
#include "rspd/rustlet.hpp"
#include "rspd/string-trim.hpp"

namespace rspd {

RspDocument RspInterpreter::Parse(std::string_view page) {
  RspDocument doc;
  std::size_t pos = 0;
  while (pos < page.size()) {
    const auto openPos = page.find(kOpenTag, pos);
    if (openPos == std::string_view::npos) {
      doc.segments.emplace_back(RspSegment::Kind::Static, std::string(page.substr(pos)));
      break;
    }
    if (openPos != pos) {
      doc.segments.emplace_back(RspSegment::Kind::Static, std::string(page.substr(pos, openPos - pos)));
    }
    const auto nameBeg = openPos + kOpenTag.size();
    const auto closePos = page.find(kCloseTag, nameBeg);
    if (closePos == std::string_view::npos) {
      throw MalformedDocument("unterminated tag", openPos);
    }
    const std::string_view name = TrimOws(page.substr(nameBeg, closePos - nameBeg));
    if (name.empty()) {
      throw MalformedDocument("empty rustlet name", openPos);
    }
    doc.segments.emplace_back(RspSegment::Kind::Invoke, std::string(name));
    pos = closePos + 1;
  }
  return doc;
}

void RspInterpreter::execute(const RspDocument& doc, RequestContext& ctx) const {
  std::vector<const Rustlet*> rustlets;
  for (const RspSegment& segment : doc.segments) {
    if (segment.kind == RspSegment::Kind::Invoke) {
      const Rustlet* rustlet = _registry.findByName(segment.text);
      if (rustlet == nullptr) {
        throw UnknownRustlet(segment.text);
      }
      rustlets.push_back(rustlet);
    }
  }

  auto rustletIt = rustlets.begin();
  for (const RspSegment& segment : doc.segments) {
    if (segment.kind == RspSegment::Kind::Static) {
      ctx.write(segment.text);
    } else {
      (*rustletIt)->invoke(ctx);
      ++rustletIt;
    }
  }
}

bool RspInterpreter::render(const std::string& pagePath, RequestContext& ctx) {
  const auto doc = load(pagePath);
  if (!doc) {
    return false;
  }
  execute(*doc, ctx);
  return true;
}

std::shared_ptr<const RspDocument> RspInterpreter::load(const std::string& pagePath) {
  File file(pagePath);
  if (!file) {
    return {};
  }
  const std::size_t fileSize = file.size();
  if (fileSize > kMaxPageSize) {
    throw std::length_error(
        fmt::format("RSP page '{}' is too large ({} bytes, max {})", pagePath, fileSize, kMaxPageSize));
  }

  if (!_cacheEnabled) {
    return std::make_shared<const RspDocument>(Parse(file.loadAllContent()));
  }

  const int64_t modificationTimeNs = file.modificationTimeNs();
  {
    std::scoped_lock lock(_cacheMutex);
    const auto it = _cache.find(pagePath);
    if (it != _cache.end() && it->second.modificationTimeNs == modificationTimeNs) {
      return it->second.doc;
    }
  }

  auto doc = std::make_shared<const RspDocument>(Parse(file.loadAllContent()));
  log::debug("Caching RSP page '{}'", pagePath);
  std::scoped_lock lock(_cacheMutex);
  _cache.insert_or_assign(pagePath, CachedPage{modificationTimeNs, doc});
  return doc;
}

std::size_t RspInterpreter::nbCachedPages() const {
  std::scoped_lock lock(_cacheMutex);
  return _cache.size();
}

}  // namespace rspd
