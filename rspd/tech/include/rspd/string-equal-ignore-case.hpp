#pragma once

#include <string_view>

namespace rspd {

constexpr char tolower(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool EndsWithCaseInsensitive(std::string_view value, std::string_view suffix) {
  if (value.size() < suffix.size()) {
    return false;
  }
  return CaseInsensitiveEqual(value.substr(value.size() - suffix.size()), suffix);
}

}  // namespace rspd
