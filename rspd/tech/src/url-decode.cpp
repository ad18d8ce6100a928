#include "rspd/url-decode.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "rspd/char-hexadecimal-converter.hpp"

namespace rspd::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        if (first + 2 >= last) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          break;
        }
        char c1 = *++first;
        char c2 = *++first;
        int v1 = from_hex_digit(c1);
        int v2 = from_hex_digit(c2);
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          *out++ = c1;
          *out++ = c2;
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

namespace {

std::string DecodeComponent(std::string_view component, char plusAs) {
  std::string decoded(component);
  char* newEnd = DecodeInPlace(decoded.data(), decoded.data() + decoded.size(), plusAs, /*strictInvalid*/ false);
  decoded.resize(static_cast<std::size_t>(newEnd - decoded.data()));
  return decoded;
}

}  // namespace

QueryParams ParseQueryString(std::string_view query) {
  QueryParams params;
  while (!query.empty()) {
    const auto pairEnd = query.find('&');
    std::string_view pair = query.substr(0, pairEnd);
    query = pairEnd == std::string_view::npos ? std::string_view{} : query.substr(pairEnd + 1);
    if (pair.empty()) {
      continue;
    }
    const auto keyEnd = pair.find('=');
    if (keyEnd == std::string_view::npos) {
      params.emplace_back(DecodeComponent(pair, ' '), std::string{});
    } else {
      params.emplace_back(DecodeComponent(pair.substr(0, keyEnd), ' '), DecodeComponent(pair.substr(keyEnd + 1), ' '));
    }
  }
  return params;
}

}  // namespace rspd::url
