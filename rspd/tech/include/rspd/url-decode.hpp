#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rspd::url {

// Decodes within the provided string buffer, compacting percent-encoded
// sequences and translating '+' to plusAs. Returns nullptr on invalid encoding
// (truncated % or non-hex digits) if strictInvalid is true, leaving the buffer in an unspecified
// partially modified state. Otherwise invalid sequences are kept literally.
// Returns a pointer to the new logical end of the decoded sequence.
// plusAs should stay '+' for paths and be ' ' for query string values.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Splits and decodes an application/x-www-form-urlencoded query string ("a=1&b=x+y") as best effort.
// Keys without '=' map to an empty value. Order and duplicates are preserved.
QueryParams ParseQueryString(std::string_view query);

}  // namespace rspd::url
