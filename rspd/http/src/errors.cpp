#include "rspd/errors.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <string_view>

namespace rspd {

MalformedDocument::MalformedDocument(std::string_view reason, std::size_t offset)
    : Error(fmt::format("Malformed RSP document at offset {}: {}", offset, reason)), _offset(offset) {}

UnknownRustlet::UnknownRustlet(std::string_view name)
    : Error(fmt::format("Rustlet '{}' does not exist", name)), _name(name) {}

}  // namespace rspd
