#pragma once

// Logging abstraction over spdlog. Low level modules log through the default logger, which the
// LoggingSystem replaces with its main logger while a server is running.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace rspd {

namespace log = spdlog;

}  // namespace rspd
