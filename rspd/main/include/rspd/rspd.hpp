// rspd umbrella header
//
// Include this single header to pull in the public API of the engine:
//   - Server and its configuration
//   - Rustlets, RequestContext, AsyncContext and sessions
//   - HTTP enums & helpers (methods, status codes)
//   - Error types
//
// Usage Example:
//    #include <rspd/rspd.hpp>
//    int main() {
//      rspd::Server server(rspd::ServerConfig{}.withBindAddress("127.0.0.1:8080"));
//      server.registerRustlet("/hello", [](rspd::RequestContext& ctx) { ctx.write("hi\n"); });
//      server.start();
//      ...
//    }

#pragma once

// Core server
#include "rspd/server.hpp"  // IWYU pragma: export

// Configuration
#include "rspd/log-config.hpp"      // IWYU pragma: export
#include "rspd/server-config.hpp"   // IWYU pragma: export
#include "rspd/signal-handler.hpp"  // IWYU pragma: export

// Handlers
#include "rspd/async-context.hpp"    // IWYU pragma: export
#include "rspd/errors.hpp"           // IWYU pragma: export
#include "rspd/request-context.hpp"  // IWYU pragma: export
#include "rspd/rustlet.hpp"          // IWYU pragma: export
#include "rspd/session-store.hpp"    // IWYU pragma: export

// HTTP protocol enums & helpers
#include "rspd/http-constants.hpp"    // IWYU pragma: export
#include "rspd/http-method.hpp"       // IWYU pragma: export
#include "rspd/http-status-code.hpp"  // IWYU pragma: export

// Stats
#include "rspd/stats-aggregator.hpp"  // IWYU pragma: export
