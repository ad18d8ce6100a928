#include <rspd/rspd.hpp>

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace rspd;

namespace {

// Threads completing async requests, joined at exit.
class BackgroundTasks {
 public:
  template <class Func>
  void spawn(Func&& func) {
    std::scoped_lock lock(_mutex);
    _threads.emplace_back(std::forward<Func>(func));
  }

 private:
  std::mutex _mutex;
  std::vector<std::jthread> _threads;
};

void RegisterDemoRustlets(Server& server, BackgroundTasks& tasks, std::atomic<uint64_t>& counter) {
  server.addRustlet("empty", [](RequestContext&) {});

  server.addRustlet("get_session", [](RequestContext& ctx) {
    const auto value = ctx.session().get("abc");
    if (value) {
      ctx.print("abc={}", *value);
    } else {
      ctx.write("none");
    }
  });

  server.addRustlet("set_session", [](RequestContext& ctx) {
    const auto value = ctx.queryParam("abc");
    if (!value) {
      throw std::invalid_argument("missing 'abc' query parameter");
    }
    uint32_t num{};
    const auto [ptr, errc] = std::from_chars(value->data(), value->data() + value->size(), num);
    if (errc != std::errc{} || ptr != value->data() + value->size()) {
      throw std::invalid_argument("'abc' is not a number");
    }
    ctx.session().set("abc", std::to_string(num));
  });

  server.addRustlet("delete_session", [](RequestContext& ctx) { ctx.session().invalidate(); });

  server.addRustlet("delete_abc", [](RequestContext& ctx) { ctx.session().erase("abc"); });

  server.addRustlet("cookies", [](RequestContext& ctx) {
    const auto cookie = ctx.cookie("abc");
    ctx.setCookie("abc", "def");
    ctx.print("cookie={}\n", cookie.value_or("<none>"));
  });

  server.addRustlet("async", [&tasks](RequestContext& ctx) {
    AsyncContext asyncCtx = ctx.startAsync();
    ctx.write("first message\n");
    ctx.flush();
    tasks.spawn([asyncCtx]() mutable {
      // simulate a long running task
      for (std::string_view msg : {"second message\n", "third message\n", "fourth message\n", "fifth message\n"}) {
        std::this_thread::sleep_for(std::chrono::milliseconds{500});
        asyncCtx.request().write(msg);
        asyncCtx.request().flush();
      }
      asyncCtx.complete();
    });
  });

  server.addRustlet("redir", [](RequestContext& ctx) { ctx.sendRedirect("http://www.example.com"); });

  server.addRustlet("myrustlet", [&counter](RequestContext& ctx) {
    const auto nb = ++counter;
    ctx.addHeader("my_header", "ok");
    ctx.setContentType("text/plain");
    ctx.print("name: {}, x={}", ctx.queryParam("name").value_or(""), nb);
  });

  server.addRustlet("myrustlet2", [&counter](RequestContext& ctx) {
    const auto nb = ++counter;
    ctx.write("ok\n");
    ctx.print("q2: {} x={}, ua={}", ctx.query(), nb, ctx.headerOrEmpty("User-Agent"));
  });

  server.addRustlet("printheaders", [](RequestContext& ctx) {
    for (std::size_t pos = 0; pos < ctx.headerCount(); ++pos) {
      ctx.print("header[{}] [{}] -> [{}]\n", pos, ctx.headerName(pos), ctx.headerValue(pos));
      ctx.flush();
    }
    ctx.print("method='{}'\n", ctx.methodStr());
    ctx.print("http version='{}'\n", ctx.version());
    ctx.print("uri='{}'\n", ctx.path());
    ctx.print("query='{}'\n", ctx.query());
    ctx.print("content length={}\n", ctx.body().size());
  });

  server.addRustlet("content", [](RequestContext& ctx) { ctx.print("content='{}'\n", ctx.body()); });

  server.addRustlet("error", [](RequestContext& ctx) {
    ctx.write("<html><body>test of error");
    throw std::runtime_error("test error");
  });

  server.addRustlet("panic", [](RequestContext& ctx) {
    ctx.write("<html><body>test of panic");
    ctx.flush();
    std::vector<int> empty;
    ctx.print("{}", empty.at(0));
  });

  server.addRustlet("header", [](RequestContext& ctx) { ctx.write("<h1>rspd demo</h1>"); });
  server.addRustlet("footer", [](RequestContext& ctx) { ctx.print("<p>{}</p>", ctx.path()); });

  for (std::string_view name : {"myrustlet", "myrustlet2", "printheaders", "redir", "error", "panic", "async",
                                "cookies", "empty", "set_session", "get_session", "delete_session", "delete_abc",
                                "content"}) {
    server.addMapping(std::string("/").append(name), name);
  }
}

}  // namespace

// Usage: rspd-demo [port] [root directory] [--debug]
int main(int argc, char** argv) {
  uint16_t port = 8080;
  std::string rootDir = ".";
  bool debug = false;
  int positional = 0;
  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    if (arg == "--debug") {
      debug = true;
    } else if (positional++ == 0) {
      const auto [ptr, errc] = std::from_chars(arg.data(), arg.data() + arg.size(), port);
      if (errc != std::errc{} || ptr != arg.data() + arg.size()) {
        std::cerr << "Invalid port number: " << arg << "\n";
        return 1;
      }
    } else {
      rootDir = arg;
    }
  }

  SignalHandler::Enable();

  BackgroundTasks tasks;
  std::atomic<uint64_t> counter{0};
  try {
    Server server(ServerConfig{}
                      .withBindAddress("0.0.0.0:" + std::to_string(port))
                      .withRootDir(rootDir)
                      .withSessionTimeout(std::chrono::minutes{1})
                      .withServerName("rspd demo")
                      .withDebug(debug));
    RegisterDemoRustlets(server, tasks, counter);
    server.start();
    std::cout << "Server listening on port " << server.port() << ", press CTRL+C to stop\n";
    while (!SignalHandler::IsStopRequested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }
    std::cout << "Received signal " << SignalHandler::ReceivedSignal() << ", stopping\n";
    server.stop();
  } catch (const std::exception& ex) {
    std::cerr << "rspd-demo: " << ex.what() << '\n';
    return 1;
  }
  std::cout << "Server stopped cleanly.\n";
  return 0;
}
