#include <metaguard/logging.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace metaguard {

bool setup_logging(const std::string &level, std::string *err) {
  auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && level != "off") {
    if (err)
      *err = fmt::format("unknown log level: {}", level);
    return false;
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(lvl);
  return true;
}

HttpServer::Handler with_access_log(HttpServer::Handler next) {
  return [next = std::move(next)](http::Request req) {
    auto start = std::chrono::steady_clock::now();
    auto method = req.method;
    auto target = req.target;
    auto remote = req.remote_address;
    auto resp = next(std::move(req));
    auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
                  .count();
    spdlog::info("{} {} {} {} {:.3f}ms", method, target, resp.status, remote, ms);
    return resp;
  };
}

} // namespace metaguard
