#pragma once
#include <metaguard/http_server.hpp>

#include <string>

namespace metaguard {

// Sets the log pattern and level. Fails for an unknown level name.
bool setup_logging(const std::string &level, std::string *err);

// One info line per request: method, path, status, remote address, duration.
HttpServer::Handler with_access_log(HttpServer::Handler next);

} // namespace metaguard
