#include <metaguard/cli.hpp>

#include <fmt/format.h>

#include <string_view>

namespace metaguard {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

std::optional<std::chrono::milliseconds> parse_duration(const std::string &s) {
  std::size_t i = 0;
  while (i < s.size() && s[i] >= '0' && s[i] <= '9')
    ++i;
  if (i == 0 || i > 9)
    return std::nullopt;
  long long n = std::stoll(s.substr(0, i));
  auto unit = s.substr(i);
  if (unit == "ms")
    return std::chrono::milliseconds(n);
  if (unit == "s")
    return std::chrono::milliseconds(n * 1000);
  if (unit == "m")
    return std::chrono::milliseconds(n * 60 * 1000);
  return std::nullopt;
}

static std::optional<unsigned short> parse_port(const std::string &s) {
  if (s.empty() || s.size() > 5 || s.find_first_not_of("0123456789") != std::string::npos)
    return std::nullopt;
  auto v = std::stoul(s);
  if (v > 65535)
    return std::nullopt;
  return static_cast<unsigned short>(v);
}

static std::optional<std::size_t> parse_count(const std::string &s) {
  if (s.empty() || s.size() > 9 || s.find_first_not_of("0123456789") != std::string::npos)
    return std::nullopt;
  return static_cast<std::size_t>(std::stoul(s));
}

std::string usage() {
  return "usage: metaguard --role-map FILE --credentials-url URL [options]\n"
         "\n"
         "options:\n"
         "  --port N                    listen port (default 8181)\n"
         "  --bind ADDR                 listen address (default 0.0.0.0)\n"
         "  --metadata-url URL          metadata service (default http://169.254.169.254)\n"
         "  --allow-ip-query            accept the ip parameter as client identity\n"
         "  --max-handler-duration DUR  guarded handler deadline (default 5s)\n"
         "  --upstream-timeout DUR      upstream transport timeout (default 30s)\n"
         "  --max-connections N         open connection limit, 0 for none (default 1024)\n"
         "  --role-map FILE             \"<identity> <role>\" per line\n"
         "  --credentials-url URL       credential broker base URL\n"
         "  --log-level LEVEL           trace|debug|info|warn|error|critical|off\n"
         "  --help, --version\n";
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  Options o{};
  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--help" || a == "-h") {
      r.cmd = CmdHelp{};
      return r;
    }
    if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    }
    if (a == "--allow-ip-query") {
      o.allow_ip_query = true;
      continue;
    }

    bool takes_value = a == "--port" || a == "--bind" || a == "--metadata-url" ||
                       a == "--max-handler-duration" || a == "--upstream-timeout" ||
                       a == "--max-connections" ||
                       a == "--role-map" || a == "--credentials-url" || a == "--log-level";
    if (!takes_value) {
      r.error = fmt::format("unknown flag: {}", a);
      return r;
    }
    if (!has_arg(i, argc)) {
      r.error = fmt::format("{}: value required", a);
      return r;
    }
    std::string v = argv[++i];

    if (a == "--port") {
      auto p = parse_port(v);
      if (!p) {
        r.error = fmt::format("--port: invalid port {}", v);
        return r;
      }
      o.port = *p;
    } else if (a == "--bind") {
      o.bind = v;
    } else if (a == "--metadata-url") {
      o.metadata_url = v;
    } else if (a == "--max-handler-duration" || a == "--upstream-timeout") {
      auto d = parse_duration(v);
      if (!d || d->count() == 0) {
        r.error = fmt::format("{}: invalid duration {}", a, v);
        return r;
      }
      if (a == "--max-handler-duration")
        o.max_handler_duration = *d;
      else
        o.upstream_timeout = *d;
    } else if (a == "--max-connections") {
      auto n = parse_count(v);
      if (!n) {
        r.error = fmt::format("--max-connections: invalid count {}", v);
        return r;
      }
      o.max_connections = *n;
    } else if (a == "--role-map") {
      o.role_map = v;
    } else if (a == "--credentials-url") {
      o.credentials_url = v;
    } else {
      o.log_level = v;
    }
  }

  if (o.role_map.empty() || o.credentials_url.empty()) {
    r.error = "--role-map and --credentials-url required";
    return r;
  }
  r.cmd = o;
  return r;
}

} // namespace metaguard
