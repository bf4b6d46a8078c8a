#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace metaguard {

struct Options {
  unsigned short port = 8181;
  std::string bind = "0.0.0.0";
  std::string metadata_url = "http://169.254.169.254";
  bool allow_ip_query = false;
  std::chrono::milliseconds max_handler_duration{std::chrono::seconds(5)};
  std::chrono::milliseconds upstream_timeout{std::chrono::seconds(30)};
  std::size_t max_connections = 1024;
  std::string role_map;
  std::string credentials_url;
  std::string log_level = "info";
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<Options, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

// "250ms", "5s", "2m".
std::optional<std::chrono::milliseconds> parse_duration(const std::string &s);

std::string usage();

} // namespace metaguard
