#pragma once
#include <optional>
#include <string>

namespace metaguard {

struct Url {
  std::string scheme;
  std::string host; // brackets removed for IPv6 literals
  std::string port;
  std::string authority; // host[:port] as written
  std::string path;
  std::string query;
};

// Accepts http://host[:port][/path][?query]. Only plain http is supported.
std::optional<Url> parse_url(const std::string &s, std::string *err);

// Joins with exactly one slash between a and b.
std::string join_path(const std::string &a, const std::string &b);

} // namespace metaguard
