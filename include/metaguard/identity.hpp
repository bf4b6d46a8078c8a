#pragma once
#include <metaguard/http.hpp>

#include <optional>
#include <string>

namespace metaguard {

// Splits a transport address into its host part. "[v6]:port" yields the
// bracketed literal, anything else everything before the last colon.
std::optional<std::string> parse_client_ip(const std::string &addr, std::string *err);

class ClientIdentityResolver {
public:
  static constexpr const char *kOverrideParam = "ip";

  explicit ClientIdentityResolver(bool allow_ip_query = false)
      : allow_ip_query_(allow_ip_query) {}

  // Pure parse over the request's connection metadata; no I/O.
  std::optional<std::string> resolve(const http::Request &req, std::string *err) const;

  bool allow_ip_query() const { return allow_ip_query_; }

private:
  bool allow_ip_query_;
};

} // namespace metaguard
