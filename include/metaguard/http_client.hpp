#pragma once
#include <metaguard/context.hpp>
#include <metaguard/http.hpp>
#include <metaguard/url.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace metaguard {

// Plain HTTP/1.1 client, one connection per request. Each call is bounded by
// the context deadline and the client's own transport timeout, whichever is
// earlier.
class HttpClient {
public:
  explicit HttpClient(std::chrono::milliseconds timeout = std::chrono::seconds(30),
                      std::size_t max_body_bytes = 64u << 20)
      : timeout_(timeout), max_body_bytes_(max_body_bytes) {}

  // r.target is written as the request-target; headers and body go out as
  // they are apart from hop-by-hop headers.
  std::optional<http::Response> round_trip(const std::string &host, const std::string &port,
                                           const http::Request &r, const Context &ctx,
                                           std::string *err) const;

  std::optional<http::Response> get(const Url &url, const Context &ctx,
                                    std::string *err) const;

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  std::chrono::milliseconds timeout_;
  std::size_t max_body_bytes_;
};

} // namespace metaguard
