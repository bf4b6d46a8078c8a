#pragma once
#include <metaguard/http.hpp>
#include <metaguard/http_client.hpp>
#include <metaguard/url.hpp>

namespace metaguard {

// Relays a request to the real metadata service unchanged.
class Forwarder {
public:
  virtual ~Forwarder() = default;

  virtual http::Response forward(const http::Request &req) = 0;
};

class UpstreamForwarder : public Forwarder {
public:
  UpstreamForwarder(Url base, HttpClient client) : base_(std::move(base)), client_(client) {}

  http::Response forward(const http::Request &req) override;

  // Request-target sent upstream for an inbound raw path and query.
  std::string upstream_target(const std::string &raw_path, const std::string &query) const;

private:
  Url base_;
  HttpClient client_;
};

} // namespace metaguard
