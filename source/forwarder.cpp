#include <metaguard/forwarder.hpp>

#include <spdlog/spdlog.h>

namespace metaguard {

std::string UpstreamForwarder::upstream_target(const std::string &raw_path,
                                               const std::string &query) const {
  std::string target = join_path(base_.path.empty() ? "/" : base_.path,
                                 raw_path.empty() ? "/" : raw_path);
  std::string q = base_.query;
  if (!q.empty() && !query.empty())
    q += "&";
  q += query;
  if (!q.empty())
    target += "?" + q;
  return target;
}

http::Response UpstreamForwarder::forward(const http::Request &req) {
  http::Request out;
  out.method = req.method;
  out.target = upstream_target(req.raw_path, req.query);
  out.headers = req.headers;
  http::strip_hop_by_hop(out.headers);
  // the body has been de-chunked, so the length is re-derived
  http::remove_header(out.headers, "Content-Length");
  if (!req.header("Host"))
    out.headers.emplace_back("Host", base_.authority);
  out.body = req.body;

  std::string err;
  auto resp = client_.round_trip(base_.host, base_.port, out, req.context, &err);
  if (!resp) {
    spdlog::warn("forward {} {} to {}: {}", req.method, req.target, base_.authority, err);
    http::Response bad;
    bad.status = 502;
    return bad;
  }
  http::strip_hop_by_hop(resp->headers);
  if (req.method != "HEAD")
    http::remove_header(resp->headers, "Content-Length");
  return std::move(*resp);
}

} // namespace metaguard
