#include <metaguard/http_client.hpp>
#include <metaguard/stream.hpp>
#include <metaguard/version.hpp>

#include <fmt/format.h>

namespace metaguard {

std::optional<http::Response> HttpClient::round_trip(const std::string &host,
                                                     const std::string &port,
                                                     const http::Request &r,
                                                     const Context &ctx,
                                                     std::string *err) const {
  if (ctx.done()) {
    if (err)
      *err = ctx.reason();
    return std::nullopt;
  }
  auto deadline = Stream::clock::now() + timeout_;
  if (auto d = ctx.deadline(); d && *d < deadline)
    deadline = *d;

  Stream s;
  if (!s.connect(host, port, deadline, err))
    return std::nullopt;
  if (!s.write(http::serialize_request(r), deadline, err))
    return std::nullopt;

  http::Response resp;
  for (;;) {
    std::string head;
    if (!s.read_head(head, deadline, err))
      return std::nullopt;
    resp = http::Response{};
    if (!http::parse_response_head(head, resp, err))
      return std::nullopt;
    // skip interim responses such as 100 Continue
    if (resp.status < 100 || resp.status >= 200 || resp.status == 101)
      break;
  }

  if (r.method != "HEAD" && http::status_has_body(resp.status)) {
    auto st = read_body(s, resp.headers, true, max_body_bytes_, deadline, resp.body, err);
    if (st != BodyStatus::Ok)
      return std::nullopt;
  }
  s.close();
  return resp;
}

std::optional<http::Response> HttpClient::get(const Url &url, const Context &ctx,
                                              std::string *err) const {
  http::Request r;
  r.method = "GET";
  r.target = url.path.empty() ? "/" : url.path;
  if (!url.query.empty())
    r.target += "?" + url.query;
  r.headers.emplace_back("Host", url.authority);
  r.headers.emplace_back("User-Agent", fmt::format("metaguard/{}", METAGUARD_VERSION));
  r.headers.emplace_back("Accept", "*/*");
  return round_trip(url.host, url.port, r, ctx, err);
}

} // namespace metaguard
