#include <metaguard/credentials.hpp>
#include <metaguard/http.hpp>

#include <fmt/format.h>

namespace metaguard {

std::optional<std::string> HttpCredentialsProvider::credentials_for_role(const Context &ctx,
                                                                         const std::string &role,
                                                                         Error *err) {
  Url u = base_;
  u.path = join_path(base_.path.empty() ? "/" : base_.path, http::percent_encode(role));

  std::string e;
  auto resp = client_.get(u, ctx, &e);
  if (!resp) {
    if (err)
      *err = Error::upstream(502, "credentials unavailable",
                             fmt::format("fetch credentials for {}: {}", role, e));
    return std::nullopt;
  }
  if (resp->status < 200 || resp->status >= 300) {
    if (err) {
      auto msg = resp->body;
      while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r'))
        msg.pop_back();
      if (msg.empty())
        msg = http::reason_phrase(resp->status);
      *err = Error::upstream(resp->status, msg,
                             fmt::format("credential broker returned {} for {}",
                                         resp->status, role));
    }
    return std::nullopt;
  }
  return std::move(resp->body);
}

} // namespace metaguard
