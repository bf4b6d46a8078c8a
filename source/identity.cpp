#include <metaguard/identity.hpp>

#include <fmt/format.h>

namespace metaguard {

std::optional<std::string> parse_client_ip(const std::string &addr, std::string *err) {
  auto fail = [&]() -> std::optional<std::string> {
    if (err)
      *err = fmt::format("incorrect format, expected ip:port, was: {}", addr);
    return std::nullopt;
  };

  if (!addr.empty() && addr[0] == '[') {
    auto close = addr.find(']');
    if (close == std::string::npos || close == 1 || close + 1 >= addr.size() ||
        addr[close + 1] != ':')
      return fail();
    return addr.substr(1, close - 1);
  }

  auto colon = addr.rfind(':');
  if (colon == std::string::npos || colon == 0)
    return fail();
  return addr.substr(0, colon);
}

std::optional<std::string> ClientIdentityResolver::resolve(const http::Request &req,
                                                           std::string *err) const {
  if (allow_ip_query_) {
    auto ip = req.form_value(kOverrideParam);
    if (ip && !ip->empty())
      return ip;
  }
  return parse_client_ip(req.remote_address, err);
}

} // namespace metaguard
