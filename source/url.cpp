#include <metaguard/url.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace metaguard {

std::optional<Url> parse_url(const std::string &s, std::string *err) {
  auto fail = [&](const std::string &why) -> std::optional<Url> {
    if (err)
      *err = fmt::format("parse \"{}\": {}", s, why);
    return std::nullopt;
  };

  auto sep = s.find("://");
  if (sep == std::string::npos)
    return fail("missing scheme");
  Url u;
  u.scheme = s.substr(0, sep);
  std::transform(u.scheme.begin(), u.scheme.end(), u.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (u.scheme != "http")
    return fail(fmt::format("unsupported scheme {}", u.scheme));

  std::string rest = s.substr(sep + 3);
  auto end = rest.find_first_of("/?#");
  u.authority = rest.substr(0, end);
  std::string tail = end == std::string::npos ? std::string() : rest.substr(end);
  if (u.authority.empty())
    return fail("missing host");

  if (u.authority[0] == '[') {
    auto close = u.authority.find(']');
    if (close == std::string::npos)
      return fail("missing ']' in host");
    u.host = u.authority.substr(1, close - 1);
    std::string after = u.authority.substr(close + 1);
    if (!after.empty()) {
      if (after[0] != ':')
        return fail("invalid port");
      u.port = after.substr(1);
    }
  } else {
    auto colon = u.authority.rfind(':');
    if (colon != std::string::npos) {
      u.host = u.authority.substr(0, colon);
      u.port = u.authority.substr(colon + 1);
    } else {
      u.host = u.authority;
    }
  }
  if (u.host.empty())
    return fail("missing host");
  if (u.port.empty()) {
    u.port = "80";
  } else if (u.port.size() > 5 ||
             !std::all_of(u.port.begin(), u.port.end(),
                          [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }) ||
             std::stoul(u.port) > 65535) {
    return fail(fmt::format("invalid port \"{}\"", u.port));
  }

  auto hash = tail.find('#');
  if (hash != std::string::npos)
    tail.resize(hash);
  auto q = tail.find('?');
  if (q == std::string::npos) {
    u.path = tail;
  } else {
    u.path = tail.substr(0, q);
    u.query = tail.substr(q + 1);
  }
  return u;
}

std::string join_path(const std::string &a, const std::string &b) {
  bool aslash = !a.empty() && a.back() == '/';
  bool bslash = !b.empty() && b.front() == '/';
  if (aslash && bslash)
    return a + b.substr(1);
  if (!aslash && !bslash)
    return a + "/" + b;
  return a + b;
}

} // namespace metaguard
