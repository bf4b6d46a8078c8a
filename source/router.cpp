#include <metaguard/router.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace metaguard {

static std::vector<std::string> split_segments(const std::string &p) {
  std::vector<std::string> out;
  std::size_t pos = 1;
  for (;;) {
    auto slash = p.find('/', pos);
    if (slash == std::string::npos) {
      out.push_back(p.substr(pos));
      return out;
    }
    out.push_back(p.substr(pos, slash - pos));
    pos = slash + 1;
  }
}

void Router::handle(const std::string &pattern, Handler h) {
  if (pattern.empty() || pattern[0] != '/')
    throw std::invalid_argument(fmt::format("route {}: must start with /", pattern));

  Route r;
  r.pattern = pattern;
  r.handler = std::move(h);
  auto parts = split_segments(pattern);
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const auto &s = parts[i];
    if (s.size() >= 2 && s.front() == '{' && s.back() == '}') {
      auto inner = s.substr(1, s.size() - 2);
      auto colon = inner.find(':');
      if (colon == std::string::npos) {
        if (inner.empty())
          throw std::invalid_argument(fmt::format("route {}: empty variable name", pattern));
        r.segments.push_back({Segment::Var, inner});
        continue;
      }
      if (inner.substr(colon + 1) != ".*" || colon == 0)
        throw std::invalid_argument(
            fmt::format("route {}: unsupported variable {}", pattern, s));
      if (i + 1 != parts.size())
        throw std::invalid_argument(
            fmt::format("route {}: {} must be the last segment", pattern, s));
      r.segments.push_back({Segment::Rest, inner.substr(0, colon)});
      continue;
    }
    if (s.find_first_of("{}") != std::string::npos)
      throw std::invalid_argument(fmt::format("route {}: bad segment {}", pattern, s));
    r.segments.push_back({Segment::Literal, s});
  }
  routes_.push_back(std::move(r));
}

bool Router::match_route(const Route &r, const std::string &path,
                         std::unordered_map<std::string, std::string> *params) {
  std::unordered_map<std::string, std::string> got;
  std::size_t pos = 1;
  for (std::size_t i = 0; i < r.segments.size(); ++i) {
    const auto &seg = r.segments[i];
    if (seg.kind == Segment::Rest) {
      got[seg.text] = path.substr(pos);
      break;
    }
    bool last = i + 1 == r.segments.size();
    auto slash = path.find('/', pos);
    if (last != (slash == std::string::npos))
      return false;
    auto text = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (seg.kind == Segment::Literal && text != seg.text)
      return false;
    if (seg.kind == Segment::Var) {
      if (text.empty())
        return false;
      got[seg.text] = text;
    }
    if (!last)
      pos = slash + 1;
  }
  if (params)
    *params = std::move(got);
  return true;
}

int Router::match(const std::string &path,
                  std::unordered_map<std::string, std::string> *params) const {
  if (path.empty() || path[0] != '/')
    return -1;
  for (std::size_t i = 0; i < routes_.size(); ++i) {
    if (match_route(routes_[i], path, params))
      return static_cast<int>(i);
  }
  return -1;
}

static std::string encode_path(const std::string &p) {
  std::string out;
  std::size_t pos = 0;
  for (;;) {
    auto slash = p.find('/', pos);
    out += http::percent_encode(p.substr(pos, slash == std::string::npos ? std::string::npos
                                                                         : slash - pos));
    if (slash == std::string::npos)
      return out;
    out += '/';
    pos = slash + 1;
  }
}

http::Response Router::dispatch(http::Request req) const {
  if (req.path.empty() || req.path[0] != '/')
    return http::text_response(404, "404 page not found\n");

  auto clean = http::clean_path(req.path);
  if (clean != req.path) {
    http::Response r;
    r.status = 301;
    auto loc = encode_path(clean);
    if (!req.query.empty())
      loc += "?" + req.query;
    r.headers.emplace_back("Location", loc);
    return r;
  }

  std::unordered_map<std::string, std::string> params;
  int idx = match(req.path, &params);
  if (idx < 0)
    return http::text_response(404, "404 page not found\n");
  req.params = std::move(params);
  return routes_[static_cast<std::size_t>(idx)].handler(std::move(req));
}

} // namespace metaguard
