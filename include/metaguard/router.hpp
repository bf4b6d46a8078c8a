#pragma once
#include <metaguard/http.hpp>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace metaguard {

// Path-pattern router. "{name}" matches one non-empty segment and
// "{name:.*}" the rest of the path. Routes are tried in registration order.
class Router {
public:
  using Handler = std::function<http::Response(http::Request)>;

  // Throws std::invalid_argument for a malformed pattern.
  void handle(const std::string &pattern, Handler h);

  http::Response dispatch(http::Request req) const;

  // Index of the first matching route, or -1.
  int match(const std::string &path, std::unordered_map<std::string, std::string> *params) const;

  std::size_t size() const { return routes_.size(); }

private:
  struct Segment {
    enum Kind { Literal, Var, Rest } kind;
    std::string text; // literal text or variable name
  };
  struct Route {
    std::string pattern;
    std::vector<Segment> segments;
    Handler handler;
  };

  static bool match_route(const Route &r, const std::string &path,
                          std::unordered_map<std::string, std::string> *params);

  std::vector<Route> routes_;
};

} // namespace metaguard
