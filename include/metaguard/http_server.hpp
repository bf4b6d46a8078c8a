#pragma once
#include <metaguard/context.hpp>
#include <metaguard/http.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace metaguard {

struct ListenerOptions {
  std::chrono::milliseconds read_header_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds read_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds write_timeout{std::chrono::seconds(30)};
  std::size_t max_body_bytes = 10u << 20;
  // Connections above this get a 503 and are closed; 0 disables the limit.
  std::size_t max_connections = 1024;
};

// Listening socket plus one thread per accepted connection. Each connection
// carries a single request (Connection: close).
class HttpServer {
public:
  using Handler = std::function<http::Response(http::Request)>;

  explicit HttpServer(Handler h, ListenerOptions opts = {});
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  bool listen(const std::string &addr, unsigned short port, std::string *err);

  // Bound address as host:port, valid after listen().
  std::string address() const;
  unsigned short port() const;

  // Accept loop. Returns once shutdown() has been called.
  void run();

  // Stops accepting and closes connections still waiting for a request head
  // at once, then waits for in-flight requests until the deadline and
  // force-closes what is left.
  // Returns false when connections had to be forced.
  bool shutdown(Context::clock::time_point deadline);

  std::size_t open_connections() const;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace metaguard
