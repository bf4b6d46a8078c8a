#pragma once
#include <metaguard/context.hpp>
#include <metaguard/credentials.hpp>
#include <metaguard/forwarder.hpp>
#include <metaguard/http_server.hpp>
#include <metaguard/metrics.hpp>
#include <metaguard/role_finder.hpp>
#include <metaguard/router.hpp>
#include <metaguard/url.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace metaguard {

struct ServerConfig {
  std::string listen_address = "0.0.0.0";
  unsigned short listen_port = 8181;
  std::string metadata_endpoint = "http://169.254.169.254";
  bool allow_ip_query = false;
  std::chrono::milliseconds max_handler_duration{std::chrono::seconds(5)};
  std::chrono::milliseconds upstream_timeout{std::chrono::seconds(30)};
  ListenerOptions listener;
};

enum class ServerState { Idle, Running, Draining, Stopped };

const char *to_string(ServerState s);

// The interception proxy: routes security-sensitive metadata paths to guarded
// handlers and everything else to the forwarder.
class Server {
public:
  static constexpr std::chrono::seconds kMaxDrain{5};

  // A null forwarder means an UpstreamForwarder bound to the metadata endpoint.
  Server(ServerConfig cfg, std::shared_ptr<RoleFinder> finder,
         std::shared_ptr<CredentialsProvider> credentials,
         std::shared_ptr<MetricsRegistry> metrics,
         std::shared_ptr<Forwarder> forwarder = nullptr);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  // Binds and blocks until stop(). False with *err when the endpoint URL is
  // invalid, binding fails or the server was already started.
  bool serve(std::string *err);

  // Drains in-flight requests for at most kMaxDrain (or the context deadline
  // when earlier). No-op unless running. False when requests were still open
  // at the deadline and had to be cut off.
  bool stop(const Context &ctx);

  ServerState state() const;

  // Waits until serve() has bound its listener or given up.
  bool wait_started(std::chrono::milliseconds timeout) const;

  unsigned short bound_port() const;
  std::string bound_address() const;

  const ServerConfig &config() const { return cfg_; }

private:
  std::shared_ptr<Router> build_router(const Url &metadata) const;

  const ServerConfig cfg_;
  std::shared_ptr<RoleFinder> finder_;
  std::shared_ptr<CredentialsProvider> credentials_;
  std::shared_ptr<MetricsRegistry> metrics_;
  std::shared_ptr<Forwarder> forwarder_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  ServerState state_ = ServerState::Idle;
  bool start_failed_ = false;
  std::shared_ptr<HttpServer> runtime_;
};

} // namespace metaguard
