#include <metaguard/guard.hpp>
#include <metaguard/handlers.hpp>
#include <metaguard/identity.hpp>
#include <metaguard/logging.hpp>
#include <metaguard/server.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace metaguard {

const char *to_string(ServerState s) {
  switch (s) {
  case ServerState::Idle:
    return "idle";
  case ServerState::Running:
    return "running";
  case ServerState::Draining:
    return "draining";
  case ServerState::Stopped:
    return "stopped";
  }
  return "unknown";
}

Server::Server(ServerConfig cfg, std::shared_ptr<RoleFinder> finder,
               std::shared_ptr<CredentialsProvider> credentials,
               std::shared_ptr<MetricsRegistry> metrics, std::shared_ptr<Forwarder> forwarder)
    : cfg_(std::move(cfg)), finder_(std::move(finder)), credentials_(std::move(credentials)),
      metrics_(std::move(metrics)), forwarder_(std::move(forwarder)) {}

Server::~Server() {
  if (!stop(Context::with_timeout(Context(), std::chrono::seconds(0))))
    spdlog::warn("server destroyed with requests in flight");
}

std::shared_ptr<Router> Server::build_router(const Url &metadata) const {
  HttpClient client(cfg_.upstream_timeout);
  LifecycleGuard guard(metrics_, std::make_shared<ClientIdentityResolver>(cfg_.allow_ip_query),
                       cfg_.max_handler_duration);
  std::shared_ptr<Forwarder> fwd =
      forwarder_ ? forwarder_ : std::make_shared<UpstreamForwarder>(metadata, client);
  auto metrics = metrics_;

  auto r = std::make_shared<Router>();
  r->handle("/metrics", [metrics](http::Request) {
    http::Response resp;
    resp.headers.emplace_back("Content-Type", "text/plain; version=0.0.4");
    resp.body = metrics->render_prometheus();
    return resp;
  });
  r->handle("/ping", [](http::Request) { return http::text_response(200, "pong"); });
  r->handle("/health",
            guard.wrap(HealthHandler::kName, std::make_shared<HealthHandler>(metadata, client),
                       false));
  r->handle("/{version}/meta-data/iam/security-credentials/",
            guard.wrap(RoleHandler::kName, std::make_shared<RoleHandler>(finder_), true));
  r->handle("/{version}/meta-data/iam/security-credentials/{role:.*}",
            guard.wrap(CredentialsHandler::kName,
                       std::make_shared<CredentialsHandler>(finder_, credentials_), true));
  r->handle("/{path:.*}", [fwd](http::Request req) { return fwd->forward(req); });
  return r;
}

bool Server::serve(std::string *err) {
  std::string e;
  auto metadata = parse_url(cfg_.metadata_endpoint, &e);
  if (!metadata) {
    if (err)
      *err = fmt::format("metadata endpoint: {}", e);
    return false;
  }

  std::shared_ptr<HttpServer> rt;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != ServerState::Idle) {
      if (err)
        *err = fmt::format("server already {}", to_string(state_));
      return false;
    }
    auto router = build_router(*metadata);
    rt = std::make_shared<HttpServer>(
        with_access_log([router](http::Request req) { return router->dispatch(std::move(req)); }),
        cfg_.listener);
    if (!rt->listen(cfg_.listen_address, cfg_.listen_port, &e)) {
      start_failed_ = true;
      cv_.notify_all();
      if (err)
        *err = e;
      return false;
    }
    start_failed_ = false;
    runtime_ = rt;
    state_ = ServerState::Running;
    cv_.notify_all();
  }

  spdlog::info("listening {}", rt->address());
  rt->run();
  return true;
}

bool Server::stop(const Context &ctx) {
  std::shared_ptr<HttpServer> rt;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != ServerState::Running)
      return true;
    state_ = ServerState::Draining;
    rt = runtime_;
  }

  auto deadline = Context::clock::now() + kMaxDrain;
  if (auto d = ctx.deadline(); d && *d < deadline)
    deadline = *d;

  spdlog::info("draining {} connection(s)", rt->open_connections());
  bool drained = rt->shutdown(deadline);
  spdlog::info("server stopped");

  std::lock_guard<std::mutex> lk(mu_);
  state_ = ServerState::Stopped;
  cv_.notify_all();
  return drained;
}

ServerState Server::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

bool Server::wait_started(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [&] { return state_ != ServerState::Idle || start_failed_; }) &&
         state_ != ServerState::Idle;
}

unsigned short Server::bound_port() const {
  std::lock_guard<std::mutex> lk(mu_);
  return runtime_ ? runtime_->port() : 0;
}

std::string Server::bound_address() const {
  std::lock_guard<std::mutex> lk(mu_);
  return runtime_ ? runtime_->address() : std::string();
}

} // namespace metaguard
