#include <metaguard/cli.hpp>
#include <metaguard/credentials.hpp>
#include <metaguard/logging.hpp>
#include <metaguard/metrics.hpp>
#include <metaguard/role_finder.hpp>
#include <metaguard/server.hpp>
#include <metaguard/version.hpp>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <thread>

namespace {

int run(const metaguard::Options &o) {
  std::string err;
  if (!metaguard::setup_logging(o.log_level, &err)) {
    std::cerr << err << "\n";
    return 2;
  }

  auto finder = metaguard::StaticRoleFinder::load(o.role_map, &err);
  if (!finder) {
    spdlog::error("role map: {}", err);
    return 1;
  }
  spdlog::info("loaded {} role mapping(s) from {}", finder->size(), o.role_map);

  auto broker = metaguard::parse_url(o.credentials_url, &err);
  if (!broker) {
    spdlog::error("credentials url: {}", err);
    return 1;
  }
  auto credentials = std::make_shared<metaguard::HttpCredentialsProvider>(
      *broker, metaguard::HttpClient(o.upstream_timeout));

  metaguard::ServerConfig cfg;
  cfg.listen_address = o.bind;
  cfg.listen_port = o.port;
  cfg.metadata_endpoint = o.metadata_url;
  cfg.allow_ip_query = o.allow_ip_query;
  cfg.max_handler_duration = o.max_handler_duration;
  cfg.upstream_timeout = o.upstream_timeout;
  cfg.listener.max_connections = o.max_connections;

  metaguard::Server server(cfg, finder, credentials,
                           std::make_shared<metaguard::MetricsRegistry>());

  asio::io_context io;
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const asio::error_code &ec, int sig) {
    if (ec)
      return;
    spdlog::info("received signal {}, shutting down", sig);
    if (!server.stop(metaguard::Context::with_timeout(metaguard::Context(),
                                                      metaguard::Server::kMaxDrain)))
      spdlog::warn("drain deadline reached, remaining requests were cancelled");
  });
  std::thread sig_thread([&io] { io.run(); });

  spdlog::info("metaguard {} ({})", METAGUARD_VERSION, METAGUARD_COMMIT);
  bool ok = server.serve(&err);
  if (!ok)
    spdlog::error("serve: {}", err);

  // wait for an in-progress drain started from the signal handler
  signals.cancel();
  sig_thread.join();
  if (!server.stop(metaguard::Context::with_timeout(metaguard::Context(),
                                                    metaguard::Server::kMaxDrain)))
    spdlog::warn("drain deadline reached, remaining requests were cancelled");
  return ok ? 0 : 1;
}

} // namespace

int main(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  auto pr = metaguard::parse_cli(argc, argv);
  if (!pr.cmd) {
    std::cerr << pr.error << "\n\n" << metaguard::usage();
    return 2;
  }
  if (std::holds_alternative<metaguard::CmdHelp>(*pr.cmd)) {
    std::cout << metaguard::usage();
    return 0;
  }
  if (std::holds_alternative<metaguard::CmdVersion>(*pr.cmd)) {
    std::cout << "metaguard " << METAGUARD_VERSION << " (" << METAGUARD_COMMIT << ")\n";
    return 0;
  }
  return run(std::get<metaguard::Options>(*pr.cmd));
}
