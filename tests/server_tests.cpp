#include "test_support.hpp"

#include <catch2/catch_all.hpp>
#include <metaguard/server.hpp>
#include <metaguard/stream.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

using namespace metaguard;
using namespace std::chrono_literals;

namespace {

struct MapFinder : RoleFinder {
  std::map<std::string, std::string> roles;
  std::optional<std::string> find_role(const Context &, const std::string &identity,
                                       Error *) override {
    auto it = roles.find(identity);
    return it == roles.end() ? std::string() : it->second;
  }
};

struct StubProvider : CredentialsProvider {
  std::atomic<int> calls{0};
  std::optional<std::string> credentials_for_role(const Context &, const std::string &role,
                                                  Error *) override {
    ++calls;
    return "{\"role\":\"" + role + "\"}";
  }
};

struct RecordingForwarder : Forwarder {
  std::mutex mu;
  std::vector<std::string> paths;
  http::Response forward(const http::Request &req) override {
    std::lock_guard<std::mutex> lk(mu);
    paths.push_back(req.raw_path);
    return http::text_response(200, "upstream:" + req.raw_path);
  }
};

ServerConfig loopback_config() {
  ServerConfig cfg;
  cfg.listen_address = "127.0.0.1";
  cfg.listen_port = 0;
  cfg.max_handler_duration = 1s;
  return cfg;
}

// Runs serve() on a thread for the lifetime of the object.
struct Running {
  Server &server;
  std::thread th;
  bool ok = false;
  std::string err;

  explicit Running(Server &s) : server(s) {
    th = std::thread([this] { ok = server.serve(&err); });
    REQUIRE(server.wait_started(5s));
  }
  ~Running() {
    CHECK(server.stop(Context::with_timeout(Context(), 2s)));
    th.join();
  }
};

http::Response get(unsigned short port, const std::string &target) {
  HttpClient client(5s);
  http::Request r;
  r.method = "GET";
  r.target = target;
  r.headers.emplace_back("Host", "169.254.169.254");
  std::string err;
  auto resp = client.round_trip("127.0.0.1", std::to_string(port), r, Context(), &err);
  REQUIRE(resp);
  return *resp;
}

} // namespace

TEST_CASE("stop before serve is a no-op") {
  Server s(loopback_config(), std::make_shared<MapFinder>(), std::make_shared<StubProvider>(),
           std::make_shared<MetricsRegistry>());
  REQUIRE(s.stop(Context()));
  REQUIRE(s.state() == ServerState::Idle);
  REQUIRE(s.stop(Context()));
  REQUIRE(s.state() == ServerState::Idle);
}

TEST_CASE("serve then stop drains and stops once") {
  Server s(loopback_config(), std::make_shared<MapFinder>(), std::make_shared<StubProvider>(),
           std::make_shared<MetricsRegistry>(), std::make_shared<RecordingForwarder>());
  std::thread th;
  bool ok = false;
  std::string err;
  th = std::thread([&] { ok = s.serve(&err); });
  REQUIRE(s.wait_started(5s));
  REQUIRE(s.state() == ServerState::Running);
  REQUIRE(s.bound_port() != 0);

  REQUIRE(s.stop(Context()));
  REQUIRE(s.state() == ServerState::Stopped);
  REQUIRE(s.stop(Context()));
  REQUIRE(s.state() == ServerState::Stopped);
  th.join();
  REQUIRE(ok);

  REQUIRE_FALSE(s.serve(&err));
  REQUIRE(err == "server already stopped");
}

TEST_CASE("serve fails on an invalid metadata endpoint or busy port") {
  auto cfg = loopback_config();
  cfg.metadata_endpoint = "ftp://nowhere";
  Server bad(cfg, std::make_shared<MapFinder>(), std::make_shared<StubProvider>(),
             std::make_shared<MetricsRegistry>());
  std::string err;
  REQUIRE_FALSE(bad.serve(&err));
  REQUIRE(err.find("metadata endpoint") == 0);

  testing::LoopbackServer taken([](http::Request) { return http::Response{}; });
  cfg = loopback_config();
  cfg.listen_port = taken.port();
  Server busy(cfg, std::make_shared<MapFinder>(), std::make_shared<StubProvider>(),
              std::make_shared<MetricsRegistry>());
  REQUIRE_FALSE(busy.serve(&err));
  REQUIRE(err.find("bind tcp 127.0.0.1:") == 0);
  REQUIRE(busy.state() == ServerState::Idle);
}

TEST_CASE("intercepted paths are answered locally") {
  auto finder = std::make_shared<MapFinder>();
  finder->roles["127.0.0.1"] = "web";
  auto provider = std::make_shared<StubProvider>();
  auto metrics = std::make_shared<MetricsRegistry>();
  auto fwd = std::make_shared<RecordingForwarder>();
  Server s(loopback_config(), finder, provider, metrics, fwd);
  Running run(s);
  auto port = s.bound_port();

  auto role = get(port, "/latest/meta-data/iam/security-credentials/");
  REQUIRE(role.status == 200);
  REQUIRE(role.body == "web");

  auto creds = get(port, "/latest/meta-data/iam/security-credentials/web");
  REQUIRE(creds.status == 200);
  REQUIRE(creds.body == "{\"role\":\"web\"}");

  auto denied = get(port, "/latest/meta-data/iam/security-credentials/admin");
  REQUIRE(denied.status == 403);
  REQUIRE(denied.body == "role forbidden\n");
  REQUIRE(provider->calls == 1);

  auto sneaky = get(port, "/latest/meta-data/iam/x/../security-credentials/admin");
  REQUIRE(sneaky.status == 301);

  auto other = get(port, "/latest/meta-data/instance-id");
  REQUIRE(other.body == "upstream:/latest/meta-data/instance-id");

  REQUIRE(get(port, "/ping").body == "pong");

  REQUIRE(metrics->count("roleName", "2xx") == 1);
  REQUIRE(metrics->count("credentials", "2xx") == 1);
  REQUIRE(metrics->count("credentials", "4xx") == 1);
  REQUIRE(metrics->total_responses() == 3);

  auto exposition = get(port, "/metrics");
  REQUIRE(exposition.body.find("handler=\"credentials\",status=\"4xx\"} 1") != std::string::npos);

  std::lock_guard<std::mutex> lk(fwd->mu);
  REQUIRE(fwd->paths == std::vector<std::string>{"/latest/meta-data/instance-id"});
}

TEST_CASE("identity override only when enabled") {
  auto finder = std::make_shared<MapFinder>();
  finder->roles["10.9.9.9"] = "other";
  auto cfg = loopback_config();

  {
    Server s(cfg, finder, std::make_shared<StubProvider>(), std::make_shared<MetricsRegistry>(),
             std::make_shared<RecordingForwarder>());
    Running run(s);
    auto resp = get(s.bound_port(), "/latest/meta-data/iam/security-credentials/?ip=10.9.9.9");
    REQUIRE(resp.status == 404);
  }

  cfg.allow_ip_query = true;
  Server s(cfg, finder, std::make_shared<StubProvider>(), std::make_shared<MetricsRegistry>(),
           std::make_shared<RecordingForwarder>());
  Running run(s);
  auto resp = get(s.bound_port(), "/latest/meta-data/iam/security-credentials/?ip=10.9.9.9");
  REQUIRE(resp.status == 200);
  REQUIRE(resp.body == "other");
}

TEST_CASE("stop cuts off requests that outlive the drain deadline") {
  struct SlowForwarder : Forwarder {
    http::Response forward(const http::Request &req) override {
      while (!req.context.done())
        std::this_thread::sleep_for(5ms);
      return http::text_response(503, "cancelled");
    }
  };
  Server s(loopback_config(), std::make_shared<MapFinder>(), std::make_shared<StubProvider>(),
           std::make_shared<MetricsRegistry>(), std::make_shared<SlowForwarder>());
  std::thread th;
  bool ok = false;
  std::string err;
  th = std::thread([&] { ok = s.serve(&err); });
  REQUIRE(s.wait_started(5s));
  auto port = s.bound_port();

  std::thread client([port] {
    HttpClient c(5s);
    http::Request r;
    r.method = "GET";
    r.target = "/slow";
    std::string e;
    // the connection is force-closed, so no response is expected
    (void)c.round_trip("127.0.0.1", std::to_string(port), r, Context(), &e);
  });
  std::this_thread::sleep_for(200ms);

  auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(s.stop(Context::with_timeout(Context(), 300ms)));
  auto took = std::chrono::steady_clock::now() - start;
  REQUIRE(took < 2s);
  REQUIRE(s.state() == ServerState::Stopped);

  client.join();
  th.join();
  REQUIRE(ok);
}

TEST_CASE("stop lets an in-flight request finish") {
  struct SleepyForwarder : Forwarder {
    std::atomic<bool> entered{false};
    http::Response forward(const http::Request &) override {
      entered = true;
      std::this_thread::sleep_for(200ms);
      return http::text_response(200, "late but complete");
    }
  };
  auto fwd = std::make_shared<SleepyForwarder>();
  Server s(loopback_config(), std::make_shared<MapFinder>(), std::make_shared<StubProvider>(),
           std::make_shared<MetricsRegistry>(), fwd);
  bool ok = false;
  std::string err;
  std::thread th([&] { ok = s.serve(&err); });
  REQUIRE(s.wait_started(5s));
  auto port = s.bound_port();

  std::optional<http::Response> got;
  std::thread client([&] {
    HttpClient c(5s);
    http::Request r;
    r.method = "GET";
    r.target = "/latest/meta-data/ami-id";
    r.headers.emplace_back("Host", "169.254.169.254");
    std::string e;
    got = c.round_trip("127.0.0.1", std::to_string(port), r, Context(), &e);
  });
  for (int i = 0; i < 400 && !fwd->entered; i++)
    std::this_thread::sleep_for(5ms);
  REQUIRE(fwd->entered);

  auto start = std::chrono::steady_clock::now();
  bool drained = s.stop(Context::with_timeout(Context(), 3s));
  auto took = std::chrono::steady_clock::now() - start;
  client.join();
  th.join();

  REQUIRE(drained);
  REQUIRE(took < 3s);
  REQUIRE(ok);
  REQUIRE(got);
  REQUIRE(got->status == 200);
  REQUIRE(got->body == "late but complete");
}

TEST_CASE("stop waits for a request body that is still arriving") {
  auto fwd = std::make_shared<RecordingForwarder>();
  Server s(loopback_config(), std::make_shared<MapFinder>(), std::make_shared<StubProvider>(),
           std::make_shared<MetricsRegistry>(), fwd);
  bool ok = false;
  std::string err;
  std::thread th([&] { ok = s.serve(&err); });
  REQUIRE(s.wait_started(5s));

  Stream c;
  auto deadline = Stream::clock::now() + 10s;
  REQUIRE(c.connect("127.0.0.1", std::to_string(s.bound_port()), deadline, &err));
  REQUIRE(c.write("POST /latest/user-data HTTP/1.1\r\nHost: 169.254.169.254\r\n"
                  "Content-Length: 4\r\n\r\nab",
                  deadline, &err));
  std::this_thread::sleep_for(200ms);

  std::atomic<bool> drained{false};
  std::thread stopper([&] { drained = s.stop(Context::with_timeout(Context(), 3s)); });
  std::this_thread::sleep_for(200ms);

  REQUIRE(c.write("cd", deadline, &err));
  std::string out;
  REQUIRE(c.read_to_eof(out, 1 << 20, deadline, &err));
  stopper.join();
  th.join();

  REQUIRE(out.rfind("HTTP/1.1 200 ", 0) == 0);
  REQUIRE(out.substr(out.size() - 26) == "upstream:/latest/user-data");
  REQUIRE(drained);
  REQUIRE(s.state() == ServerState::Stopped);
  std::lock_guard<std::mutex> lk(fwd->mu);
  REQUIRE(fwd->paths == std::vector<std::string>{"/latest/user-data"});
}
