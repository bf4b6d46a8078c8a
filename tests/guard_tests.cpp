#include <catch2/catch_all.hpp>
#include <metaguard/guard.hpp>

#include <atomic>
#include <functional>
#include <stdexcept>
#include <thread>

using namespace metaguard;
using namespace std::chrono_literals;

namespace {

struct FuncHandler : Handler {
  std::function<HandlerResult(const Call &, http::Response &)> fn;
  explicit FuncHandler(std::function<HandlerResult(const Call &, http::Response &)> f)
      : fn(std::move(f)) {}
  HandlerResult handle(const Call &call, http::Response &out) override { return fn(call, out); }
};

http::Request make_request(const std::string &remote = "10.1.2.3:5555") {
  http::Request r;
  r.method = "GET";
  r.target = r.raw_path = r.path = "/latest/meta-data/iam/security-credentials/";
  r.remote_address = remote;
  return r;
}

} // namespace

TEST_CASE("guard passes the resolved identity and the handler response") {
  auto metrics = std::make_shared<MetricsRegistry>();
  LifecycleGuard g(metrics, std::make_shared<ClientIdentityResolver>(false), 1s);

  std::string seen;
  auto h = std::make_shared<FuncHandler>([&](const Call &c, http::Response &out) {
    seen = c.identity;
    out.body = "web";
    return HandlerResult::ok();
  });

  auto resp = g.invoke("roleName", h, true, make_request());
  REQUIRE(resp.status == 200);
  REQUIRE(resp.body == "web");
  REQUIRE(seen == "10.1.2.3");
  REQUIRE(metrics->count("roleName", "2xx") == 1);
  REQUIRE(metrics->total_responses() == 1);
}

TEST_CASE("guard counts exactly one response per invocation") {
  auto metrics = std::make_shared<MetricsRegistry>();
  LifecycleGuard g(metrics, std::make_shared<ClientIdentityResolver>(false), 1s);

  for (int status : {200, 404, 503, 999}) {
    auto h = std::make_shared<FuncHandler>([status](const Call &, http::Response &) {
      if (status >= 400 && status < 600)
        return HandlerResult::fail(Error::upstream(status, "nope"));
      return HandlerResult::ok(status);
    });
    auto resp = g.wrap("h", h, false)(make_request());
    REQUIRE(resp.status == status);
  }

  REQUIRE(metrics->count("h", "2xx") == 1);
  REQUIRE(metrics->count("h", "4xx") == 1);
  REQUIRE(metrics->count("h", "5xx") == 1);
  REQUIRE(metrics->count("h", "unknown") == 1);
  REQUIRE(metrics->total_responses() == 4);
  REQUIRE(metrics->latency_count("h") == 4);
}

TEST_CASE("guard writes the client message of an error as text") {
  auto metrics = std::make_shared<MetricsRegistry>();
  LifecycleGuard g(metrics, std::make_shared<ClientIdentityResolver>(false), 1s);
  auto h = std::make_shared<FuncHandler>([](const Call &, http::Response &) {
    return HandlerResult::fail(Error::not_found("identity 10.1.2.3 has no entry"));
  });

  auto resp = g.invoke("roleName", h, true, make_request());
  REQUIRE(resp.status == 404);
  REQUIRE(resp.body == "no role for identity\n");
  REQUIRE(resp.header("Content-Type")->rfind("text/plain", 0) == 0);
}

TEST_CASE("guard answers 400 for an unparsable client address") {
  auto metrics = std::make_shared<MetricsRegistry>();
  LifecycleGuard g(metrics, std::make_shared<ClientIdentityResolver>(false), 1s);
  std::atomic<bool> called{false};
  auto h = std::make_shared<FuncHandler>([&](const Call &, http::Response &) {
    called = true;
    return HandlerResult::ok();
  });

  auto resp = g.invoke("credentials", h, true, make_request("garbage"));
  REQUIRE(resp.status == 400);
  REQUIRE(resp.body == "bad request\n");
  REQUIRE_FALSE(called.load());
  REQUIRE(metrics->count("credentials", "4xx") == 1);
}

TEST_CASE("guard turns a throwing handler into 500") {
  auto metrics = std::make_shared<MetricsRegistry>();
  LifecycleGuard g(metrics, std::make_shared<ClientIdentityResolver>(false), 1s);
  auto h = std::make_shared<FuncHandler>([](const Call &, http::Response &) -> HandlerResult {
    throw std::runtime_error("boom");
  });

  auto resp = g.invoke("health", h, false, make_request());
  REQUIRE(resp.status == 500);
  REQUIRE(resp.body == "internal error\n");
  REQUIRE(metrics->count("health", "5xx") == 1);
}

TEST_CASE("guard abandons a handler that never returns") {
  auto metrics = std::make_shared<MetricsRegistry>();
  LifecycleGuard g(metrics, std::make_shared<ClientIdentityResolver>(false), 200ms);

  auto release = std::make_shared<std::atomic<bool>>(false);
  auto saw_cancel = std::make_shared<std::atomic<bool>>(false);
  auto h = std::make_shared<FuncHandler>([release, saw_cancel](const Call &c, http::Response &) {
    while (!release->load()) {
      if (c.ctx.done())
        saw_cancel->store(true);
      std::this_thread::sleep_for(5ms);
    }
    return HandlerResult::ok();
  });

  auto start = std::chrono::steady_clock::now();
  auto resp = g.invoke("credentials", h, true, make_request());
  auto took = std::chrono::steady_clock::now() - start;

  REQUIRE(resp.status == 504);
  REQUIRE(resp.body == "request timed out\n");
  REQUIRE(took >= 150ms);
  REQUIRE(took < 2s);
  REQUIRE(metrics->count("credentials", "5xx") == 1);

  std::this_thread::sleep_for(30ms);
  REQUIRE(saw_cancel->load());
  release->store(true);
}

TEST_CASE("abandoned workers are counted until they finish") {
  auto metrics = std::make_shared<MetricsRegistry>();
  LifecycleGuard g(metrics, std::make_shared<ClientIdentityResolver>(false), 100ms);

  auto release = std::make_shared<std::atomic<bool>>(false);
  auto h = std::make_shared<FuncHandler>([release](const Call &, http::Response &) {
    while (!release->load())
      std::this_thread::sleep_for(5ms);
    return HandlerResult::ok();
  });

  REQUIRE(g.invoke("credentials", h, true, make_request()).status == 504);
  REQUIRE(g.invoke("credentials", h, true, make_request()).status == 504);
  REQUIRE(metrics->abandoned("credentials") == 2);
  REQUIRE(metrics->render_prometheus().find(
              "metaguard_abandoned_workers{handler=\"credentials\"} 2\n") != std::string::npos);

  release->store(true);
  for (int i = 0; i < 200 && metrics->abandoned("credentials") != 0; i++)
    std::this_thread::sleep_for(5ms);
  REQUIRE(metrics->abandoned("credentials") == 0);
  REQUIRE(metrics->count("credentials", "5xx") == 2);
}

TEST_CASE("a handler that finishes in time is never counted as abandoned") {
  auto metrics = std::make_shared<MetricsRegistry>();
  LifecycleGuard g(metrics, std::make_shared<ClientIdentityResolver>(false), 1s);
  auto h = std::make_shared<FuncHandler>(
      [](const Call &, http::Response &) { return HandlerResult::ok(); });

  REQUIRE(g.invoke("health", h, false, make_request()).status == 200);
  REQUIRE(metrics->abandoned("health") == 0);
  REQUIRE(metrics->render_prometheus().find("metaguard_abandoned_workers{") == std::string::npos);
}

TEST_CASE("guard deadline follows the inbound request context") {
  auto metrics = std::make_shared<MetricsRegistry>();
  LifecycleGuard g(metrics, std::make_shared<ClientIdentityResolver>(false), 10s);
  auto release = std::make_shared<std::atomic<bool>>(false);
  auto h = std::make_shared<FuncHandler>([release](const Call &, http::Response &) {
    while (!release->load())
      std::this_thread::sleep_for(5ms);
    return HandlerResult::ok();
  });

  auto req = make_request();
  req.context.cancel();
  auto resp = g.invoke("roleName", h, true, std::move(req));
  REQUIRE(resp.status == 504);
  release->store(true);
}
