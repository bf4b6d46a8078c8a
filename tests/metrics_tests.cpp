#include <catch2/catch_all.hpp>
#include <metaguard/metrics.hpp>

using namespace metaguard;

TEST_CASE("status buckets") {
  REQUIRE(status_bucket(200) == "2xx");
  REQUIRE(status_bucket(299) == "2xx");
  REQUIRE(status_bucket(301) == "3xx");
  REQUIRE(status_bucket(404) == "4xx");
  REQUIRE(status_bucket(503) == "5xx");
  REQUIRE(status_bucket(199) == "unknown");
  REQUIRE(status_bucket(600) == "unknown");
  REQUIRE(status_bucket(0) == "unknown");
  REQUIRE(status_bucket(-1) == "unknown");
}

TEST_CASE("response counters are keyed by handler and bucket") {
  MetricsRegistry m;
  m.mark_response("credentials", 200);
  m.mark_response("credentials", 204);
  m.mark_response("credentials", 403);
  m.mark_response("roleName", 404);

  REQUIRE(m.count("credentials", "2xx") == 2);
  REQUIRE(m.count("credentials", "4xx") == 1);
  REQUIRE(m.count("roleName", "4xx") == 1);
  REQUIRE(m.count("roleName", "2xx") == 0);
  REQUIRE(m.total_responses() == 4);
}

TEST_CASE("prometheus exposition") {
  MetricsRegistry m;
  m.mark_response("health", 500);
  m.observe_latency("health", 0.003);
  m.observe_latency("health", 30.0);

  auto text = m.render_prometheus();
  REQUIRE(text.find("# TYPE metaguard_handler_responses_total counter") != std::string::npos);
  REQUIRE(text.find("metaguard_handler_responses_total{handler=\"health\",status=\"5xx\"} 1") !=
          std::string::npos);
  REQUIRE(text.find("metaguard_handler_latency_seconds_bucket{handler=\"health\",le=\"0.005000\"} 1") !=
          std::string::npos);
  REQUIRE(text.find("metaguard_handler_latency_seconds_bucket{handler=\"health\",le=\"+Inf\"} 2") !=
          std::string::npos);
  REQUIRE(text.find("metaguard_handler_latency_seconds_count{handler=\"health\"} 2") !=
          std::string::npos);
  REQUIRE(m.latency_count("health") == 2);
}

TEST_CASE("abandoned worker gauge goes up and back down") {
  MetricsRegistry m;
  m.add_abandoned("credentials", 1);
  m.add_abandoned("credentials", 1);
  m.add_abandoned("credentials", -1);

  REQUIRE(m.abandoned("credentials") == 1);
  REQUIRE(m.abandoned("roleName") == 0);
  auto text = m.render_prometheus();
  REQUIRE(text.find("# TYPE metaguard_abandoned_workers gauge") != std::string::npos);
  REQUIRE(text.find("metaguard_abandoned_workers{handler=\"credentials\"} 1\n") !=
          std::string::npos);

  m.add_abandoned("credentials", -1);
  REQUIRE(m.render_prometheus().find("metaguard_abandoned_workers{handler=\"credentials\"} 0\n") !=
          std::string::npos);
}
