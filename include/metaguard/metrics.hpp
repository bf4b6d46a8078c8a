#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace metaguard {

struct Hist {
  std::vector<double>   bounds;
  std::vector<uint64_t> buckets;
  uint64_t              count{0};
  double                sum{0.0};

  Hist();
  explicit Hist(std::vector<double> b);

  void observe_locked(double v);
};

// "2xx" .. "5xx" for 200..599, "unknown" for anything else.
std::string status_bucket(int status);

// Process-wide response counters, handler latency and the number of handler
// workers that were abandoned and are still running. Counters only ever grow;
// there is no reset.
class MetricsRegistry {
public:
  MetricsRegistry() = default;

  void mark_response(const std::string& handler, int status);
  void observe_latency(const std::string& handler, double seconds);
  void add_abandoned(const std::string& handler, int64_t delta);

  uint64_t count(const std::string& handler, const std::string& bucket) const;
  uint64_t total_responses() const;
  uint64_t latency_count(const std::string& handler) const;
  int64_t abandoned(const std::string& handler) const;

  std::string render_prometheus() const;

private:
  mutable std::mutex mu_;

  // ordered so the exposition output is stable
  std::map<std::pair<std::string, std::string>, uint64_t> responses_;
  std::map<std::string, Hist> latency_;
  std::map<std::string, int64_t> abandoned_;
};

} // namespace metaguard
