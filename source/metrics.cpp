#include <metaguard/metrics.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace metaguard {

static std::vector<double> default_bounds_seconds() {
  // ~0.5ms .. 10s
  return {
      0.0005, 0.001, 0.002, 0.005,
      0.010,  0.020, 0.050,
      0.100,  0.200, 0.500,
      1.0,    2.0,   5.0, 10.0
  };
}

Hist::Hist() : Hist(default_bounds_seconds()) {}

Hist::Hist(std::vector<double> b)
    : bounds(std::move(b)),
      buckets(bounds.size() + 1, 0) {
  std::sort(bounds.begin(), bounds.end());
}

void Hist::observe_locked(double v) {
  auto it = std::lower_bound(bounds.begin(), bounds.end(), v);
  buckets[static_cast<std::size_t>(std::distance(bounds.begin(), it))] += 1;
  count += 1;
  sum += v;
}

std::string status_bucket(int status) {
  if (status >= 200 && status < 300) return "2xx";
  if (status >= 300 && status < 400) return "3xx";
  if (status >= 400 && status < 500) return "4xx";
  if (status >= 500 && status < 600) return "5xx";
  return "unknown";
}

void MetricsRegistry::mark_response(const std::string& handler, int status) {
  std::lock_guard<std::mutex> lk(mu_);
  responses_[{handler, status_bucket(status)}] += 1;
}

void MetricsRegistry::observe_latency(const std::string& handler, double seconds) {
  std::lock_guard<std::mutex> lk(mu_);
  latency_[handler].observe_locked(seconds);
}

void MetricsRegistry::add_abandoned(const std::string& handler, int64_t delta) {
  std::lock_guard<std::mutex> lk(mu_);
  abandoned_[handler] += delta;
}

uint64_t MetricsRegistry::count(const std::string& handler, const std::string& bucket) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = responses_.find({handler, bucket});
  return it == responses_.end() ? 0 : it->second;
}

uint64_t MetricsRegistry::total_responses() const {
  std::lock_guard<std::mutex> lk(mu_);
  uint64_t n = 0;
  for (const auto& kv : responses_) n += kv.second;
  return n;
}

uint64_t MetricsRegistry::latency_count(const std::string& handler) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = latency_.find(handler);
  return it == latency_.end() ? 0 : it->second.count;
}

int64_t MetricsRegistry::abandoned(const std::string& handler) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = abandoned_.find(handler);
  return it == abandoned_.end() ? 0 : it->second;
}

static void render_hist(std::ostringstream& os,
                        const std::string& metric_base,
                        const std::string& handler,
                        const Hist& h) {
  // Prometheus wants cumulative buckets.
  uint64_t running = 0;
  for (std::size_t i = 0; i < h.bounds.size(); ++i) {
    running += h.buckets[i];
    os << metric_base << "_bucket{handler=\"" << handler << "\",le=\""
       << std::setprecision(6) << std::fixed << h.bounds[i]
       << "\"} " << running << "\n";
  }
  running += h.buckets.back();
  os << metric_base << "_bucket{handler=\"" << handler << "\",le=\"+Inf\"} "
     << running << "\n";
  os << metric_base << "_sum{handler=\"" << handler << "\"} "
     << std::setprecision(9) << std::fixed << h.sum << "\n";
  os << metric_base << "_count{handler=\"" << handler << "\"} " << h.count << "\n";
}

std::string MetricsRegistry::render_prometheus() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::ostringstream os;

  os << "# HELP metaguard_handler_responses_total Responses by handler and status class\n";
  os << "# TYPE metaguard_handler_responses_total counter\n";
  for (const auto& kv : responses_) {
    os << "metaguard_handler_responses_total{handler=\"" << kv.first.first
       << "\",status=\"" << kv.first.second << "\"} " << kv.second << "\n";
  }

  os << "# HELP metaguard_handler_latency_seconds Handler latency in seconds\n";
  os << "# TYPE metaguard_handler_latency_seconds histogram\n";
  for (const auto& kv : latency_)
    render_hist(os, "metaguard_handler_latency_seconds", kv.first, kv.second);

  os << "# HELP metaguard_abandoned_workers Timed-out handler workers still running\n";
  os << "# TYPE metaguard_abandoned_workers gauge\n";
  for (const auto& kv : abandoned_) {
    os << "metaguard_abandoned_workers{handler=\"" << kv.first << "\"} " << kv.second
       << "\n";
  }

  return os.str();
}

} // namespace metaguard
