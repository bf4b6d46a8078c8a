#pragma once
#include <metaguard/context.hpp>
#include <metaguard/error.hpp>
#include <metaguard/http.hpp>
#include <metaguard/identity.hpp>
#include <metaguard/metrics.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace metaguard {

// Everything a guarded handler may look at. The worker thread owns its copy.
struct Call {
  Context ctx;
  http::Request request;
  std::string identity; // empty when the route does not need one
};

struct HandlerResult {
  int status = 200;
  std::optional<Error> error;

  static HandlerResult ok(int status = 200) { return {status, std::nullopt}; }
  static HandlerResult fail(Error e) {
    int st = e.status;
    return {st, std::move(e)};
  }
};

class Handler {
public:
  virtual ~Handler() = default;

  // Fills `out` (headers and body) on success. The guard sets the status.
  virtual HandlerResult handle(const Call &call, http::Response &out) = 0;
};

// Runs a handler with a deadline, identity resolution, metrics and error
// reporting around it.
class LifecycleGuard {
public:
  using Wrapped = std::function<http::Response(http::Request)>;

  LifecycleGuard(std::shared_ptr<MetricsRegistry> metrics,
                 std::shared_ptr<ClientIdentityResolver> resolver,
                 std::chrono::milliseconds max_duration)
      : metrics_(std::move(metrics)), resolver_(std::move(resolver)),
        max_duration_(max_duration) {}

  Wrapped wrap(std::string name, std::shared_ptr<Handler> h, bool needs_identity) const;

  http::Response invoke(const std::string &name, const std::shared_ptr<Handler> &h,
                        bool needs_identity, http::Request req) const;

  std::chrono::milliseconds max_duration() const { return max_duration_; }

private:
  std::shared_ptr<MetricsRegistry> metrics_;
  std::shared_ptr<ClientIdentityResolver> resolver_;
  std::chrono::milliseconds max_duration_;
};

} // namespace metaguard
