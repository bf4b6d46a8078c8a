#include <metaguard/guard.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace metaguard {

namespace {

// Shared between the waiting request thread and the worker. Whoever finishes
// last frees it.
struct Invocation {
  Call call;
  std::mutex mu;
  std::condition_variable cv;
  bool finished = false;
  bool abandoned = false;
  HandlerResult result;
  http::Response response;
};

} // namespace

LifecycleGuard::Wrapped LifecycleGuard::wrap(std::string name, std::shared_ptr<Handler> h,
                                             bool needs_identity) const {
  auto self = *this;
  return [self, name = std::move(name), h = std::move(h),
          needs_identity](http::Request req) {
    return self.invoke(name, h, needs_identity, std::move(req));
  };
}

http::Response LifecycleGuard::invoke(const std::string &name,
                                      const std::shared_ptr<Handler> &h, bool needs_identity,
                                      http::Request req) const {
  using clock = Context::clock;
  auto start = clock::now();
  Context ctx = Context::with_timeout(req.context, max_duration_);

  auto inv = std::make_shared<Invocation>();
  inv->call.ctx = ctx;
  inv->call.request = std::move(req);
  const http::Request &r = inv->call.request;

  HandlerResult result;
  http::Response resp;
  bool have_identity = true;

  if (needs_identity) {
    std::string err;
    auto id = resolver_->resolve(r, &err);
    if (id) {
      inv->call.identity = *id;
    } else {
      have_identity = false;
      result = HandlerResult::fail(Error::bad_request(err));
    }
  }

  if (have_identity) {
    std::thread([inv, h, metrics = metrics_, name]() {
      HandlerResult res;
      http::Response out;
      try {
        res = h->handle(inv->call, out);
      } catch (const std::exception &e) {
        res = HandlerResult::fail(Error::internal(fmt::format("handler threw: {}", e.what())));
      }
      std::lock_guard<std::mutex> lk(inv->mu);
      inv->result = std::move(res);
      inv->response = std::move(out);
      inv->finished = true;
      inv->cv.notify_all();
      if (inv->abandoned) {
        spdlog::info("{}: abandoned worker finished", name);
        metrics->add_abandoned(name, -1);
      }
    }).detach();

    // The deadline is always set here; polling also picks up a cancelled
    // parent (server force-close).
    auto deadline = *ctx.deadline();
    std::unique_lock<std::mutex> lk(inv->mu);
    while (!inv->finished && !ctx.done()) {
      auto wake = std::min(deadline, clock::now() + std::chrono::milliseconds(50));
      inv->cv.wait_until(lk, wake);
    }
    if (inv->finished) {
      result = inv->result;
      resp = std::move(inv->response);
    } else {
      // Counted under the lock so the worker's decrement cannot come first.
      inv->abandoned = true;
      metrics_->add_abandoned(name, 1);
      lk.unlock();
      auto reason = ctx.reason();
      ctx.cancel();
      result = HandlerResult::fail(Error::timeout(
          fmt::format("handler {} abandoned after {}ms: {}", name,
                      std::chrono::duration_cast<std::chrono::milliseconds>(
                          clock::now() - start).count(),
                      reason.empty() ? "context deadline exceeded" : reason)));
    }
  }

  metrics_->mark_response(name, result.status);
  metrics_->observe_latency(name, std::chrono::duration<double>(clock::now() - start).count());

  if (result.error) {
    const Error &e = *result.error;
    spdlog::error("{}: {} {} remote={} identity={} status={}: {}", name, r.method, r.path,
                  r.remote_address, inv->call.identity.empty() ? "-" : inv->call.identity,
                  e.status, e.log_text());
    return http::text_response(e.status, e.message + "\n");
  }

  resp.status = result.status;
  return resp;
}

} // namespace metaguard
