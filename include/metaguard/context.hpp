#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace metaguard {

// Request-scoped cancellation handle. Copies share state; a derived context
// is done when its own deadline passes, when it is cancelled, or when any
// parent is done.
class Context {
public:
  using clock = std::chrono::steady_clock;

  Context();

  static Context with_deadline(const Context &parent, clock::time_point tp);
  static Context with_timeout(const Context &parent, clock::duration d);

  void cancel() const;

  bool done() const;
  bool cancelled() const;
  bool expired() const;

  std::optional<clock::time_point> deadline() const;

  // Time left before the deadline, clock::duration::max() when there is none.
  clock::duration remaining() const;

  // "context canceled", "context deadline exceeded" or empty while live.
  std::string reason() const;

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::optional<clock::time_point> deadline;
    std::shared_ptr<State> parent;
  };

  explicit Context(std::shared_ptr<State> st) : st_(std::move(st)) {}

  std::shared_ptr<State> st_;
};

} // namespace metaguard
