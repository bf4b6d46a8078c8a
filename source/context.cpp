#include <metaguard/context.hpp>

namespace metaguard {

Context::Context() : st_(std::make_shared<State>()) {}

Context Context::with_deadline(const Context &parent, clock::time_point tp) {
  auto st = std::make_shared<State>();
  st->parent = parent.st_;
  auto inherited = parent.deadline();
  st->deadline = (inherited && *inherited < tp) ? *inherited : tp;
  return Context(std::move(st));
}

Context Context::with_timeout(const Context &parent, clock::duration d) {
  return with_deadline(parent, clock::now() + d);
}

void Context::cancel() const { st_->cancelled.store(true); }

bool Context::cancelled() const {
  for (auto s = st_.get(); s; s = s->parent.get()) {
    if (s->cancelled.load())
      return true;
  }
  return false;
}

bool Context::expired() const {
  auto d = deadline();
  return d && clock::now() >= *d;
}

bool Context::done() const { return cancelled() || expired(); }

std::optional<Context::clock::time_point> Context::deadline() const {
  // a child's deadline already folds in its parents' at creation time
  for (auto s = st_.get(); s; s = s->parent.get()) {
    if (s->deadline)
      return s->deadline;
  }
  return std::nullopt;
}

Context::clock::duration Context::remaining() const {
  auto d = deadline();
  if (!d)
    return clock::duration::max();
  auto now = clock::now();
  if (now >= *d)
    return clock::duration::zero();
  return *d - now;
}

std::string Context::reason() const {
  if (cancelled())
    return "context canceled";
  if (expired())
    return "context deadline exceeded";
  return {};
}

} // namespace metaguard
