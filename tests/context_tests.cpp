#include <catch2/catch_all.hpp>
#include <metaguard/context.hpp>

#include <thread>

using namespace metaguard;
using namespace std::chrono_literals;

TEST_CASE("background context never expires") {
  Context c;
  REQUIRE_FALSE(c.done());
  REQUIRE_FALSE(c.deadline());
  REQUIRE(c.remaining() == Context::clock::duration::max());
  REQUIRE(c.reason().empty());
}

TEST_CASE("timeout context expires") {
  auto c = Context::with_timeout(Context(), 20ms);
  REQUIRE_FALSE(c.done());
  std::this_thread::sleep_for(40ms);
  REQUIRE(c.done());
  REQUIRE(c.expired());
  REQUIRE(c.reason() == "context deadline exceeded");
  REQUIRE(c.remaining() == Context::clock::duration::zero());
}

TEST_CASE("child inherits the earlier parent deadline") {
  auto parent = Context::with_timeout(Context(), 50ms);
  auto child = Context::with_timeout(parent, 10s);
  REQUIRE(*child.deadline() == *parent.deadline());
}

TEST_CASE("cancel propagates to children but not parents") {
  Context root;
  auto mid = Context::with_timeout(root, 10s);
  auto leaf = Context::with_timeout(mid, 10s);

  mid.cancel();
  REQUIRE(leaf.done());
  REQUIRE(leaf.reason() == "context canceled");
  REQUIRE_FALSE(root.done());

  // copies share state
  Context copy = root;
  copy.cancel();
  REQUIRE(root.cancelled());
}
