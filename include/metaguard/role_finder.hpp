#pragma once
#include <metaguard/context.hpp>
#include <metaguard/error.hpp>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace metaguard {

// Authorization decision: which role a workload identity may assume.
// Implementations must be safe to call concurrently.
class RoleFinder {
public:
  virtual ~RoleFinder() = default;

  // Empty string means the identity has no role. nullopt means the lookup
  // itself failed and *err says how.
  virtual std::optional<std::string> find_role(const Context &ctx, const std::string &identity,
                                               Error *err) = 0;
};

// Fixed identity -> role table, one "<identity> <role>" pair per line.
class StaticRoleFinder : public RoleFinder {
public:
  explicit StaticRoleFinder(std::unordered_map<std::string, std::string> roles)
      : roles_(std::move(roles)) {}

  static std::shared_ptr<StaticRoleFinder> parse(const std::string &text, std::string *err);
  static std::shared_ptr<StaticRoleFinder> load(const std::string &path, std::string *err);

  std::optional<std::string> find_role(const Context &ctx, const std::string &identity,
                                       Error *err) override;

  std::size_t size() const { return roles_.size(); }

private:
  const std::unordered_map<std::string, std::string> roles_;
};

} // namespace metaguard
