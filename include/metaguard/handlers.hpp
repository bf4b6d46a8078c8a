#pragma once
#include <metaguard/credentials.hpp>
#include <metaguard/guard.hpp>
#include <metaguard/http_client.hpp>
#include <metaguard/role_finder.hpp>
#include <metaguard/url.hpp>

#include <memory>

namespace metaguard {

// Answers the role listing with the single role the identity may assume.
class RoleHandler : public Handler {
public:
  static constexpr const char *kName = "roleName";

  explicit RoleHandler(std::shared_ptr<RoleFinder> finder) : finder_(std::move(finder)) {}

  HandlerResult handle(const Call &call, http::Response &out) override;

private:
  std::shared_ptr<RoleFinder> finder_;
};

// Issues credentials for {role} when it is exactly the role the identity is
// authorized for.
class CredentialsHandler : public Handler {
public:
  static constexpr const char *kName = "credentials";

  CredentialsHandler(std::shared_ptr<RoleFinder> finder,
                     std::shared_ptr<CredentialsProvider> provider)
      : finder_(std::move(finder)), provider_(std::move(provider)) {}

  HandlerResult handle(const Call &call, http::Response &out) override;

private:
  std::shared_ptr<RoleFinder> finder_;
  std::shared_ptr<CredentialsProvider> provider_;
};

class HealthHandler : public Handler {
public:
  static constexpr const char *kName = "health";

  HealthHandler(Url metadata, HttpClient client);

  HandlerResult handle(const Call &call, http::Response &out) override;

  const Url &probe_url() const { return probe_; }

private:
  Url probe_;
  HttpClient client_;
};

} // namespace metaguard
