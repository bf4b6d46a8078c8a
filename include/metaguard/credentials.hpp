#pragma once
#include <metaguard/context.hpp>
#include <metaguard/error.hpp>
#include <metaguard/http_client.hpp>
#include <metaguard/url.hpp>

#include <optional>
#include <string>

namespace metaguard {

// Issues credentials for a role. The payload is opaque to the proxy and is
// relayed to the client as is.
class CredentialsProvider {
public:
  virtual ~CredentialsProvider() = default;

  virtual std::optional<std::string> credentials_for_role(const Context &ctx,
                                                          const std::string &role,
                                                          Error *err) = 0;
};

// GET <base>/<role> against a credential broker.
class HttpCredentialsProvider : public CredentialsProvider {
public:
  HttpCredentialsProvider(Url base, HttpClient client)
      : base_(std::move(base)), client_(client) {}

  std::optional<std::string> credentials_for_role(const Context &ctx, const std::string &role,
                                                  Error *err) override;

private:
  Url base_;
  HttpClient client_;
};

} // namespace metaguard
