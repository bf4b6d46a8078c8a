#include <metaguard/handlers.hpp>

#include <fmt/format.h>

namespace metaguard {

// Looks up the role; a failed lookup or an empty role ends up in `res`.
static std::optional<std::string> authorized_role(RoleFinder &finder, const Call &call,
                                                  HandlerResult *res) {
  Error e;
  auto role = finder.find_role(call.ctx, call.identity, &e);
  if (!role) {
    *res = HandlerResult::fail(std::move(e));
    return std::nullopt;
  }
  if (role->empty()) {
    *res = HandlerResult::fail(Error::not_found(
        fmt::format("no role found for identity {}", call.identity)));
    return std::nullopt;
  }
  return role;
}

HandlerResult RoleHandler::handle(const Call &call, http::Response &out) {
  HandlerResult res;
  auto role = authorized_role(*finder_, call, &res);
  if (!role)
    return res;
  http::set_header(out.headers, "Content-Type", "text/plain; charset=utf-8");
  out.body = *role;
  return HandlerResult::ok();
}

HandlerResult CredentialsHandler::handle(const Call &call, http::Response &out) {
  auto requested = call.request.param("role").value_or("");

  HandlerResult res;
  auto role = authorized_role(*finder_, call, &res);
  if (!role)
    return res;

  if (requested != *role) {
    return HandlerResult::fail(Error::forbidden(fmt::format(
        "identity {} requested role \"{}\" but is authorized for \"{}\"", call.identity,
        requested, *role)));
  }

  Error e;
  auto creds = provider_->credentials_for_role(call.ctx, *role, &e);
  if (!creds)
    return HandlerResult::fail(std::move(e));

  http::set_header(out.headers, "Content-Type", "application/json");
  out.body = std::move(*creds);
  return HandlerResult::ok();
}

HealthHandler::HealthHandler(Url metadata, HttpClient client)
    : probe_(std::move(metadata)), client_(client) {
  probe_.path = join_path(probe_.path.empty() ? "/" : probe_.path,
                          "latest/meta-data/instance-id");
  probe_.query.clear();
}

HandlerResult HealthHandler::handle(const Call &call, http::Response &out) {
  std::string err;
  auto resp = client_.get(probe_, call.ctx, &err);
  if (!resp) {
    return HandlerResult::fail(Error::upstream(
        500, "metadata unavailable", fmt::format("GET {}: {}", probe_.path, err)));
  }
  if (resp->status != 200) {
    return HandlerResult::fail(Error::upstream(
        500, "metadata unavailable",
        fmt::format("GET {}: upstream returned {}", probe_.path, resp->status)));
  }
  http::set_header(out.headers, "Content-Type", "text/plain; charset=utf-8");
  out.body = std::move(resp->body);
  return HandlerResult::ok();
}

} // namespace metaguard
