#include <metaguard/role_finder.hpp>

#include <fmt/format.h>

#include <fstream>
#include <sstream>

namespace metaguard {

static std::string trim(const std::string &s) {
  auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos)
    return {};
  auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

std::shared_ptr<StaticRoleFinder> StaticRoleFinder::parse(const std::string &text,
                                                          std::string *err) {
  std::unordered_map<std::string, std::string> roles;
  std::istringstream in(text);
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    auto hash = line.find('#');
    if (hash != std::string::npos)
      line.resize(hash);
    line = trim(line);
    if (line.empty())
      continue;

    std::istringstream fields(line);
    std::string identity, role, extra;
    fields >> identity >> role;
    if (role.empty() || (fields >> extra)) {
      if (err)
        *err = fmt::format("line {}: expected \"<identity> <role>\"", lineno);
      return nullptr;
    }
    if (!roles.emplace(identity, role).second) {
      if (err)
        *err = fmt::format("line {}: duplicate identity {}", lineno, identity);
      return nullptr;
    }
  }
  return std::make_shared<StaticRoleFinder>(std::move(roles));
}

std::shared_ptr<StaticRoleFinder> StaticRoleFinder::load(const std::string &path,
                                                         std::string *err) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    if (err)
      *err = fmt::format("open {}: cannot read file", path);
    return nullptr;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  std::string perr;
  auto finder = parse(ss.str(), &perr);
  if (!finder && err)
    *err = fmt::format("{}: {}", path, perr);
  return finder;
}

std::optional<std::string> StaticRoleFinder::find_role(const Context &ctx,
                                                       const std::string &identity,
                                                       Error *err) {
  if (ctx.done()) {
    if (err)
      *err = Error::timeout(ctx.reason());
    return std::nullopt;
  }
  auto it = roles_.find(identity);
  if (it == roles_.end())
    return std::string();
  return it->second;
}

} // namespace metaguard
