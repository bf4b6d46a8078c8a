#pragma once
#include <string>

namespace metaguard {

// Failure carried from a handler or collaborator to the lifecycle guard.
// `message` is written to the client, `detail` only reaches the log.
struct Error {
  int status = 500;
  std::string message;
  std::string detail;

  static Error bad_request(std::string detail) {
    return {400, "bad request", std::move(detail)};
  }
  static Error not_found(std::string detail) {
    return {404, "no role for identity", std::move(detail)};
  }
  static Error forbidden(std::string detail) {
    return {403, "role forbidden", std::move(detail)};
  }
  static Error timeout(std::string detail) {
    return {504, "request timed out", std::move(detail)};
  }
  static Error internal(std::string detail) {
    return {500, "internal error", std::move(detail)};
  }
  // Collaborator-supplied errors keep their own status and message.
  static Error upstream(int status, std::string message, std::string detail = {}) {
    return {status, std::move(message), std::move(detail)};
  }

  const std::string &log_text() const { return detail.empty() ? message : detail; }
};

} // namespace metaguard
