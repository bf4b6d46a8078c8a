#pragma once
#include <metaguard/context.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace metaguard {
namespace http {

// Ordered and duplicate-preserving, so a relayed message keeps its header
// block as received.
using Headers = std::vector<std::pair<std::string, std::string>>;

std::optional<std::string> find_header(const Headers &h, std::string_view name);
void set_header(Headers &h, const std::string &name, std::string value);
void remove_header(Headers &h, std::string_view name);
bool is_hop_by_hop(std::string_view name);
void strip_hop_by_hop(Headers &h);

struct Request {
  std::string method;
  std::string target;   // request-target as received
  std::string raw_path; // path part of target, still percent-encoded
  std::string path;     // decoded path used for routing
  std::string query;    // raw query without '?'
  std::string version = "HTTP/1.1";
  Headers headers;
  std::string body;
  std::string remote_address;
  std::unordered_map<std::string, std::string> params;
  Context context;

  std::optional<std::string> header(std::string_view name) const {
    return find_header(headers, name);
  }
  std::optional<std::string> param(const std::string &name) const;
  // Query parameter, or field of an application/x-www-form-urlencoded body.
  std::optional<std::string> form_value(const std::string &key) const;
};

struct Response {
  int status = 200;
  std::string status_text; // empty means the standard reason phrase
  Headers headers;
  std::string body;

  std::optional<std::string> header(std::string_view name) const {
    return find_header(headers, name);
  }
};

std::string reason_phrase(int code);
bool status_has_body(int code);

bool parse_request_head(const std::string &head, Request &out, std::string *err);
bool parse_response_head(const std::string &head, Response &out, std::string *err);

// Both set Content-Length from the body unless the header is already present
// and always ask for Connection: close.
std::string serialize_request(const Request &r);
std::string serialize_response(const Response &r, bool include_body = true);

Response text_response(int status, std::string body);

std::string percent_decode(const std::string &s, bool plus_as_space);
std::string percent_encode(const std::string &s);
std::vector<std::pair<std::string, std::string>> parse_query(const std::string &q);

// Canonical form of an absolute path: no empty, "." or ".." segments; a
// trailing slash survives.
std::string clean_path(const std::string &p);

} // namespace http
} // namespace metaguard
