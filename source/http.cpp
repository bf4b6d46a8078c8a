#include <metaguard/http.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace metaguard {
namespace http {

static bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

static std::string trim(std::string_view s) {
  size_t b = 0, e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t'))
    ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t'))
    --e;
  return std::string(s.substr(b, e - b));
}

std::optional<std::string> find_header(const Headers &h, std::string_view name) {
  for (auto &kv : h) {
    if (iequals(kv.first, name))
      return kv.second;
  }
  return std::nullopt;
}

void set_header(Headers &h, const std::string &name, std::string value) {
  remove_header(h, name);
  h.emplace_back(name, std::move(value));
}

void remove_header(Headers &h, std::string_view name) {
  h.erase(std::remove_if(h.begin(), h.end(),
                         [&](const auto &kv) { return iequals(kv.first, name); }),
          h.end());
}

bool is_hop_by_hop(std::string_view name) {
  static const char *const hop[] = {"Connection",        "Keep-Alive", "Proxy-Connection",
                                    "TE",                "Trailer",    "Transfer-Encoding",
                                    "Upgrade"};
  for (auto *h : hop) {
    if (iequals(name, h))
      return true;
  }
  return false;
}

void strip_hop_by_hop(Headers &h) {
  // headers named by Connection are hop-by-hop as well
  std::vector<std::string> named;
  for (auto &kv : h) {
    if (!iequals(kv.first, "Connection"))
      continue;
    std::stringstream ss(kv.second);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
      tok = trim(tok);
      if (!tok.empty())
        named.push_back(tok);
    }
  }
  h.erase(std::remove_if(h.begin(), h.end(),
                         [&](const auto &kv) {
                           if (is_hop_by_hop(kv.first))
                             return true;
                           for (auto &n : named)
                             if (iequals(kv.first, n))
                               return true;
                           return false;
                         }),
          h.end());
}

std::optional<std::string> Request::param(const std::string &name) const {
  auto it = params.find(name);
  if (it == params.end())
    return std::nullopt;
  return it->second;
}

std::optional<std::string> Request::form_value(const std::string &key) const {
  for (auto &kv : parse_query(query)) {
    if (kv.first == key)
      return kv.second;
  }
  auto ct = header("Content-Type");
  if (ct && ct->rfind("application/x-www-form-urlencoded", 0) == 0) {
    for (auto &kv : parse_query(body)) {
      if (kv.first == key)
        return kv.second;
    }
  }
  return std::nullopt;
}

std::string reason_phrase(int code) {
  switch (code) {
  case 100: return "Continue";
  case 200: return "OK";
  case 201: return "Created";
  case 202: return "Accepted";
  case 204: return "No Content";
  case 206: return "Partial Content";
  case 301: return "Moved Permanently";
  case 302: return "Found";
  case 304: return "Not Modified";
  case 307: return "Temporary Redirect";
  case 308: return "Permanent Redirect";
  case 400: return "Bad Request";
  case 401: return "Unauthorized";
  case 403: return "Forbidden";
  case 404: return "Not Found";
  case 405: return "Method Not Allowed";
  case 408: return "Request Timeout";
  case 409: return "Conflict";
  case 411: return "Length Required";
  case 413: return "Payload Too Large";
  case 429: return "Too Many Requests";
  case 431: return "Request Header Fields Too Large";
  case 500: return "Internal Server Error";
  case 501: return "Not Implemented";
  case 502: return "Bad Gateway";
  case 503: return "Service Unavailable";
  case 504: return "Gateway Timeout";
  default: return "Unknown";
  }
}

bool status_has_body(int code) {
  return !(code / 100 == 1 || code == 204 || code == 304);
}

static bool split_lines(const std::string &head, std::vector<std::string> &lines) {
  size_t pos = 0;
  while (pos < head.size()) {
    size_t eol = head.find('\n', pos);
    if (eol == std::string::npos)
      eol = head.size();
    std::string line = head.substr(pos, eol - pos);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    pos = eol + 1;
    if (line.empty()) {
      if (lines.empty())
        continue; // tolerate leading blank lines
      break;
    }
    lines.push_back(std::move(line));
  }
  return !lines.empty();
}

static bool parse_header_lines(const std::vector<std::string> &lines, Headers &out,
                               std::string *err) {
  for (size_t i = 1; i < lines.size(); ++i) {
    const auto &line = lines[i];
    if (line[0] == ' ' || line[0] == '\t') {
      if (err)
        *err = "obsolete header line folding";
      return false;
    }
    size_t col = line.find(':');
    if (col == std::string::npos || col == 0) {
      if (err)
        *err = fmt::format("malformed header line: {}", line);
      return false;
    }
    std::string name = line.substr(0, col);
    if (name.find_first_of(" \t") != std::string::npos) {
      if (err)
        *err = fmt::format("invalid header name: {}", name);
      return false;
    }
    out.emplace_back(std::move(name), trim(std::string_view(line).substr(col + 1)));
  }
  return true;
}

bool parse_request_head(const std::string &head, Request &out, std::string *err) {
  std::vector<std::string> lines;
  if (!split_lines(head, lines)) {
    if (err)
      *err = "empty request";
    return false;
  }
  std::istringstream rl(lines[0]);
  std::string extra;
  out.version.clear();
  rl >> out.method >> out.target >> out.version >> extra;
  if (out.method.empty() || out.target.empty() || !extra.empty() ||
      out.version.rfind("HTTP/1.", 0) != 0) {
    if (err)
      *err = fmt::format("malformed request line: {}", lines[0]);
    return false;
  }

  std::string t = out.target;
  auto scheme = t.find("://");
  if (t[0] != '/' && scheme != std::string::npos) {
    auto slash = t.find('/', scheme + 3);
    t = slash == std::string::npos ? "/" : t.substr(slash);
  }
  size_t qpos = t.find('?');
  if (qpos == std::string::npos) {
    out.raw_path = t;
  } else {
    out.raw_path = t.substr(0, qpos);
    out.query = t.substr(qpos + 1);
  }
  out.path = percent_decode(out.raw_path, false);
  return parse_header_lines(lines, out.headers, err);
}

bool parse_response_head(const std::string &head, Response &out, std::string *err) {
  std::vector<std::string> lines;
  if (!split_lines(head, lines)) {
    if (err)
      *err = "empty response";
    return false;
  }
  const auto &sl = lines[0];
  // HTTP/1.1 200 OK
  auto sp1 = sl.find(' ');
  if (sl.rfind("HTTP/", 0) != 0 || sp1 == std::string::npos) {
    if (err)
      *err = fmt::format("malformed status line: {}", sl);
    return false;
  }
  auto sp2 = sl.find(' ', sp1 + 1);
  std::string code = sl.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos
                                                                  : sp2 - sp1 - 1);
  if (code.size() != 3 ||
      !std::all_of(code.begin(), code.end(),
                   [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
    if (err)
      *err = fmt::format("malformed status code: {}", code);
    return false;
  }
  out.status = std::stoi(code);
  out.status_text = sp2 == std::string::npos ? std::string() : sl.substr(sp2 + 1);
  return parse_header_lines(lines, out.headers, err);
}

static bool method_expects_body(const std::string &m) {
  return m == "POST" || m == "PUT" || m == "PATCH";
}

std::string serialize_request(const Request &r) {
  std::string s = fmt::format("{} {} HTTP/1.1\r\n", r.method, r.target);
  for (auto &kv : r.headers) {
    if (is_hop_by_hop(kv.first))
      continue;
    s += fmt::format("{}: {}\r\n", kv.first, kv.second);
  }
  if (!find_header(r.headers, "Content-Length") &&
      (!r.body.empty() || method_expects_body(r.method)))
    s += fmt::format("Content-Length: {}\r\n", r.body.size());
  s += "Connection: close\r\n\r\n";
  s += r.body;
  return s;
}

std::string serialize_response(const Response &r, bool include_body) {
  const std::string &text = r.status_text.empty() ? reason_phrase(r.status) : r.status_text;
  std::string s = fmt::format("HTTP/1.1 {} {}\r\n", r.status, text);
  for (auto &kv : r.headers) {
    if (is_hop_by_hop(kv.first))
      continue;
    s += fmt::format("{}: {}\r\n", kv.first, kv.second);
  }
  bool has_body = status_has_body(r.status);
  if (has_body && !find_header(r.headers, "Content-Length"))
    s += fmt::format("Content-Length: {}\r\n", r.body.size());
  s += "Connection: close\r\n\r\n";
  if (include_body && has_body)
    s += r.body;
  return s;
}

Response text_response(int status, std::string body) {
  Response r;
  r.status = status;
  r.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
  r.body = std::move(body);
  return r;
}

static int hex(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string percent_decode(const std::string &s, bool plus_as_space) {
  std::string o;
  o.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '+' && plus_as_space) {
      o.push_back(' ');
    } else if (c == '%' && i + 2 < s.size()) {
      int h1 = hex(s[i + 1]), h2 = hex(s[i + 2]);
      if (h1 >= 0 && h2 >= 0) {
        o.push_back(static_cast<char>(h1 * 16 + h2));
        i += 2;
      } else {
        o.push_back(c);
      }
    } else {
      o.push_back(c);
    }
  }
  return o;
}

std::string percent_encode(const std::string &s) {
  static const char *hexd = "0123456789ABCDEF";
  std::string o;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      o.push_back(static_cast<char>(c));
    } else {
      o.push_back('%');
      o.push_back(hexd[c >> 4]);
      o.push_back(hexd[c & 0xF]);
    }
  }
  return o;
}

std::vector<std::pair<std::string, std::string>> parse_query(const std::string &q) {
  std::vector<std::pair<std::string, std::string>> out;
  size_t pos = 0;
  while (pos < q.size()) {
    size_t amp = q.find('&', pos);
    if (amp == std::string::npos)
      amp = q.size();
    std::string pair = q.substr(pos, amp - pos);
    size_t eq = pair.find('=');
    if (!pair.empty()) {
      if (eq == std::string::npos)
        out.push_back({percent_decode(pair, true), ""});
      else
        out.push_back({percent_decode(pair.substr(0, eq), true),
                       percent_decode(pair.substr(eq + 1), true)});
    }
    pos = amp + 1;
  }
  return out;
}

std::string clean_path(const std::string &p) {
  if (p.empty())
    return "/";
  std::vector<std::string> segs;
  size_t pos = 0;
  while (pos <= p.size()) {
    size_t slash = p.find('/', pos);
    if (slash == std::string::npos)
      slash = p.size();
    std::string seg = p.substr(pos, slash - pos);
    if (seg == "..") {
      if (!segs.empty())
        segs.pop_back();
    } else if (!seg.empty() && seg != ".") {
      segs.push_back(std::move(seg));
    }
    pos = slash + 1;
  }
  std::string out;
  for (auto &s : segs)
    out += "/" + s;
  if (out.empty())
    return "/";
  if (p.back() == '/')
    out.push_back('/');
  return out;
}

} // namespace http
} // namespace metaguard
