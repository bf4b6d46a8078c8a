#include <metaguard/stream.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace metaguard {

static Stream::clock::time_point cap(Stream::clock::time_point deadline) {
  // io_context::run_until cannot take time_point::max()
  auto horizon = Stream::clock::now() + std::chrono::hours(24);
  return deadline > horizon ? horizon : deadline;
}

Stream::Stream() : io_(), socket_(io_), resolver_(io_), buf_(kMaxHeadBytes) {}

bool Stream::run_until(clock::time_point deadline) {
  io_.restart();
  io_.run_until(cap(deadline));
  if (!io_.stopped()) {
    asio::error_code ignored;
    resolver_.cancel();
    socket_.close(ignored);
    io_.run();
    return false;
  }
  return true;
}

bool Stream::connect(const std::string &host, const std::string &port,
                     clock::time_point deadline, std::string *err) {
  asio::error_code ec;
  auto addr = asio::ip::make_address(host, ec);
  if (!ec) {
    unsigned long p = 0;
    if (port.empty() || port.size() > 5 ||
        !std::all_of(port.begin(), port.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }) ||
        (p = std::stoul(port)) > 65535) {
      if (err)
        *err = fmt::format("invalid port: {}", port);
      return false;
    }
    asio::ip::tcp::endpoint ep(addr, static_cast<unsigned short>(p));
    socket_.async_connect(ep, [&](const asio::error_code &e) { ec = e; });
    if (!run_until(deadline)) {
      if (err)
        *err = fmt::format("dial tcp {}:{}: i/o timeout", host, port);
      return false;
    }
  } else {
    ec.clear();
    asio::ip::tcp::resolver::results_type results;
    resolver_.async_resolve(host, port,
                            [&](const asio::error_code &e,
                                asio::ip::tcp::resolver::results_type r) {
                              ec = e;
                              results = std::move(r);
                            });
    if (!run_until(deadline)) {
      if (err)
        *err = fmt::format("lookup {}: i/o timeout", host);
      return false;
    }
    if (ec) {
      if (err)
        *err = fmt::format("lookup {}: {}", host, ec.message());
      return false;
    }
    asio::async_connect(socket_, results,
                        [&](const asio::error_code &e, const asio::ip::tcp::endpoint &) {
                          ec = e;
                        });
    if (!run_until(deadline)) {
      if (err)
        *err = fmt::format("dial tcp {}:{}: i/o timeout", host, port);
      return false;
    }
  }
  if (ec) {
    if (err)
      *err = fmt::format("dial tcp {}:{}: {}", host, port, ec.message());
    return false;
  }
  return true;
}

bool Stream::read_head(std::string &head, clock::time_point deadline, std::string *err,
                       bool *too_large) {
  asio::error_code ec;
  std::size_t n = 0;
  asio::async_read_until(socket_, buf_, "\r\n\r\n",
                         [&](const asio::error_code &e, std::size_t len) {
                           ec = e;
                           n = len;
                         });
  if (!run_until(deadline)) {
    if (err)
      *err = "read timeout";
    return false;
  }
  if (ec) {
    if (ec == asio::error::not_found && too_large)
      *too_large = true;
    if (err)
      *err = ec.message();
    return false;
  }
  auto data = buf_.data();
  head.assign(asio::buffers_begin(data), asio::buffers_begin(data) + n);
  buf_.consume(n);
  return true;
}

bool Stream::read_line(std::string &line, clock::time_point deadline, std::string *err) {
  asio::error_code ec;
  std::size_t n = 0;
  asio::async_read_until(socket_, buf_, "\r\n",
                         [&](const asio::error_code &e, std::size_t len) {
                           ec = e;
                           n = len;
                         });
  if (!run_until(deadline)) {
    if (err)
      *err = "read timeout";
    return false;
  }
  if (ec) {
    if (err)
      *err = ec.message();
    return false;
  }
  auto data = buf_.data();
  line.assign(asio::buffers_begin(data), asio::buffers_begin(data) + (n - 2));
  buf_.consume(n);
  return true;
}

bool Stream::read_exact(std::string &out, std::size_t n, clock::time_point deadline,
                        std::string *err) {
  std::size_t buffered = std::min(n, buf_.size());
  if (buffered > 0) {
    auto data = buf_.data();
    out.append(asio::buffers_begin(data), asio::buffers_begin(data) + buffered);
    buf_.consume(buffered);
  }
  std::size_t rest = n - buffered;
  if (rest == 0)
    return true;

  std::size_t at = out.size();
  out.resize(at + rest);
  asio::error_code ec;
  std::size_t got = 0;
  asio::async_read(socket_, asio::buffer(&out[at], rest),
                   [&](const asio::error_code &e, std::size_t len) {
                     ec = e;
                     got = len;
                   });
  if (!run_until(deadline)) {
    out.resize(at);
    if (err)
      *err = "read timeout";
    return false;
  }
  if (ec) {
    out.resize(at + got);
    if (err)
      *err = ec.message();
    return false;
  }
  return true;
}

bool Stream::read_to_eof(std::string &out, std::size_t max_bytes, clock::time_point deadline,
                         std::string *err, bool *too_large) {
  if (buf_.size() > 0) {
    auto data = buf_.data();
    out.append(asio::buffers_begin(data), asio::buffers_end(data));
    buf_.consume(buf_.size());
  }
  char chunk[16384];
  for (;;) {
    if (out.size() > max_bytes) {
      if (too_large)
        *too_large = true;
      if (err)
        *err = "body too large";
      return false;
    }
    asio::error_code ec;
    std::size_t got = 0;
    socket_.async_read_some(asio::buffer(chunk), [&](const asio::error_code &e, std::size_t len) {
      ec = e;
      got = len;
    });
    if (!run_until(deadline)) {
      if (err)
        *err = "read timeout";
      return false;
    }
    out.append(chunk, got);
    if (ec == asio::error::eof) {
      if (out.size() <= max_bytes)
        return true;
      if (too_large)
        *too_large = true;
      if (err)
        *err = "body too large";
      return false;
    }
    if (ec) {
      if (err)
        *err = ec.message();
      return false;
    }
  }
}

bool Stream::write(const std::string &data, clock::time_point deadline, std::string *err) {
  asio::error_code ec;
  asio::async_write(socket_, asio::buffer(data),
                    [&](const asio::error_code &e, std::size_t) { ec = e; });
  if (!run_until(deadline)) {
    if (err)
      *err = "write timeout";
    return false;
  }
  if (ec) {
    if (err)
      *err = ec.message();
    return false;
  }
  return true;
}

void Stream::close() {
  asio::error_code ignored;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}

void Stream::abort() {
  asio::post(io_, [this]() {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  });
}

std::string Stream::remote_address() const {
  asio::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  if (ec)
    return {};
  auto addr = ep.address();
  if (addr.is_v6() && addr.to_v6().is_v4_mapped())
    addr = asio::ip::make_address_v4(asio::ip::v4_mapped, addr.to_v6());
  if (addr.is_v6())
    return fmt::format("[{}]:{}", addr.to_string(), ep.port());
  return fmt::format("{}:{}", addr.to_string(), ep.port());
}

static bool parse_size(const std::string &s, int base, std::size_t &out) {
  if (s.empty())
    return false;
  std::size_t v = 0;
  for (char c : s) {
    int d;
    if (c >= '0' && c <= '9')
      d = c - '0';
    else if (base == 16 && c >= 'a' && c <= 'f')
      d = 10 + (c - 'a');
    else if (base == 16 && c >= 'A' && c <= 'F')
      d = 10 + (c - 'A');
    else
      return false;
    if (v > (static_cast<std::size_t>(-1) - d) / base)
      return false;
    v = v * base + d;
  }
  out = v;
  return true;
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static BodyStatus read_chunked(Stream &s, std::size_t max_bytes,
                               Stream::clock::time_point deadline, std::string &out,
                               std::string *err) {
  for (;;) {
    std::string line;
    if (!s.read_line(line, deadline, err))
      return BodyStatus::Failed;
    auto semi = line.find(';');
    if (semi != std::string::npos)
      line.resize(semi);
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t'))
      line.pop_back();
    std::size_t size = 0;
    if (!parse_size(line, 16, size)) {
      if (err)
        *err = fmt::format("invalid chunk size: {}", line);
      return BodyStatus::Malformed;
    }
    if (size == 0) {
      // trailer section ends with an empty line
      for (;;) {
        if (!s.read_line(line, deadline, err))
          return BodyStatus::Failed;
        if (line.empty())
          return BodyStatus::Ok;
      }
    }
    if (out.size() + size > max_bytes) {
      if (err)
        *err = "body too large";
      return BodyStatus::TooLarge;
    }
    if (!s.read_exact(out, size, deadline, err))
      return BodyStatus::Failed;
    if (!s.read_line(line, deadline, err))
      return BodyStatus::Failed;
    if (!line.empty()) {
      if (err)
        *err = "malformed chunk terminator";
      return BodyStatus::Malformed;
    }
  }
}

BodyStatus read_body(Stream &s, const http::Headers &headers, bool eof_delimited,
                     std::size_t max_bytes, Stream::clock::time_point deadline,
                     std::string &out, std::string *err) {
  if (auto te = http::find_header(headers, "Transfer-Encoding")) {
    if (lower(*te) != "chunked") {
      if (err)
        *err = fmt::format("unsupported transfer encoding: {}", *te);
      return BodyStatus::Unsupported;
    }
    return read_chunked(s, max_bytes, deadline, out, err);
  }
  if (auto cl = http::find_header(headers, "Content-Length")) {
    std::size_t n = 0;
    if (!parse_size(*cl, 10, n)) {
      if (err)
        *err = fmt::format("invalid Content-Length: {}", *cl);
      return BodyStatus::Malformed;
    }
    if (n > max_bytes) {
      if (err)
        *err = "body too large";
      return BodyStatus::TooLarge;
    }
    return s.read_exact(out, n, deadline, err) ? BodyStatus::Ok : BodyStatus::Failed;
  }
  if (!eof_delimited)
    return BodyStatus::Ok;
  bool too_large = false;
  if (s.read_to_eof(out, max_bytes, deadline, err, &too_large))
    return BodyStatus::Ok;
  return too_large ? BodyStatus::TooLarge : BodyStatus::Failed;
}

} // namespace metaguard
