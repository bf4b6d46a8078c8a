#include <metaguard/http_server.hpp>
#include <metaguard/stream.hpp>

#include <asio.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <sys/socket.h>

namespace metaguard {

namespace {

struct Connection {
  Stream stream;
  Context ctx;
  bool busy = false;    // guarded by Impl::mu
  bool closing = false; // guarded by Impl::mu
};

} // namespace

struct HttpServer::Impl {
  Handler handler;
  ListenerOptions opts;
  asio::io_context io;
  asio::ip::tcp::acceptor acc;
  std::atomic<bool> stopping{false};

  mutable std::mutex mu;
  std::condition_variable cv;
  int listen_fd = -1;
  std::uint64_t next_id = 0;
  std::unordered_map<std::uint64_t, std::shared_ptr<Connection>> conns;

  Impl(Handler h, ListenerOptions o) : handler(std::move(h)), opts(o), io(), acc(io) {}

  void serve(const std::shared_ptr<Connection> &conn);
  void reply(Stream &s, const http::Response &resp, bool include_body);
  void unregister(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mu);
    conns.erase(id);
    cv.notify_all();
  }
};

static std::string format_endpoint(const asio::ip::tcp::endpoint &ep) {
  if (ep.address().is_v6())
    return fmt::format("[{}]:{}", ep.address().to_string(), ep.port());
  return fmt::format("{}:{}", ep.address().to_string(), ep.port());
}

HttpServer::HttpServer(Handler h, ListenerOptions opts)
    : impl_(std::make_shared<Impl>(std::move(h), opts)) {}

HttpServer::~HttpServer() {
  if (!impl_->stopping.load())
    shutdown(Context::clock::now());
  asio::error_code ignored;
  impl_->acc.close(ignored);
}

bool HttpServer::listen(const std::string &addr, unsigned short port, std::string *err) {
  asio::error_code ec;
  auto a = asio::ip::make_address(addr, ec);
  if (ec) {
    if (err)
      *err = fmt::format("listen tcp {}:{}: invalid address", addr, port);
    return false;
  }
  asio::ip::tcp::endpoint ep(a, port);
  auto fail = [&](const char *op) {
    if (err)
      *err = fmt::format("{} tcp {}: {}", op, format_endpoint(ep), ec.message());
    asio::error_code ignored;
    impl_->acc.close(ignored);
    return false;
  };
  impl_->acc.open(ep.protocol(), ec);
  if (ec)
    return fail("socket");
  impl_->acc.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  impl_->acc.bind(ep, ec);
  if (ec)
    return fail("bind");
  impl_->acc.listen(asio::socket_base::max_listen_connections, ec);
  if (ec)
    return fail("listen");

  std::lock_guard<std::mutex> lk(impl_->mu);
  impl_->listen_fd = impl_->acc.native_handle();
  return true;
}

std::string HttpServer::address() const {
  asio::error_code ec;
  auto ep = impl_->acc.local_endpoint(ec);
  return ec ? std::string() : format_endpoint(ep);
}

unsigned short HttpServer::port() const {
  asio::error_code ec;
  auto ep = impl_->acc.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

std::size_t HttpServer::open_connections() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->conns.size();
}

void HttpServer::run() {
  auto self = impl_;
  while (!self->stopping.load()) {
    auto conn = std::make_shared<Connection>();
    asio::error_code ec;
    self->acc.accept(conn->stream.socket(), ec);
    if (ec) {
      if (self->stopping.load())
        break;
      spdlog::warn("http: accept error: {}; retrying", ec.message());
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      continue;
    }

    std::uint64_t id = 0;
    bool full = false;
    {
      std::lock_guard<std::mutex> lk(self->mu);
      if (self->stopping.load()) {
        conn->stream.close();
        break;
      }
      full = self->opts.max_connections > 0 && self->conns.size() >= self->opts.max_connections;
      if (!full) {
        id = self->next_id++;
        self->conns[id] = conn;
      }
    }
    if (full) {
      spdlog::warn("http: {} connections open, rejecting {}", self->opts.max_connections,
                   conn->stream.remote_address());
      std::string err;
      (void)conn->stream.write(
          http::serialize_response(http::text_response(503, "too many connections\n")),
          Stream::clock::now() + std::chrono::milliseconds(100), &err);
      conn->stream.close();
      continue;
    }
    std::thread([self, conn, id]() {
      self->serve(conn);
      self->unregister(id);
    }).detach();
  }

  std::lock_guard<std::mutex> lk(self->mu);
  self->listen_fd = -1;
  asio::error_code ignored;
  self->acc.close(ignored);
}

void HttpServer::Impl::reply(Stream &s, const http::Response &resp, bool include_body) {
  std::string err;
  auto deadline = Stream::clock::now() + opts.write_timeout;
  if (!s.write(http::serialize_response(resp, include_body), deadline, &err))
    spdlog::debug("http: write response: {}", err);
}

void HttpServer::Impl::serve(const std::shared_ptr<Connection> &conn) {
  Stream &s = conn->stream;
  std::string head, err;
  bool too_large = false;
  if (!s.read_head(head, Stream::clock::now() + opts.read_header_timeout, &err, &too_large)) {
    if (too_large)
      reply(s, http::text_response(431, "request header fields too large\n"), true);
    else
      spdlog::debug("http: read request head: {}", err);
    s.close();
    return;
  }

  // From here on the request is in flight and shutdown waits for it.
  {
    std::lock_guard<std::mutex> lk(mu);
    if (conn->closing) {
      s.close();
      return;
    }
    conn->busy = true;
  }

  http::Request req;
  if (!http::parse_request_head(head, req, &err)) {
    spdlog::debug("http: malformed request: {}", err);
    reply(s, http::text_response(400, "malformed request\n"), true);
    s.close();
    return;
  }
  req.remote_address = s.remote_address();

  auto expect = req.header("Expect");
  if (expect && *expect == "100-continue" &&
      (req.header("Content-Length") || req.header("Transfer-Encoding"))) {
    (void)s.write("HTTP/1.1 100 Continue\r\n\r\n",
                  Stream::clock::now() + opts.write_timeout, &err);
  }

  auto st = read_body(s, req.headers, false, opts.max_body_bytes,
                      Stream::clock::now() + opts.read_timeout, req.body, &err);
  if (st != BodyStatus::Ok) {
    spdlog::debug("http: read request body from {}: {}", req.remote_address, err);
    if (st == BodyStatus::Malformed)
      reply(s, http::text_response(400, "malformed request body\n"), true);
    else if (st == BodyStatus::TooLarge)
      reply(s, http::text_response(413, "request body too large\n"), true);
    else if (st == BodyStatus::Unsupported)
      reply(s, http::text_response(501, "unsupported transfer encoding\n"), true);
    s.close();
    return;
  }

  req.context = conn->ctx;

  bool include_body = req.method != "HEAD";
  http::Response resp;
  try {
    resp = handler(std::move(req));
  } catch (const std::exception &e) {
    spdlog::error("http: handler failed: {}", e.what());
    resp = http::text_response(500, "internal error\n");
  }
  reply(s, resp, include_body);
  s.close();
}

bool HttpServer::shutdown(Context::clock::time_point deadline) {
  auto &im = *impl_;
  std::unique_lock<std::mutex> lk(im.mu);
  if (!im.stopping.exchange(true) && im.listen_fd >= 0) {
    // wakes the blocking accept in run()
    ::shutdown(im.listen_fd, SHUT_RDWR);
  }

  for (auto &kv : im.conns) {
    auto &c = kv.second;
    if (!c->busy && !c->closing) {
      c->closing = true;
      c->stream.abort();
    }
  }

  if (im.cv.wait_until(lk, deadline, [&] { return im.conns.empty(); }))
    return true;

  spdlog::warn("http: forcing close of {} connection(s)", im.conns.size());
  for (auto &kv : im.conns) {
    auto &c = kv.second;
    c->closing = true;
    c->ctx.cancel();
    c->stream.abort();
  }
  return false;
}

} // namespace metaguard
