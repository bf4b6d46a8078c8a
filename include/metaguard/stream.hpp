#pragma once
#include <metaguard/http.hpp>

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace metaguard {

// One TCP connection with blocking, deadline-bounded operations. Every call
// runs asynchronous asio operations on the stream's private io_context until
// they complete or the deadline passes, in which case the socket is closed.
class Stream {
public:
  using clock = std::chrono::steady_clock;

  static constexpr std::size_t kMaxHeadBytes = 1 << 20;

  Stream();
  Stream(const Stream &) = delete;
  Stream &operator=(const Stream &) = delete;

  asio::ip::tcp::socket &socket() { return socket_; }

  bool connect(const std::string &host, const std::string &port,
               clock::time_point deadline, std::string *err);

  // Reads through the blank line ending a message head. Sets *too_large when
  // the head does not fit in kMaxHeadBytes.
  bool read_head(std::string &head, clock::time_point deadline, std::string *err,
                 bool *too_large = nullptr);
  bool read_line(std::string &line, clock::time_point deadline, std::string *err);
  bool read_exact(std::string &out, std::size_t n, clock::time_point deadline,
                  std::string *err);
  bool read_to_eof(std::string &out, std::size_t max_bytes, clock::time_point deadline,
                   std::string *err, bool *too_large = nullptr);
  bool write(const std::string &data, clock::time_point deadline, std::string *err);

  void close();
  // Safe from any thread: the close runs on the stream's own io_context and
  // aborts whatever operation is in flight, or the next one.
  void abort();

  // a.b.c.d:port for IPv4 (mapped IPv6 peers included), [v6]:port otherwise.
  std::string remote_address() const;

private:
  bool run_until(clock::time_point deadline);

  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  asio::ip::tcp::resolver resolver_;
  asio::streambuf buf_;
};

enum class BodyStatus { Ok, Malformed, TooLarge, Unsupported, Failed };

// Reads a message body framed by Transfer-Encoding: chunked or
// Content-Length. Without either, the body is empty unless eof_delimited is
// set, in which case it runs to the end of the connection.
BodyStatus read_body(Stream &s, const http::Headers &headers, bool eof_delimited,
                     std::size_t max_bytes, Stream::clock::time_point deadline,
                     std::string &out, std::string *err);

} // namespace metaguard
