#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include "util/Http.hpp"

namespace lanlink::app {

// One request and its response over a fresh connection. The caller writes
// the request head and body with send(), then reads the response.
class HttpConnection {
public:
  virtual ~HttpConnection() = default;
  [[nodiscard]] virtual bool send(const char* data, size_t n) = 0;
  // Blocks for the status line and headers.
  [[nodiscard]] virtual std::optional<util::HttpResponseHead> read_head() = 0;
  // Body bytes after read_head(); 0 at the end of the body, negative on error.
  [[nodiscard]] virtual std::ptrdiff_t read_body(char* buf, size_t cap) = 0;
};

class IHttpClient {
public:
  virtual ~IHttpClient() = default;
  // nullptr when the peer cannot be reached.
  [[nodiscard]] virtual std::unique_ptr<HttpConnection> connect(const util::Url& url) = 0;
};

// Blocking IPv4/IPv6 client; every send and receive is bounded by `timeout`.
class TcpHttpClient final : public IHttpClient {
public:
  explicit TcpHttpClient(std::chrono::milliseconds timeout = std::chrono::seconds(30)) : timeout_(timeout) {}

  std::unique_ptr<HttpConnection> connect(const util::Url& url) override;

private:
  std::chrono::milliseconds timeout_;
};

} // namespace lanlink::app
