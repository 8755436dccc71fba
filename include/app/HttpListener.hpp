#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include "util/Http.hpp"

struct io_uring;

namespace lanlink::app {

// One request/response exchange on a connection. The response head must be
// sent before any body bytes.
class HttpExchange {
public:
  virtual ~HttpExchange() = default;
  // Request body bytes; 0 at the end of the declared length, negative on error.
  [[nodiscard]] virtual std::ptrdiff_t read_body(char* buf, size_t cap) = 0;
  [[nodiscard]] virtual bool send_head(int status, const util::HeaderList& headers) = 0;
  [[nodiscard]] virtual bool send_body(const char* data, size_t n) = 0;
  [[nodiscard]] virtual bool head_sent() const = 0;
};

using RequestHandler = std::function<void(const util::HttpRequest&, HttpExchange&)>;

class IHttpListener {
public:
  virtual ~IHttpListener() = default;
  // Binds and starts accepting. Port 0 picks an ephemeral port.
  [[nodiscard]] virtual bool start(uint16_t port, RequestHandler handler) = 0;
  // Stops accepting and waits for in-flight exchanges.
  virtual void stop() = 0;
  [[nodiscard]] virtual bool running() const = 0;
  [[nodiscard]] virtual uint16_t port() const = 0;
};

// io_uring accept loop with one worker thread per connection.
class HttpListener final : public IHttpListener {
public:
  HttpListener() = default;
  ~HttpListener() override;
  HttpListener(const HttpListener&) = delete;
  HttpListener& operator=(const HttpListener&) = delete;

  bool start(uint16_t port, RequestHandler handler) override;
  void stop() override;
  [[nodiscard]] bool running() const override { return running_.load(); }
  [[nodiscard]] uint16_t port() const override { return port_.load(); }

private:
  struct Worker {
    int fd{-1};
    std::atomic<bool> done{false};
    std::jthread thread;
  };

  void run_loop(std::stop_token st, struct io_uring* ring);
  void handle_client(int client_fd);
  void reap_workers(bool all);

  RequestHandler handler_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
  std::jthread thread_;
  std::mutex workers_mu_;
  std::list<Worker> workers_;
};

} // namespace lanlink::app
