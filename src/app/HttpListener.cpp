#include "app/HttpListener.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <future>
#include <iterator>

namespace lanlink::app {

namespace {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

bool send_all(int fd, const char* data, size_t n) {
  while (n > 0) {
    ssize_t w = ::send(fd, data, n, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += w;
    n -= static_cast<size_t>(w);
  }
  return true;
}

class SocketExchange final : public HttpExchange {
public:
  SocketExchange(int fd, std::string leftover, uint64_t body_len)
      : fd_(fd), leftover_(std::move(leftover)), remaining_(body_len) {}

  std::ptrdiff_t read_body(char* buf, size_t cap) override {
    if (remaining_ == 0 || cap == 0) return 0;
    size_t want = static_cast<size_t>(std::min<uint64_t>(cap, remaining_));
    if (off_ < leftover_.size()) {
      size_t n = std::min(want, leftover_.size() - off_);
      std::memcpy(buf, leftover_.data() + off_, n);
      off_ += n;
      remaining_ -= n;
      return static_cast<std::ptrdiff_t>(n);
    }
    for (;;) {
      ssize_t n = ::recv(fd_, buf, want, 0);
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) return n == 0 ? 0 : -1;
      remaining_ -= static_cast<uint64_t>(n);
      return n;
    }
  }

  bool send_head(int status, const util::HeaderList& headers) override {
    if (head_sent_) return false;
    head_sent_ = true;
    auto head = util::format_response_head(status, headers);
    return send_all(fd_, head.data(), head.size());
  }

  bool send_body(const char* data, size_t n) override {
    if (!head_sent_) return false;
    return send_all(fd_, data, n);
  }

  bool head_sent() const override { return head_sent_; }

private:
  int fd_;
  std::string leftover_;
  size_t off_{0};
  uint64_t remaining_;
  bool head_sent_{false};
};

void send_simple(HttpExchange& ex, int status) {
  std::string body = std::to_string(status) + ' ' + util::status_reason(status) + '\n';
  if (ex.send_head(status, {{"Content-Type", "text/plain"}, {"Content-Length", std::to_string(body.size())}}))
    (void)ex.send_body(body.data(), body.size());
}

} // namespace

HttpListener::~HttpListener() { stop(); }

bool HttpListener::start(uint16_t port, RequestHandler handler) {
  if (running_.load()) return false;

  // Create listening socket
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    std::fprintf(stderr, "lanlink: http listener: socket() failed: %s\n", std::strerror(errno));
    return false;
  }

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = INADDR_ANY;

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::fprintf(stderr, "lanlink: http listener: bind(:%d) failed: %s\n", port, std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  if (::listen(listen_fd_, 16) < 0) {
    std::fprintf(stderr, "lanlink: http listener: listen() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0)
    port_.store(ntohs(addr.sin_port));
  else
    port_.store(port);

  // Create eventfd for clean shutdown
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "lanlink: http listener: eventfd() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  handler_ = std::move(handler);
  std::promise<bool> ready;
  auto ready_f = ready.get_future();
  thread_ = std::jthread([this, &ready](std::stop_token st) {
    // Initialize io_uring on the loop thread and report back
    struct io_uring ring{};
    if (io_uring_queue_init(16, &ring, 0) < 0) {
      std::fprintf(stderr, "lanlink: http listener: io_uring_queue_init() failed: %s\n", std::strerror(errno));
      ready.set_value(false);
      return;
    }
    ready.set_value(true);
    run_loop(st, &ring);
    io_uring_queue_exit(&ring);
  });
  if (!ready_f.get()) {
    thread_.join();
    thread_ = std::jthread{};
    ::close(stop_eventfd_);
    stop_eventfd_ = -1;
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }
  running_.store(true);
  std::fprintf(stderr, "lanlink: http listener on :%d\n", port_.load());
  return true;
}

void HttpListener::stop() {
  if (stop_eventfd_ >= 0) {
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
  }
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
    thread_ = std::jthread{};
  }
  reap_workers(true);
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
  running_.store(false);
  port_.store(0);
}

void HttpListener::run_loop(std::stop_token st, struct io_uring* ring) {
  // Submit poll requests for listen_fd and stop_eventfd
  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(ring);

  // Event loop
  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) {
      break;
    }

    if (tag == UringTag::ListenPoll && res >= 0) {
      reap_workers(false);
      // Drain the accept queue, one worker per connection
      for (;;) {
        int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) break;
        std::lock_guard<std::mutex> lk(workers_mu_);
        auto& w = workers_.emplace_back();
        w.fd = client_fd;
        Worker* wp = &w;
        w.thread = std::jthread([this, wp] {
          handle_client(wp->fd);
          wp->done.store(true);
        });
      }
      // Re-arm listen poll
      submit_poll(listen_fd_, UringTag::ListenPoll);
      io_uring_submit(ring);
    }
  }
}

void HttpListener::reap_workers(bool all) {
  std::list<Worker> finished;
  {
    std::lock_guard<std::mutex> lk(workers_mu_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (all || it->done.load()) {
        // Wake a worker blocked on a slow peer
        if (all && !it->done.load()) (void)::shutdown(it->fd, SHUT_RDWR);
        auto next = std::next(it);
        finished.splice(finished.end(), workers_, it);
        it = next;
      } else {
        ++it;
      }
    }
  }
  for (auto& w : finished) {
    if (w.thread.joinable()) w.thread.join();
    ::close(w.fd);
  }
}

void HttpListener::handle_client(int fd) {
  // Set timeouts to prevent slow clients from blocking a worker forever
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  // Read until the blank line that ends the head
  std::string raw;
  size_t head_end = std::string::npos;
  char buf[4096];
  while (head_end == std::string::npos) {
    ssize_t nr = ::recv(fd, buf, sizeof(buf), 0);
    if (nr < 0 && errno == EINTR) continue;
    if (nr <= 0) return;
    raw.append(buf, static_cast<size_t>(nr));
    head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos && raw.size() > util::kMaxRequestHead) break;
  }

  SocketExchange bad(fd, {}, 0);
  if (head_end == std::string::npos) { send_simple(bad, 400); return; }
  auto req = util::parse_request_head(std::string_view(raw).substr(0, head_end));
  if (!req) { send_simple(bad, 400); return; }

  SocketExchange ex(fd, raw.substr(head_end + 4), req->content_length().value_or(0));
  try {
    handler_(*req, ex);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "lanlink: http listener: handler failed on %s %s: %s\n",
                 req->method.c_str(), req->path.c_str(), e.what());
  }
  if (!ex.head_sent()) send_simple(ex, 500);
  (void)::shutdown(fd, SHUT_WR);
}

} // namespace lanlink::app
