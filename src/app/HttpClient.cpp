#include "app/HttpClient.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace lanlink::app {

namespace {

class TcpConnection final : public HttpConnection {
public:
  explicit TcpConnection(int fd) : fd_(fd) {}
  ~TcpConnection() override { ::close(fd_); }
  TcpConnection(const TcpConnection&) = delete;
  TcpConnection& operator=(const TcpConnection&) = delete;

  bool send(const char* data, size_t n) override {
    while (n > 0) {
      ssize_t w = ::send(fd_, data, n, MSG_NOSIGNAL);
      if (w < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      data += w;
      n -= static_cast<size_t>(w);
    }
    return true;
  }

  std::optional<util::HttpResponseHead> read_head() override {
    std::string buf;
    char chunk[4096];
    size_t end = std::string::npos;
    while ((end = buf.find("\r\n\r\n")) == std::string::npos) {
      if (buf.size() > util::kMaxRequestHead) return std::nullopt;
      ssize_t n = recv_some(chunk, sizeof(chunk));
      if (n <= 0) return std::nullopt;
      buf.append(chunk, static_cast<size_t>(n));
    }
    auto head = util::parse_response_head(std::string_view(buf).substr(0, end + 2));
    if (!head) return std::nullopt;
    leftover_ = buf.substr(end + 4);
    if (auto len = head->content_length()) remaining_ = *len;
    return head;
  }

  std::ptrdiff_t read_body(char* buf, size_t cap) override {
    if (cap == 0 || (remaining_ && *remaining_ == 0)) return 0;
    size_t want = remaining_ ? static_cast<size_t>(std::min<uint64_t>(cap, *remaining_)) : cap;
    std::ptrdiff_t got = 0;
    if (off_ < leftover_.size()) {
      size_t n = std::min(want, leftover_.size() - off_);
      std::memcpy(buf, leftover_.data() + off_, n);
      off_ += n;
      got = static_cast<std::ptrdiff_t>(n);
    } else {
      ssize_t n = recv_some(buf, want);
      if (n < 0) return -1;
      // Early close with a declared length left is an error, not the end.
      if (n == 0) return remaining_ ? -1 : 0;
      got = n;
    }
    if (remaining_) *remaining_ -= static_cast<uint64_t>(got);
    return got;
  }

private:
  ssize_t recv_some(char* buf, size_t cap) {
    for (;;) {
      ssize_t n = ::recv(fd_, buf, cap, 0);
      if (n < 0 && errno == EINTR) continue;
      return n;
    }
  }

  int fd_;
  std::string leftover_;
  size_t off_{0};
  std::optional<uint64_t> remaining_;  // unset: body runs to connection close
};

} // namespace

std::unique_ptr<HttpConnection> TcpHttpClient::connect(const util::Url& url) {
  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  std::string port = std::to_string(url.port);
  std::string host = url.host;
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);
  int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    std::fprintf(stderr, "lanlink: http client: cannot resolve %s: %s\n", host.c_str(), ::gai_strerror(rc));
    return nullptr;
  }

  struct timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout_.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
  int fd = -1;
  int last_errno = 0;
  for (auto* ai = res; ai; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }
    // SO_SNDTIMEO also bounds connect() on Linux.
    (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
    last_errno = errno;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);
  if (fd < 0) {
    std::fprintf(stderr, "lanlink: http client: cannot connect to %s:%u: %s\n", host.c_str(),
                 static_cast<unsigned>(url.port), std::strerror(last_errno));
    return nullptr;
  }
  return std::make_unique<TcpConnection>(fd);
}

} // namespace lanlink::app
