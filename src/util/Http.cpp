#include "util/Http.hpp"
#include "util/AsciiLower.hpp"

#include <charconv>

namespace lanlink::util {

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r')) sv.remove_suffix(1);
  return sv;
}

static std::optional<std::string> find_header(const HeaderList& headers, std::string_view name) {
  for (const auto& [k, v] : headers)
    if (iequals(k, name)) return v;
  return std::nullopt;
}

static std::optional<uint64_t> parse_length(const std::optional<std::string>& v) {
  if (!v || v->empty()) return std::nullopt;
  uint64_t n = 0;
  auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
  if (ec != std::errc{} || ptr != v->data() + v->size()) return std::nullopt;
  return n;
}

// Header lines up to the blank line; false on a line without a name.
static bool parse_header_lines(std::string_view head, size_t start, HeaderList& out) {
  while (start < head.size()) {
    size_t end = head.find('\n', start);
    if (end == std::string_view::npos) end = head.size();
    std::string_view line = trim(head.substr(start, end - start));
    start = end + 1;
    if (line.empty()) break;
    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    out.emplace_back(std::string(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1))));
  }
  return true;
}

std::optional<std::string> HttpRequest::header(std::string_view name) const { return find_header(headers, name); }

std::optional<std::string> HttpRequest::query_param(std::string_view name) const {
  for (const auto& [k, v] : query)
    if (k == name) return v;
  return std::nullopt;
}

std::optional<uint64_t> HttpRequest::content_length() const { return parse_length(header("Content-Length")); }

std::optional<std::string> HttpResponseHead::header(std::string_view name) const { return find_header(headers, name); }

std::optional<uint64_t> HttpResponseHead::content_length() const { return parse_length(header("Content-Length")); }

std::optional<std::string> percent_decode(std::string_view s, bool plus_as_space) {
  auto hexv = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '%') {
      if (i + 2 >= s.size()) return std::nullopt;
      int hi = hexv(s[i + 1]), lo = hexv(s[i + 2]);
      if (hi < 0 || lo < 0) return std::nullopt;
      out += static_cast<char>(hi * 16 + lo);
      i += 2;
    } else if (c == '+' && plus_as_space) {
      out += ' ';
    } else {
      out += c;
    }
  }
  return out;
}

std::optional<HttpRequest> parse_request_head(std::string_view head) {
  if (head.size() > kMaxRequestHead) return std::nullopt;
  HttpRequest req;

  size_t line_end = head.find('\n');
  std::string_view request_line = trim(head.substr(0, line_end));
  size_t sp1 = request_line.find(' ');
  if (sp1 == std::string_view::npos) return std::nullopt;
  size_t sp2 = request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos) return std::nullopt;
  req.method = std::string(request_line.substr(0, sp1));
  req.target = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
  std::string_view version = request_line.substr(sp2 + 1);
  if (req.method.empty() || req.target.empty() || req.target[0] != '/') return std::nullopt;
  if (!version.starts_with("HTTP/1.")) return std::nullopt;

  std::string_view target(req.target);
  size_t q = target.find('?');
  auto path = percent_decode(target.substr(0, q), false);
  if (!path) return std::nullopt;
  req.path = std::move(*path);
  if (q != std::string_view::npos) {
    std::string_view qs = target.substr(q + 1);
    size_t start = 0;
    while (start <= qs.size()) {
      size_t amp = qs.find('&', start);
      if (amp == std::string_view::npos) amp = qs.size();
      std::string_view pair = qs.substr(start, amp - start);
      if (!pair.empty()) {
        size_t eq = pair.find('=');
        auto k = percent_decode(pair.substr(0, eq), true);
        auto v = percent_decode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1), true);
        if (!k || !v) return std::nullopt;
        req.query.emplace_back(std::move(*k), std::move(*v));
      }
      start = amp + 1;
    }
  }

  if (line_end == std::string_view::npos) return req;
  if (!parse_header_lines(head, line_end + 1, req.headers)) return std::nullopt;
  return req;
}

const char* status_reason(int status) {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 410: return "Gone";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default:  return "Unknown";
  }
}

std::string format_response_head(int status, const HeaderList& headers) {
  std::string out = "HTTP/1.1 ";
  out += std::to_string(status);
  out += ' ';
  out += status_reason(status);
  out += "\r\n";
  for (const auto& [k, v] : headers) {
    out += k;
    out += ": ";
    out += v;
    out += "\r\n";
  }
  out += "Connection: close\r\n\r\n";
  return out;
}

std::string percent_encode(std::string_view s) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    auto u = static_cast<unsigned char>(c);
    bool unreserved = (u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z') || (u >= '0' && u <= '9') || u == '-' ||
                      u == '.' || u == '_' || u == '~';
    if (unreserved) {
      out += c;
    } else {
      out += '%';
      out += kHex[u >> 4];
      out += kHex[u & 0x0F];
    }
  }
  return out;
}

std::optional<Url> parse_url(std::string_view url) {
  static constexpr std::string_view kScheme = "http://";
  if (url.size() < kScheme.size() || !iequals(url.substr(0, kScheme.size()), kScheme)) return std::nullopt;
  std::string_view rest = url.substr(kScheme.size());
  size_t slash = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, slash);
  if (authority.empty() || authority.find('@') != std::string_view::npos) return std::nullopt;

  Url out;
  size_t colon = authority.rfind(':');
  if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
    std::string_view port = authority.substr(colon + 1);
    unsigned v = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), v);
    if (port.empty() || ec != std::errc{} || ptr != port.data() + port.size() || v == 0 || v > 65535)
      return std::nullopt;
    out.port = static_cast<uint16_t>(v);
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) return std::nullopt;
  out.host = std::string(authority);
  if (slash != std::string_view::npos) {
    std::string_view target = rest.substr(slash);
    size_t frag = target.find('#');
    out.target = std::string(target.substr(0, frag));
    if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
  }
  return out;
}

std::string format_request_head(std::string_view method, const Url& url, const HeaderList& headers) {
  std::string out(method);
  out += ' ';
  out += url.target;
  out += " HTTP/1.1\r\nHost: ";
  out += url.host;
  if (url.port != 80) {
    out += ':';
    out += std::to_string(url.port);
  }
  out += "\r\n";
  for (const auto& [k, v] : headers) {
    out += k;
    out += ": ";
    out += v;
    out += "\r\n";
  }
  out += "Connection: close\r\n\r\n";
  return out;
}

std::optional<HttpResponseHead> parse_response_head(std::string_view head) {
  if (head.size() > kMaxRequestHead) return std::nullopt;
  size_t line_end = head.find('\n');
  std::string_view status_line = trim(head.substr(0, line_end));
  if (!status_line.starts_with("HTTP/1.")) return std::nullopt;
  size_t sp = status_line.find(' ');
  if (sp == std::string_view::npos || status_line.size() < sp + 4) return std::nullopt;
  HttpResponseHead out;
  auto code = status_line.substr(sp + 1, 3);
  auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), out.status);
  if (ec != std::errc{} || ptr != code.data() + code.size() || out.status < 100 || out.status > 599)
    return std::nullopt;
  if (line_end == std::string_view::npos) return out;
  if (!parse_header_lines(head, line_end + 1, out.headers)) return std::nullopt;
  return out;
}

} // namespace lanlink::util
