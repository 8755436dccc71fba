#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lanlink::util {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

inline constexpr size_t kMaxRequestHead = 16 * 1024;

struct HttpRequest {
  std::string method;
  std::string target;   // as sent
  std::string path;     // percent-decoded, query removed
  std::vector<std::pair<std::string, std::string>> query;
  HeaderList headers;

  // Header names compare case-insensitively.
  [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
  [[nodiscard]] std::optional<std::string> query_param(std::string_view name) const;
  // nullopt when absent or malformed.
  [[nodiscard]] std::optional<uint64_t> content_length() const;
};

// Parses the request line and headers (everything before the blank line).
[[nodiscard]] std::optional<HttpRequest> parse_request_head(std::string_view head);

// nullopt on a truncated or non-hex escape.
[[nodiscard]] std::optional<std::string> percent_decode(std::string_view s, bool plus_as_space);

[[nodiscard]] const char* status_reason(int status);
[[nodiscard]] std::string format_response_head(int status, const HeaderList& headers);

// Unreserved characters pass through, everything else becomes %XX.
[[nodiscard]] std::string percent_encode(std::string_view s);

// http:// only; no userinfo.
struct Url {
  std::string host;
  uint16_t port{80};
  std::string target{"/"};  // path and query, as sent on the request line
};
[[nodiscard]] std::optional<Url> parse_url(std::string_view url);

// Adds Host and Connection: close.
[[nodiscard]] std::string format_request_head(std::string_view method, const Url& url, const HeaderList& headers);

struct HttpResponseHead {
  int status{0};
  HeaderList headers;

  [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
  [[nodiscard]] std::optional<uint64_t> content_length() const;
};

// Status line and headers (everything before the blank line).
[[nodiscard]] std::optional<HttpResponseHead> parse_response_head(std::string_view head);

} // namespace lanlink::util
