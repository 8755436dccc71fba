#include "app/PeerTransferClient.hpp"

#include <cstdio>
#include <fstream>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace lanlink::app {

namespace {

bool has_query_param(std::string_view target, std::string_view key) {
  size_t q = target.find('?');
  if (q == std::string_view::npos) return false;
  std::string_view qs = target.substr(q + 1);
  size_t start = 0;
  while (start <= qs.size()) {
    size_t amp = qs.find('&', start);
    if (amp == std::string_view::npos) amp = qs.size();
    std::string_view pair = qs.substr(start, amp - start);
    if (pair.substr(0, pair.find('=')) == key) return true;
    start = amp + 1;
  }
  return false;
}

} // namespace

PeerTransferClient::PeerTransferClient(EventChannel& events, TransferSessionManager& transfers, IHttpClient& client)
    : events_(events), transfers_(transfers), client_(client) {}

void PeerTransferClient::fail(const std::string& message) {
  std::fprintf(stderr, "lanlink: peer: %s\n", message.c_str());
  events_.publish(model::events::Error{model::ErrorKind::TransferFailed, message});
}

bool PeerTransferClient::download(const std::string& url, const fs::path& save_path,
                                  const std::optional<std::string>& password) {
  auto target = util::parse_url(url);
  if (!target) {
    fail(url + " is not an http:// URL");
    return false;
  }
  std::error_code ec;
  fs::path dir = save_path.has_parent_path() ? save_path.parent_path() : fs::path(".");
  if (save_path.filename().empty() || !fs::is_directory(dir, ec)) {
    fail("cannot save to " + save_path.string());
    return false;
  }

  auto conn = client_.connect(*target);
  if (!conn) {
    fail("cannot reach " + target->host + ":" + std::to_string(target->port));
    return false;
  }
  util::HeaderList headers{{"Accept", "*/*"}};
  if (password) headers.emplace_back("X-Share-Password", *password);
  std::string head = util::format_request_head("GET", *target, headers);
  if (!conn->send(head.data(), head.size())) {
    fail("could not send the request for " + url);
    return false;
  }
  auto resp = conn->read_head();
  if (!resp) {
    fail("no valid response from " + url);
    return false;
  }
  if (resp->status != 200) {
    fail("download of " + url + " failed with HTTP " + std::to_string(resp->status));
    return false;
  }

  // Unknown length is recorded as 0 and the body runs to connection close.
  auto tid = transfers_.open(model::TransferDirection::Download, save_path.filename().string(),
                             resp->content_length().value_or(0));
  if (!tid) return false;
  fs::path part = save_path;
  part += "." + *tid + ".part";
  std::ofstream out(part, std::ios::binary | std::ios::trunc);
  if (!out) {
    (void)transfers_.cancel(*tid);
    fail("cannot write " + part.string());
    return false;
  }
  auto state = transfers_.run(
      *tid, [&conn](char* buf, size_t cap) { return conn->read_body(buf, cap); },
      [&out](const char* data, size_t n) {
        out.write(data, static_cast<std::streamsize>(n));
        return static_cast<bool>(out);
      });
  out.close();
  if (state != model::TransferState::Completed || !out) {
    fs::remove(part, ec);
    return false;
  }
  fs::rename(part, save_path, ec);
  if (ec) {
    fail("cannot move the download into " + save_path.string() + ": " + ec.message());
    fs::remove(part, ec);
    return false;
  }
  std::fprintf(stderr, "lanlink: peer: saved %s to %s\n", url.c_str(), save_path.c_str());
  return true;
}

bool PeerTransferClient::upload(const fs::path& path, const std::string& url,
                                const std::optional<std::string>& password) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    fail(path.string() + " is not a regular file");
    return false;
  }
  uint64_t size = fs::file_size(path, ec);
  if (ec) {
    fail("cannot stat " + path.string() + ": " + ec.message());
    return false;
  }
  auto target = util::parse_url(url);
  if (!target) {
    fail(url + " is not an http:// URL");
    return false;
  }
  std::string name = path.filename().string();
  if (!has_query_param(target->target, "name")) {
    target->target += target->target.find('?') == std::string::npos ? '?' : '&';
    target->target += "name=" + util::percent_encode(name);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    fail("cannot read " + path.string());
    return false;
  }

  auto conn = client_.connect(*target);
  if (!conn) {
    fail("cannot reach " + target->host + ":" + std::to_string(target->port));
    return false;
  }
  auto tid = transfers_.open(model::TransferDirection::Upload, name, size);
  if (!tid) return false;
  util::HeaderList headers{{"Content-Type", "application/octet-stream"}, {"Content-Length", std::to_string(size)}};
  if (password) headers.emplace_back("X-Share-Password", *password);
  std::string head = util::format_request_head("POST", *target, headers);
  if (!conn->send(head.data(), head.size())) {
    (void)transfers_.cancel(*tid);
    fail("could not send the upload of " + name + " to " + url);
    return false;
  }
  auto state = transfers_.run(
      *tid,
      [&in](char* buf, size_t cap) -> std::ptrdiff_t {
        in.read(buf, static_cast<std::streamsize>(cap));
        if (in.bad()) return -1;
        return static_cast<std::ptrdiff_t>(in.gcount());
      },
      [&conn](const char* data, size_t n) { return conn->send(data, n); });
  if (state != model::TransferState::Completed) return false;

  auto resp = conn->read_head();
  if (!resp) {
    fail("no valid response to the upload of " + name);
    return false;
  }
  if (resp->status < 200 || resp->status >= 300) {
    fail("upload of " + name + " was refused with HTTP " + std::to_string(resp->status));
    return false;
  }
  std::fprintf(stderr, "lanlink: peer: uploaded %s to %s\n", name.c_str(), url.c_str());
  return true;
}

} // namespace lanlink::app
