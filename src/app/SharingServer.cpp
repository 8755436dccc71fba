#include "app/SharingServer.hpp"
#include "util/Crypto.hpp"
#include "util/Json.hpp"
#include "util/QrCode.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <fstream>
#include <mutex>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace lanlink::app {

namespace {

void send_status(HttpExchange& ex, int status, std::string_view detail = {}) {
  std::string body = std::to_string(status) + ' ' + util::status_reason(status);
  if (!detail.empty()) {
    body += ": ";
    body += detail;
  }
  body += '\n';
  if (ex.send_head(status, {{"Content-Type", "text/plain; charset=utf-8"},
                            {"Content-Length", std::to_string(body.size())}}))
    (void)ex.send_body(body.data(), body.size());
}

void send_json(HttpExchange& ex, int status, const std::string& body) {
  if (ex.send_head(status, {{"Content-Type", "application/json"}, {"Content-Length", std::to_string(body.size())}}))
    (void)ex.send_body(body.data(), body.size());
}

int status_for(AccessResult r) {
  switch (r) {
    case AccessResult::Granted: return 200;
    case AccessResult::NotFound: return 404;
    case AccessResult::Gone: return 410;
    case AccessResult::Unauthorized: return 401;
  }
  return 500;
}

std::optional<std::string> supplied_password(const util::HttpRequest& req) {
  if (auto q = req.query_param("password")) return q;
  return req.header("X-Share-Password");
}

// Upload names are a single path component.
bool safe_upload_name(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  return name.find_first_of(std::string_view("/\\\0", 3)) == std::string::npos;
}

std::string disposition_name(std::string name) {
  for (char& c : name)
    if (c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20) c = '_';
  return name;
}

int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

void append_html_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out += c;
    }
  }
}

// Holds an upload name for the lifetime of one POST.
class UploadClaim {
public:
  UploadClaim(std::mutex& mu, std::set<std::string>& names, std::string name)
      : mu_(mu), names_(names), name_(std::move(name)) {
    std::lock_guard<std::mutex> lk(mu_);
    held_ = names_.insert(name_).second;
  }
  ~UploadClaim() {
    if (!held_) return;
    std::lock_guard<std::mutex> lk(mu_);
    names_.erase(name_);
  }
  UploadClaim(const UploadClaim&) = delete;
  UploadClaim& operator=(const UploadClaim&) = delete;

  [[nodiscard]] bool held() const { return held_; }

private:
  std::mutex& mu_;
  std::set<std::string>& names_;
  std::string name_;
  bool held_{false};
};

} // namespace

const char* to_string(AccessResult r) {
  switch (r) {
    case AccessResult::Granted: return "granted";
    case AccessResult::NotFound: return "not_found";
    case AccessResult::Gone: return "gone";
    case AccessResult::Unauthorized: return "unauthorized";
  }
  return "unknown";
}

SharingServer::SharingServer(EventChannel& events, IHttpListener& listener, TransferSessionManager& transfers,
                             const util::Clock& clock, AddressSource address)
    : events_(events), listener_(listener), transfers_(transfers), clock_(clock), address_(std::move(address)) {}

SharingServer::~SharingServer() { stop(); }

void SharingServer::fail(const std::string& message) {
  std::fprintf(stderr, "lanlink: sharing: %s\n", message.c_str());
  events_.publish(model::events::Error{model::ErrorKind::SharingServerError, message});
}

bool SharingServer::configure(const SharingOptions& opts) {
  if (!opts.upload_dir.empty()) {
    std::error_code ec;
    fs::create_directories(opts.upload_dir, ec);
    if (ec) {
      fail("cannot create upload directory " + opts.upload_dir.string() + ": " + ec.message());
      return false;
    }
  }
  std::lock_guard<std::mutex> lk(mu_);
  options_ = opts;
  return true;
}

bool SharingServer::reconfigure(const SharingOptions& opts) {
  std::lock_guard<std::mutex> op(op_mu_);
  SharingOptions previous = options();
  if (!configure(opts)) return false;

  bool explicit_port = false;
  bool requested_qr = true;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_) return true;
    if (last_start_) {
      explicit_port = last_start_->port.has_value();
      requested_qr = last_start_->enable_qr_code;
    }
    qr_enabled_ = requested_qr && opts.enable_qr_code;
  }
  uint16_t old_port = listener_.port();
  if (explicit_port || opts.default_port == old_port) return true;

  transfers_.cancel_all();
  listener_.stop();
  events_.publish(model::events::SharingServerStopped{});
  if (bind_listener(opts.default_port)) {
    rebase_urls();
    std::fprintf(stderr, "lanlink: sharing: moved from port %u to %u\n", static_cast<unsigned>(old_port),
                 static_cast<unsigned>(listener_.port()));
    events_.publish(model::events::SharingServerStarted{listener_.port()});
    return true;
  }

  fail("could not move the sharing server to port " + std::to_string(opts.default_port) +
       ", restoring port " + std::to_string(old_port));
  {
    std::lock_guard<std::mutex> lk(mu_);
    options_ = previous;
    qr_enabled_ = requested_qr && previous.enable_qr_code;
  }
  if (bind_listener(old_port)) {
    rebase_urls();
    events_.publish(model::events::SharingServerStarted{listener_.port()});
    return false;
  }
  fail("could not restore the sharing server on port " + std::to_string(old_port));
  {
    std::lock_guard<std::mutex> lk(mu_);
    running_ = false;
    entries_.clear();
    server_password_hash_.reset();
  }
  return false;
}

SharingOptions SharingServer::options() const {
  std::lock_guard<std::mutex> lk(mu_);
  return options_;
}

bool SharingServer::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  return running_;
}

uint16_t SharingServer::port() const {
  return running() ? listener_.port() : 0;
}

std::optional<ServerStartRequest> SharingServer::last_start_request() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_start_;
}

bool SharingServer::start(const ServerStartRequest& req) {
  std::lock_guard<std::mutex> op(op_mu_);
  return start_locked(req);
}

bool SharingServer::start_locked(const ServerStartRequest& req) {
  if (running()) {
    fail("sharing server already running on port " + std::to_string(listener_.port()));
    return false;
  }
  SharingOptions opts = options();

  if (req.enable_password && (!req.password || req.password->empty())) {
    fail("password protection requested without a password");
    return false;
  }
  std::optional<std::string> hash;
  if (req.password && !req.password->empty()) {
    hash = util::hash_password(*req.password);
    if (!hash) {
      fail("could not hash the server password");
      return false;
    }
  }
  if (req.directory) {
    std::error_code ec;
    if (!fs::is_directory(*req.directory, ec)) {
      fail(req.directory->string() + " is not a directory");
      return false;
    }
  }

  uint16_t port = req.port.value_or(opts.default_port);
  if (!bind_listener(port)) {
    fail("could not start the sharing server on port " + std::to_string(port));
    return false;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
    server_password_hash_ = hash;
    qr_enabled_ = req.enable_qr_code && opts.enable_qr_code;
    last_start_ = req;
    running_ = true;
  }
  if (req.directory) {
    size_t n = register_directory(*req.directory, hash);
    std::fprintf(stderr, "lanlink: sharing: registered %zu file(s) from %s\n", n, req.directory->c_str());
  }
  std::fprintf(stderr, "lanlink: sharing: server up on port %u\n", static_cast<unsigned>(listener_.port()));
  events_.publish(model::events::SharingServerStarted{listener_.port()});
  return true;
}

bool SharingServer::bind_listener(uint16_t port) {
  try {
    return listener_.start(port, [this](const util::HttpRequest& r, HttpExchange& ex) { handle(r, ex); });
  } catch (const std::exception& e) {
    std::fprintf(stderr, "lanlink: sharing: listener start on port %u threw: %s\n", static_cast<unsigned>(port),
                 e.what());
  }
  return false;
}

// Entries keep their ids; only host and port change.
void SharingServer::rebase_urls() {
  const std::string base = url_base();
  std::vector<std::pair<std::string, std::string>> redraw;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& e : entries_) {
      e.url = base + "/share/" + e.id;
      if (e.qr_payload) e.qr_payload = e.url;
      if (e.qr_image) {
        e.qr_image.reset();
        redraw.emplace_back(e.id, e.url);
      }
    }
  }
  for (auto& [id, url] : redraw) {
    auto svg = util::qr_svg(url);
    if (!svg) continue;
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const auto& e) { return e.id == id; });
    if (it != entries_.end() && it->url == url) it->qr_image = std::move(svg);
  }
}

size_t SharingServer::register_directory(const fs::path& dir, const std::optional<std::string>& password_hash) {
  SharingOptions opts = options();
  auto now = clock_.now();
  std::vector<model::SharedFileEntry> found;
  std::error_code ec;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    std::error_code fec;
    if (!it->is_regular_file(fec)) continue;
    uint64_t size = it->file_size(fec);
    if (fec) continue;
    if (size > opts.max_file_size) {
      std::fprintf(stderr, "lanlink: sharing: skipping %s (%llu bytes over the limit)\n",
                   it->path().c_str(), static_cast<unsigned long long>(size));
      continue;
    }
    std::string id = util::random_id();
    if (id.empty()) break;
    model::SharedFileEntry e;
    e.id = id;
    e.path = it->path();
    e.name = it->path().filename().string();
    e.size = size;
    e.password_hash = password_hash;
    if (opts.session_timeout.count() > 0) e.expires_at = now + opts.session_timeout;
    e.created_at = now;
    e.url = make_url(id);
    found.push_back(std::move(e));
  }
  if (ec) std::fprintf(stderr, "lanlink: sharing: walking %s: %s\n", dir.c_str(), ec.message().c_str());

  std::lock_guard<std::mutex> lk(mu_);
  for (auto& e : found) {
    if (qr_enabled_) e.qr_payload = e.url;
    entries_.push_back(std::move(e));
  }
  return found.size();
}

std::string SharingServer::url_base() const {
  std::string host;
  if (address_) host = address_();
  if (host.empty()) host = "127.0.0.1";
  return "http://" + host + ":" + std::to_string(listener_.port());
}

std::string SharingServer::make_url(const std::string& id) const { return url_base() + "/share/" + id; }

void SharingServer::stop() {
  std::lock_guard<std::mutex> op(op_mu_);
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_) return;
    running_ = false;
  }
  transfers_.cancel_all();
  listener_.stop();
  {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
    server_password_hash_.reset();
  }
  std::fprintf(stderr, "lanlink: sharing: server stopped\n");
  events_.publish(model::events::SharingServerStopped{});
}

std::optional<std::string> SharingServer::share_file(const ShareRequest& req) {
  std::lock_guard<std::mutex> op(op_mu_);
  SharingOptions opts = options();

  std::error_code ec;
  if (!fs::is_regular_file(req.path, ec)) {
    fail(req.path.string() + " is not a regular file");
    return std::nullopt;
  }
  uint64_t size = fs::file_size(req.path, ec);
  if (ec) {
    fail("cannot stat " + req.path.string() + ": " + ec.message());
    return std::nullopt;
  }
  if (size > opts.max_file_size) {
    fail(req.path.string() + " is " + std::to_string(size) + " bytes, over the limit of " +
         std::to_string(opts.max_file_size));
    return std::nullopt;
  }
  bool want_password = req.enable_password || opts.enable_password_protection;
  bool has_password = req.password && !req.password->empty();
  if (want_password && !has_password) {
    fail("password protection requested for " + req.path.string() + " without a password");
    return std::nullopt;
  }
  std::optional<std::string> hash;
  if (has_password) {
    hash = util::hash_password(*req.password);
    if (!hash) {
      fail("could not hash the share password");
      return std::nullopt;
    }
  }

  if (!running()) {
    ServerStartRequest lazy;
    lazy.enable_qr_code = opts.enable_qr_code;
    if (!start_locked(lazy)) return std::nullopt;
  }

  std::string id = util::random_id();
  if (id.empty()) {
    fail("could not allocate a share id");
    return std::nullopt;
  }

  auto now = clock_.now();
  model::SharedFileEntry e;
  e.id = id;
  e.path = req.path;
  e.name = (req.custom_name && !req.custom_name->empty()) ? *req.custom_name : req.path.filename().string();
  e.size = size;
  e.password_hash = std::move(hash);
  if (req.expiry)
    e.expires_at = now + *req.expiry;
  else if (opts.session_timeout.count() > 0)
    e.expires_at = now + opts.session_timeout;
  e.created_at = now;
  e.url = make_url(id);
  bool want_qr = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    want_qr = req.generate_qr_code && qr_enabled_;
  }
  if (want_qr) {
    e.qr_payload = e.url;
    e.qr_image = util::qr_svg(e.url);
    if (!e.qr_image) fail("could not encode a QR code for share " + id);
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.push_back(std::move(e));
  }
  events_.publish(model::events::FileShared{req.path.string(), id});
  return id;
}

bool SharingServer::unshare(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  return std::erase_if(entries_, [&](const model::SharedFileEntry& e) { return e.id == id; }) > 0;
}

std::optional<std::string> SharingServer::generate_qr_code(const std::string& id) {
  std::string url;
  bool have_image = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const auto& e) { return e.id == id; });
    if (it != entries_.end()) {
      url = it->url;
      have_image = it->qr_image && it->qr_payload == it->url;
    }
  }
  if (url.empty()) {
    fail("no shared file with id " + id);
    return std::nullopt;
  }
  if (!have_image) {
    auto svg = util::qr_svg(url);
    if (!svg) {
      fail("could not encode a QR code for share " + id);
      return std::nullopt;
    }
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const auto& e) { return e.id == id; });
    if (it != entries_.end() && it->url == url) {
      it->qr_payload = url;
      it->qr_image = std::move(svg);
    }
  }
  events_.publish(model::events::QrCodeGenerated{id});
  return url;
}

AccessResult SharingServer::lookup(const std::string& id, model::SharedFileEntry* out) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const auto& e) { return e.id == id; });
  if (it == entries_.end()) return AccessResult::NotFound;
  if (it->expired(clock_.now())) return AccessResult::Gone;
  if (out) *out = *it;
  return AccessResult::Granted;
}

AccessResult SharingServer::check_access(const std::string& id, const std::optional<std::string>& password) const {
  model::SharedFileEntry e;
  AccessResult r = lookup(id, &e);
  if (r != AccessResult::Granted) return r;
  if (e.requires_password() && (!password || !util::verify_password(*password, *e.password_hash)))
    return AccessResult::Unauthorized;
  return AccessResult::Granted;
}

std::vector<model::SharedFileEntry> SharingServer::shared_files() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_;
}

size_t SharingServer::sweep_expired() {
  auto now = clock_.now();
  size_t removed = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    removed = std::erase_if(entries_, [&](const model::SharedFileEntry& e) { return e.expired(now); });
  }
  if (removed) std::fprintf(stderr, "lanlink: sharing: dropped %zu expired link(s)\n", removed);
  return removed;
}

void SharingServer::handle(const util::HttpRequest& req, HttpExchange& ex) {
  if (!running()) {
    send_status(ex, 503);
    return;
  }
  const std::string& path = req.path;
  static constexpr std::string_view kShare = "/share/";
  static constexpr std::string_view kDownload = "/download/";
  static constexpr std::string_view kQr = "/qrcode";

  if (path == "/upload") {
    if (req.method != "POST") { send_status(ex, 405); return; }
    serve_upload(req, ex);
    return;
  }
  if (req.method != "GET") {
    send_status(ex, 405);
    return;
  }
  if (path == "/" || path == "/index.html") {
    serve_index(ex);
    return;
  }
  if (path == "/api/files") {
    serve_listing(ex);
    return;
  }
  if (path.starts_with(kShare)) {
    std::string rest = path.substr(kShare.size());
    if (rest.size() > kQr.size() && rest.ends_with(kQr)) {
      std::string id = rest.substr(0, rest.size() - kQr.size());
      if (id.find('/') == std::string::npos) {
        serve_qrcode(id, ex);
        return;
      }
    } else if (!rest.empty() && rest.find('/') == std::string::npos) {
      serve_download(rest, req, ex);
      return;
    }
  } else if (path.starts_with(kDownload)) {
    std::string id = path.substr(kDownload.size());
    if (!id.empty() && id.find('/') == std::string::npos) {
      serve_download(id, req, ex);
      return;
    }
  }
  send_status(ex, 404);
}

void SharingServer::serve_download(const std::string& id, const util::HttpRequest& req, HttpExchange& ex) {
  AccessResult access = check_access(id, supplied_password(req));
  if (access != AccessResult::Granted) {
    send_status(ex, status_for(access));
    return;
  }
  model::SharedFileEntry e;
  if (lookup(id, &e) != AccessResult::Granted) {
    send_status(ex, 404);
    return;
  }

  std::error_code ec;
  uint64_t size = fs::file_size(e.path, ec);
  std::ifstream in(e.path, std::ios::binary);
  if (ec || !in) {
    std::fprintf(stderr, "lanlink: sharing: %s is no longer readable\n", e.path.c_str());
    send_status(ex, 404, "file is no longer available");
    return;
  }

  auto tid = transfers_.open(model::TransferDirection::Download, e.name, size);
  if (!tid) {
    send_status(ex, 503, "too many concurrent transfers");
    return;
  }
  util::HeaderList headers{
      {"Content-Type", "application/octet-stream"},
      {"Content-Length", std::to_string(size)},
      {"Content-Disposition", "attachment; filename=\"" + disposition_name(e.name) + "\""},
  };
  if (!ex.send_head(200, headers)) {
    (void)transfers_.cancel(*tid);
    return;
  }

  auto state = transfers_.run(
      *tid,
      [&in](char* buf, size_t cap) -> std::ptrdiff_t {
        in.read(buf, static_cast<std::streamsize>(cap));
        if (in.bad()) return -1;
        return static_cast<std::ptrdiff_t>(in.gcount());
      },
      [&ex](const char* data, size_t n) { return ex.send_body(data, n); });

  if (state == model::TransferState::Completed) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const auto& x) { return x.id == id; });
    if (it != entries_.end()) ++it->download_count;
  }
}

void SharingServer::serve_qrcode(const std::string& id, HttpExchange& ex) {
  model::SharedFileEntry e;
  AccessResult r = lookup(id, &e);
  if (r != AccessResult::Granted) {
    send_status(ex, status_for(r));
    return;
  }
  // Directory entries are rendered on first request.
  std::optional<std::string> svg = e.qr_image;
  if (!svg) svg = util::qr_svg(e.qr_payload.value_or(e.url));
  if (!svg) {
    send_status(ex, 500, "QR encoding failed");
    return;
  }
  if (ex.send_head(200, {{"Content-Type", "image/svg+xml"}, {"Content-Length", std::to_string(svg->size())}}))
    (void)ex.send_body(svg->data(), svg->size());
}

void SharingServer::serve_listing(HttpExchange& ex) {
  auto now = clock_.now();
  util::JsonWriter w;
  w.begin_object().key("files").begin_array();
  for (const auto& e : shared_files()) {
    if (e.expired(now)) continue;
    w.begin_object();
    w.key("id").value(e.id);
    w.key("name").value(e.name);
    w.key("size").value(e.size);
    w.key("requiresPassword").value(e.requires_password());
    w.key("expiresAt");
    if (e.expires_at) w.value(epoch_ms(*e.expires_at)); else w.null();
    w.key("downloadCount").value(e.download_count);
    w.key("url").value(e.url);
    w.end_object();
  }
  w.end_array().end_object();
  send_json(ex, 200, w.take());
}

void SharingServer::serve_index(HttpExchange& ex) {
  auto now = clock_.now();
  std::string body =
      "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>lanlink shares</title></head>\n<body>\n"
      "<h1>Shared files</h1>\n<ul>\n";
  size_t live = 0;
  for (const auto& e : shared_files()) {
    if (e.expired(now)) continue;
    ++live;
    body += "<li><a href=\"/share/";
    append_html_escaped(body, e.id);
    body += "\">";
    append_html_escaped(body, e.name);
    body += "</a> (" + std::to_string(e.size) + " bytes)";
    if (e.requires_password()) body += " [password]";
    body += " <a href=\"/share/";
    append_html_escaped(body, e.id);
    body += "/qrcode\">QR</a></li>\n";
  }
  if (live == 0) body += "<li>Nothing is shared right now.</li>\n";
  body += "</ul>\n</body></html>\n";
  if (ex.send_head(200, {{"Content-Type", "text/html; charset=utf-8"}, {"Content-Length", std::to_string(body.size())}}))
    (void)ex.send_body(body.data(), body.size());
}

void SharingServer::serve_upload(const util::HttpRequest& req, HttpExchange& ex) {
  SharingOptions opts = options();
  std::optional<std::string> server_hash;
  {
    std::lock_guard<std::mutex> lk(mu_);
    server_hash = server_password_hash_;
  }
  if (opts.upload_dir.empty()) {
    send_status(ex, 404, "uploads are disabled");
    return;
  }
  auto name = req.query_param("name");
  auto length = req.content_length();
  if (!name || !safe_upload_name(*name)) {
    send_status(ex, 400, "missing or invalid name");
    return;
  }
  if (!length) {
    send_status(ex, 400, "Content-Length required");
    return;
  }
  if (server_hash) {
    auto pw = supplied_password(req);
    if (!pw || !util::verify_password(*pw, *server_hash)) {
      send_status(ex, 401);
      return;
    }
  }
  if (*length > opts.max_file_size) {
    send_status(ex, 413);
    return;
  }

  UploadClaim claim(mu_, uploading_, *name);
  if (!claim.held()) {
    send_status(ex, 409, "an upload with this name is in progress");
    return;
  }
  auto tid = transfers_.open(model::TransferDirection::Upload, *name, *length);
  if (!tid) {
    send_status(ex, 503, "too many concurrent transfers");
    return;
  }

  fs::path target = opts.upload_dir / *name;
  fs::path part = target;
  part += "." + *tid + ".part";
  std::ofstream out(part, std::ios::binary | std::ios::trunc);
  if (!out) {
    (void)transfers_.cancel(*tid);
    std::fprintf(stderr, "lanlink: sharing: cannot write %s\n", part.c_str());
    send_status(ex, 500);
    return;
  }
  auto state = transfers_.run(
      *tid, [&ex](char* buf, size_t cap) { return ex.read_body(buf, cap); },
      [&out](const char* data, size_t n) {
        out.write(data, static_cast<std::streamsize>(n));
        return static_cast<bool>(out);
      });
  out.close();

  std::error_code ec;
  if (state != model::TransferState::Completed || !out) {
    fs::remove(part, ec);
    send_status(ex, state == model::TransferState::Cancelled ? 503 : 400, "upload did not complete");
    return;
  }
  fs::rename(part, target, ec);
  if (ec) {
    fs::remove(part, ec);
    send_status(ex, 500);
    return;
  }
  util::JsonWriter w;
  w.begin_object().key("name").value(*name).key("size").value(*length).end_object();
  send_json(ex, 201, w.take());
}

} // namespace lanlink::app
