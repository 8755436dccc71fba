#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "app/EventChannel.hpp"
#include "app/HttpListener.hpp"
#include "app/TransferSessionManager.hpp"
#include "model/Share.hpp"
#include "util/Clock.hpp"

namespace lanlink::app {

// Settings derived from NetworkConfig.
struct SharingOptions {
  uint16_t default_port{8080};
  bool enable_qr_code{true};
  bool enable_password_protection{false};
  std::chrono::seconds session_timeout{3600};  // 0 = links never expire
  uint64_t max_file_size{100ull * 1024 * 1024};
  std::filesystem::path upload_dir;            // empty disables POST /upload
};

struct ShareRequest {
  std::filesystem::path path;
  std::optional<std::string> custom_name;
  bool generate_qr_code{true};
  bool enable_password{false};
  std::optional<std::string> password;
  // Relative to now; negative means already expired. Unset uses session_timeout.
  std::optional<std::chrono::seconds> expiry;
};

struct ServerStartRequest {
  std::optional<std::filesystem::path> directory;
  std::optional<uint16_t> port;
  bool enable_qr_code{true};
  bool enable_password{false};
  std::optional<std::string> password;  // protects directory entries and uploads
};

enum class AccessResult { Granted, NotFound, Gone, Unauthorized };

[[nodiscard]] const char* to_string(AccessResult r);

// Embedded file server. The shared-file registry only lives while the
// listener runs; expired links answer 410 until the periodic sweep drops them.
class SharingServer {
public:
  using AddressSource = std::function<std::string()>;
  static constexpr std::chrono::seconds kSweepInterval{30};

  SharingServer(EventChannel& events, IHttpListener& listener, TransferSessionManager& transfers,
                const util::Clock& clock, AddressSource address);
  ~SharingServer();
  SharingServer(const SharingServer&) = delete;
  SharingServer& operator=(const SharingServer&) = delete;

  // Takes effect for the next start; creates the upload directory.
  bool configure(const SharingOptions& opts);
  // Applies options to a live server. One that runs on the default port
  // follows a new default_port, keeping its shares. When the new port cannot
  // be bound the previous options and port are restored and false is returned.
  bool reconfigure(const SharingOptions& opts);
  [[nodiscard]] SharingOptions options() const;

  // Fails (with an Error event) when already running.
  bool start(const ServerStartRequest& req);
  void stop();
  [[nodiscard]] bool running() const;
  [[nodiscard]] uint16_t port() const;
  [[nodiscard]] std::optional<ServerStartRequest> last_start_request() const;

  // Returns the share id. Starts the server on the default port if needed.
  std::optional<std::string> share_file(const ShareRequest& req);
  bool unshare(const std::string& id);
  std::optional<std::string> generate_qr_code(const std::string& id);

  [[nodiscard]] AccessResult check_access(const std::string& id, const std::optional<std::string>& password) const;
  [[nodiscard]] std::vector<model::SharedFileEntry> shared_files() const;
  size_t sweep_expired();

  // HTTP entry point, called on listener worker threads.
  void handle(const util::HttpRequest& req, HttpExchange& ex);

private:
  bool start_locked(const ServerStartRequest& req);
  bool bind_listener(uint16_t port);
  void rebase_urls();
  size_t register_directory(const std::filesystem::path& dir, const std::optional<std::string>& password_hash);
  std::string url_base() const;
  std::string make_url(const std::string& id) const;
  AccessResult lookup(const std::string& id, model::SharedFileEntry* out) const;
  void fail(const std::string& message);

  void serve_download(const std::string& id, const util::HttpRequest& req, HttpExchange& ex);
  void serve_qrcode(const std::string& id, HttpExchange& ex);
  void serve_listing(HttpExchange& ex);
  void serve_index(HttpExchange& ex);
  void serve_upload(const util::HttpRequest& req, HttpExchange& ex);

  EventChannel& events_;
  IHttpListener& listener_;
  TransferSessionManager& transfers_;
  const util::Clock& clock_;
  AddressSource address_;

  std::mutex op_mu_;          // start, stop, reconfigure and share_file
  mutable std::mutex mu_;
  SharingOptions options_{};
  bool running_{false};
  bool qr_enabled_{true};
  std::optional<std::string> server_password_hash_;
  std::optional<ServerStartRequest> last_start_;
  std::vector<model::SharedFileEntry> entries_;
  std::set<std::string> uploading_;  // upload names currently being received
};

} // namespace lanlink::app
