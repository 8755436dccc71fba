#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "app/EventChannel.hpp"
#include "app/HttpClient.hpp"
#include "app/TransferSessionManager.hpp"

namespace lanlink::app {

// Outbound transfers to another device's sharing server. Both calls block
// until the transfer ends and run as transfer sessions, so the concurrency
// limit and cancel() apply to them like to served requests.
class PeerTransferClient {
public:
  PeerTransferClient(EventChannel& events, TransferSessionManager& transfers, IHttpClient& client);

  // GET url into save_path. Nothing appears at save_path unless the body
  // arrived in full.
  bool download(const std::string& url, const std::filesystem::path& save_path,
                const std::optional<std::string>& password = std::nullopt);

  // POST the raw file to url. A url without a `name` query parameter gets
  // the file name appended, which is what a lanlink /upload expects.
  bool upload(const std::filesystem::path& path, const std::string& url,
              const std::optional<std::string>& password = std::nullopt);

private:
  void fail(const std::string& message);

  EventChannel& events_;
  TransferSessionManager& transfers_;
  IHttpClient& client_;
};

} // namespace lanlink::app
