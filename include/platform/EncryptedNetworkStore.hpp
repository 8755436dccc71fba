#pragma once
#include <filesystem>
#include <optional>
#include <vector>
#include "platform/Platform.hpp"
#include "util/Crypto.hpp"

namespace lanlink::platform {

// Saved networks (passwords included) sealed with AES-256-GCM. The key is a
// random file created 0600 beside the store on first use.
class EncryptedNetworkStore final : public ISavedNetworkStore {
public:
  static constexpr const char* kMagic = "LLNK1";

  // Empty dir means default_dir().
  explicit EncryptedNetworkStore(std::filesystem::path dir = {});

  std::optional<std::vector<model::SavedNetwork>> load() override;
  bool save(const std::vector<model::SavedNetwork>& networks) override;

  [[nodiscard]] const std::filesystem::path& store_path() const { return store_path_; }
  // $XDG_DATA_HOME/lanlink, else ~/.local/share/lanlink.
  [[nodiscard]] static std::filesystem::path default_dir();

private:
  std::optional<util::Bytes> key(bool create);

  std::filesystem::path dir_;
  std::filesystem::path store_path_;
  std::filesystem::path key_path_;
};

} // namespace lanlink::platform
