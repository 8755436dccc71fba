#pragma once
#include <mutex>
#include <set>
#include "platform/Platform.hpp"

namespace lanlink::platform {

// Desktop Linux has no runtime permission prompts. Location and nearby-device
// access are implicit; Wi-Fi state access needs a reachable nmcli.
class LinuxPermissionBroker final : public IPermissionBroker {
public:
  bool request(model::Permission p) override;
  bool granted(model::Permission p) const override;

private:
  mutable std::mutex mu_;
  std::set<model::Permission> granted_;
};

} // namespace lanlink::platform
