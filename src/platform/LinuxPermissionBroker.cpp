#include "platform/LinuxPermissionBroker.hpp"
#include "util/Subprocess.hpp"

#include <cstdio>

namespace lanlink::platform {

bool LinuxPermissionBroker::request(model::Permission p) {
  bool ok = true;
  switch (p) {
    case model::Permission::Location:
    case model::Permission::NearbyWifiDevices:
      break;
    case model::Permission::AccessWifiState:
    case model::Permission::ChangeWifiState:
      ok = util::executable_on_path("nmcli");
      if (!ok) std::fprintf(stderr, "lanlink: permissions: nmcli not found, %s denied\n", model::to_string(p));
      break;
  }
  std::lock_guard<std::mutex> lk(mu_);
  if (ok) granted_.insert(p); else granted_.erase(p);
  return ok;
}

bool LinuxPermissionBroker::granted(model::Permission p) const {
  std::lock_guard<std::mutex> lk(mu_);
  return granted_.contains(p);
}

} // namespace lanlink::platform
