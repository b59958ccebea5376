#include "internal/upload/sysfs_network_monitor.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"

namespace chunkcam::upload {

namespace fs = std::filesystem;

namespace {

std::string ReadFirstLine(const fs::path& path) {
  std::ifstream in(path);
  std::string   line;
  std::getline(in, line);
  return line;
}

bool IsWireless(const fs::path& iface) {
  std::error_code ec;
  return fs::exists(iface / "wireless", ec) || fs::exists(iface / "phy80211", ec);
}

} // namespace

SysfsNetworkMonitor::SysfsNetworkMonitor(fs::path sysfs_net) : sysfs_net_(std::move(sysfs_net)) {
}

bool SysfsNetworkMonitor::IsConnected() const {
  return AnyInterfaceUp(false);
}

bool SysfsNetworkMonitor::IsOnWifi() const {
  return AnyInterfaceUp(true);
}

bool SysfsNetworkMonitor::AnyInterfaceUp(bool wireless_only) const {
  std::error_code ec;
  fs::directory_iterator it(sysfs_net_, ec);
  if (ec) {
    CHUNKCAM_LOG_WARN("cannot read network interfaces", {observability::StringField("path", sysfs_net_.string()),
                                                          observability::StringField("error", ec.message())});
    return false;
  }

  for (const auto& entry : it) {
    const auto& iface = entry.path();
    if (iface.filename() == "lo") continue;
    if (wireless_only && !IsWireless(iface)) continue;
    if (ReadFirstLine(iface / "operstate") == "up") return true;
  }
  return false;
}

} // namespace chunkcam::upload
