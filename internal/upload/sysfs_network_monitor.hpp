#pragma once

#include <filesystem>

#include "internal/upload/network_monitor.hpp"

namespace chunkcam::upload {

/*
  Reads link state from /sys/class/net.

  An interface counts when its operstate is "up" and it is not loopback.
  Wireless interfaces are the ones exposing a `wireless` or `phy80211` entry.
*/
class SysfsNetworkMonitor final : public NetworkMonitor {
 public:
  explicit SysfsNetworkMonitor(std::filesystem::path sysfs_net = "/sys/class/net");

  bool IsConnected() const override;
  bool IsOnWifi() const override;

 private:
  bool AnyInterfaceUp(bool wireless_only) const;

  std::filesystem::path sysfs_net_;
};

} // namespace chunkcam::upload
