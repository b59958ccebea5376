#pragma once

namespace chunkcam::upload {

class NetworkMonitor {
 public:
  virtual ~NetworkMonitor() = default;

  virtual bool IsConnected() const = 0;
  virtual bool IsOnWifi() const    = 0;
};

} // namespace chunkcam::upload
