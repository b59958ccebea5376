#pragma once

#include <filesystem>

namespace chunkcam::util {

/*
  Exclusive advisory lock (flock) on a file, held for the object's lifetime.

  The daemon holds it while it runs; chunkcamctl takes it before touching
  the queue or the recordings so the two never write the same state.
*/
class InstanceLock {
 public:
  // Throws InstanceLocked when another holder has it, std::system_error when
  // the lock file cannot be opened.
  explicit InstanceLock(const std::filesystem::path& path);
  ~InstanceLock();

  InstanceLock(const InstanceLock&)            = delete;
  InstanceLock& operator=(const InstanceLock&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  int                   fd_ = -1;
};

} // namespace chunkcam::util
