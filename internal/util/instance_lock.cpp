#include "internal/util/instance_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include "internal/util/errors.hpp"

namespace chunkcam::util {

InstanceLock::InstanceLock(const std::filesystem::path& path) : path_(path) {
  if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());

  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) throw std::system_error(errno, std::generic_category(), "open " + path_.string());

  while (::flock(fd_, LOCK_EX | LOCK_NB) < 0) {
    const int err = errno;
    if (err == EINTR) continue;

    ::close(fd_);
    fd_ = -1;
    if (err == EWOULDBLOCK) throw InstanceLocked("another chunkcam process holds " + path_.string());
    throw std::system_error(err, std::generic_category(), "flock " + path_.string());
  }
}

InstanceLock::~InstanceLock() {
  // closing the descriptor releases the lock
  if (fd_ >= 0) ::close(fd_);
}

} // namespace chunkcam::util
