/* @file DeviceLock.cpp
 * @brief flock() based transport ownership.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <stdexcept>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

// 3rd-party headers
#include <spdlog/spdlog.h>

// fwdeploy headers
#include "io/DeviceLock.hpp"

using namespace fwdeploy::io;

namespace {

  // Lock files are shared between users (sudo and plain sessions) in a sticky
  // /tmp, so a fresh file is made world-writable and an existing one we may not
  // write is opened read-only; flock() does not care about the access mode.
  int openLockFile(const std::string& lockPath) {
    int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (fd >= 0) {
      if (::fchmod(fd, 0666) != 0)
        spdlog::warn("[DeviceLock] cannot widen mode of {}: {}", lockPath, strerror(errno));
      return fd;
    }
    if (errno != EEXIST)
      return -1;

    fd = ::open(lockPath.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0 && errno == EACCES)
      fd = ::open(lockPath.c_str(), O_RDONLY | O_CLOEXEC);
    return fd;
  }

} // namespace

DeviceLock::~DeviceLock() { unlock(); }

DeviceLock::DeviceLock(DeviceLock&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

DeviceLock& DeviceLock::operator=(DeviceLock&& other) noexcept {
  if (this != &other) {
    unlock();
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

bool DeviceLock::tryLock(const std::string& lockPath) {
  unlock();

  int fd = openLockFile(lockPath);
  if (fd < 0) {
    throw std::runtime_error("[DeviceLock] cannot open " + lockPath + ": " + strerror(errno));
  }

  while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    if (errno == EINTR)
      continue;
    int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK)
      return false; // someone else is flashing through this transport
    throw std::runtime_error("[DeviceLock] flock " + lockPath + ": " + strerror(err));
  }

  fd_ = fd;
  path_ = lockPath;
  return true;
}

void DeviceLock::unlock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  fd_ = -1;
  path_.clear();
}
