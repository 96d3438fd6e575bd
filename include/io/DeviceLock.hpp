#pragma once
/** @file  DeviceLock.hpp
 *  @brief Exclusive, non-blocking advisory lock guarding one physical transport.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

namespace fwdeploy {
  namespace io {

    /**
 * @class DeviceLock
 * @brief RAII wrapper around flock(LOCK_EX | LOCK_NB) on a lock file.
 *
 *  * One lock file per transport, e.g. /tmp/fwdeploy-usb-ttyACM0.lock.
 *  * The kernel drops the lock when the fd closes, including on crash.
 *  * Created mode 0666; files owned by another user are locked read-only.
 *  * *Non-copyable*, but move-constructible.
 */
    class DeviceLock {

    public:
      //---ctr / dtr--------------------------------------------
      DeviceLock() = default;
      ~DeviceLock(); // releases the lock

      //---public API-------------------------------------------
      /** @returns false if another holder owns the lock.
       *  Throws `std::runtime_error` if the lock file cannot be opened. */
      bool tryLock(const std::string& lockPath);
      void unlock();
      bool locked() const { return fd_ >= 0; }
      const std::string& path() const { return path_; }

      //---non-copyable-----------------------------------------
      DeviceLock(const DeviceLock&) = delete;
      DeviceLock& operator=(const DeviceLock&) = delete;

      //---mv and mv assign-------------------------------------
      DeviceLock(DeviceLock&& other) noexcept;
      DeviceLock& operator=(DeviceLock&& other) noexcept;

    private:
      int fd_{ -1 }; ///< lock file fd (-1==unlocked)
      std::string path_{};
    };

  } // namespace io
} // namespace fwdeploy
