#pragma once
/** @file  Errors.hpp
 *  @brief Failure taxonomy of the deployment pipeline.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace fwdeploy {
  namespace core {

    enum class ErrorKind : std::uint8_t {
      Build,
      DeviceNotFound,
      Flash,
      DeviceBusy,
      Permission,
      Config,
      Count
    };
    static_assert(static_cast<std::uint8_t>(ErrorKind::Count) == 6,
                  "ErrorKind count changed please update ResultReporter's exit code table");

    inline const char* toString(ErrorKind k) {
      switch (k) {
      case ErrorKind::Build:
        return "BuildError";
      case ErrorKind::DeviceNotFound:
        return "DeviceNotFoundError";
      case ErrorKind::Flash:
        return "FlashError";
      case ErrorKind::DeviceBusy:
        return "DeviceBusyError";
      case ErrorKind::Permission:
        return "PermissionError";
      case ErrorKind::Config:
        return "ConfigError";
      default:
        return "Unknown";
      }
    }

    /**
 * @class DeployError
 * @brief Base of every pipeline failure. Carries the originating tool's
 *        captured output (may be empty) so the reporter can print it.
 */
    class DeployError : public std::runtime_error {
    public:
      DeployError(ErrorKind kind, const std::string& what, std::string toolOutput = {})
          : std::runtime_error(what), kind_(kind), toolOutput_(std::move(toolOutput)) {}

      ErrorKind kind() const { return kind_; }
      const std::string& toolOutput() const { return toolOutput_; }

    private:
      ErrorKind kind_;
      std::string toolOutput_;
    };

    class BuildError : public DeployError {
    public:
      explicit BuildError(const std::string& what, std::string toolOutput = {})
          : DeployError(ErrorKind::Build, what, std::move(toolOutput)) {}
    };

    class DeviceNotFoundError : public DeployError {
    public:
      DeviceNotFoundError(const std::string& what, std::string devicePath)
          : DeployError(ErrorKind::DeviceNotFound, what), devicePath_(std::move(devicePath)) {}

      const std::string& devicePath() const { return devicePath_; }

    private:
      std::string devicePath_;
    };

    class FlashError : public DeployError {
    public:
      FlashError(const std::string& what, int exitCode, std::string toolOutput)
          : DeployError(ErrorKind::Flash, what, std::move(toolOutput)), exitCode_(exitCode) {}

      /// Exit code of the failing tool; -1 if no tool ran.
      int exitCode() const { return exitCode_; }

    private:
      int exitCode_;
    };

    class DeviceBusyError : public DeployError {
    public:
      explicit DeviceBusyError(const std::string& what)
          : DeployError(ErrorKind::DeviceBusy, what) {}
    };

    class PermissionError : public DeployError {
    public:
      explicit PermissionError(const std::string& what)
          : DeployError(ErrorKind::Permission, what) {}
    };

    class ConfigError : public DeployError {
    public:
      explicit ConfigError(const std::string& what) : DeployError(ErrorKind::Config, what) {}
    };

  } // namespace core
} // namespace fwdeploy
