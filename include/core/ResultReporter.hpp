#pragma once
/** @file  ResultReporter.hpp
 *  @brief Turns a session outcome into one status line and a process exit code.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <ostream>
#include <string>

// fwdeploy headers
#include "core/ArtifactBuilder.hpp"
#include "core/DeviceProgrammer.hpp"
#include "core/Errors.hpp"

namespace fwdeploy {
  namespace io {
    class SessionLog;
  }

  namespace core {

    /**
 * @class ResultReporter
 * @brief Deterministic outcome → exit code table plus user-facing output.
 *
 *  | outcome              | code |
 *  |----------------------|------|
 *  | success              | 0    |
 *  | BuildError           | 1    |
 *  | DeviceNotFoundError  | 2    |
 *  | FlashError           | 3    |
 *  | DeviceBusyError      | 4    |
 *  | PermissionError      | 5    |
 *  | ConfigError / usage  | 64   |
 *  | anything else        | 70   |
 */
    class ResultReporter {
    public:
      static constexpr int kSuccess = 0;
      static constexpr int kUsage = 64;
      static constexpr int kInternal = 70;

      /// @param log  optional transcript that also receives the result row
      explicit ResultReporter(std::ostream& out, io::SessionLog* log = nullptr)
          : out_(out), log_(log) {}

      static int exitCodeFor(ErrorKind kind);

      static std::string summarize(const BuildArtifact& artifact);
      static std::string summarize(const FlashResult& result);

      int reportBuilt(const BuildArtifact& artifact);
      int reportFlashed(const FlashResult& result);
      int reportSuccess(const std::string& line);

      /// Prints the status line followed by the tool's captured output.
      int reportError(const DeployError& err);
      int reportUnexpected(const std::exception& err);

    private:
      int finish(const std::string& line, int code);

      std::ostream& out_;
      io::SessionLog* log_;
    };

  } // namespace core
} // namespace fwdeploy
