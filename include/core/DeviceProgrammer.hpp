#pragma once
/** @file  DeviceProgrammer.hpp
 *  @brief Drives rfp-cli to write a hex image over the selected transport.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <functional>
#include <optional>
#include <string>

// fwdeploy headers
#include "core/ArtifactBuilder.hpp"
#include "core/DeployConfig.hpp"
#include "core/TransportSelector.hpp"
#include "io/HostAccess.hpp"
#include "io/ProcessRunner.hpp"

namespace fwdeploy {
  namespace core {

    /// Outcome of one programming session. Never persisted.
    struct FlashResult {
      TransportDescriptor transport;
      std::string imagePath;
      std::optional<BuildArtifact> artifact; ///< empty for bootloader images
      int exitCode{ 0 };
      std::chrono::milliseconds duration{ 0 }; ///< summed over all tool invocations
      std::string output;                      ///< concatenated tool output
      bool resetPerformed{ false };
    };

    /**
 * @class DeviceProgrammer
 * @brief Programs one image, then (probe only) resets the target.
 *
 * * USB: probes the port first; a missing port raises `DeviceNotFoundError`
 *   before any tool is started.
 * * Debug probe: requires root; rfp-cli leaves the MCU halted after `-p`,
 *   so exactly one extra `-run` invocation follows a successful write.
 * * Holds the transport's DeviceLock for the whole session.
 */
    class DeviceProgrammer {
    public:
      enum class Phase { Programming, Resetting };
      using PhaseCallback = std::function<void(Phase)>;

      DeviceProgrammer(const DeployConfig& cfg, io::ProcessRunner& runner,
                       const io::HostAccess& host);

      void registerPhaseCallback(PhaseCallback cb) { phaseCb_ = std::move(cb); }

      FlashResult flashArtifact(const BuildArtifact& artifact, const TransportDescriptor& transport);
      FlashResult flashImage(const std::string& imagePath, const TransportDescriptor& transport);

      /// Argument vectors, exposed so tests can assert the exact tool flags.
      io::Command programCommand(const std::string& imagePath,
                                 const TransportDescriptor& transport) const;
      io::Command resetCommand(const DebugProbe& probe) const;

    private:
      FlashResult program(const std::string& imagePath, std::optional<BuildArtifact> artifact,
                          const TransportDescriptor& transport);
      void checkPreconditions(const TransportDescriptor& transport) const;
      void emit(Phase p) {
        if (phaseCb_)
          phaseCb_(p);
      }

      const DeployConfig& cfg_;
      io::ProcessRunner& runner_;
      const io::HostAccess& host_;
      PhaseCallback phaseCb_{};
    };

  } // namespace core
} // namespace fwdeploy
