#pragma once
/** @file  DeployConfig.hpp
 *  @brief Explicit configuration handed to every pipeline component.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fwdeploy {
  namespace core {

    enum class BuildMode : std::uint8_t { Debug, Release };
    enum class TransportMode : std::uint8_t { DebugProbe, Usb };

    inline const char* toString(BuildMode m) { return m == BuildMode::Release ? "release" : "debug"; }
    inline const char* toString(TransportMode m) {
      return m == TransportMode::Usb ? "usb" : "debug-probe";
    }

    /// "debug" / "release" → BuildMode, std::nullopt for anything else.
    std::optional<BuildMode> parseBuildMode(const std::string& s);

    struct BuildConfig {
      std::string toolchain{ "cargo" };
      std::string targetTriple{ "thumbv7em-none-eabihf" }; ///< empty == host layout
      BuildMode defaultMode{ BuildMode::Release };
      std::map<std::string, BuildMode> targets{}; ///< per-target canonical mode
    };

    struct FlasherConfig {
      std::string program{ "rfp-cli" };
      std::string deviceFamily{ "ra" };
      std::string probeTool{ "e2l" };
      std::string probeInterface{ "swd" };
      std::string usbPort{ "/dev/ttyACM0" };
      std::string bootloaderImage{ "dfu_minima.hex" };
    };

    struct SerialConfig {
      std::string program{ "tio" };
      std::string port{ "/dev/ttyUSB0" };
      unsigned baud{ 115200 };
      std::vector<std::string> extraArgs{ "--input-mode", "line", "-et", "--map", "ICRNL,INLCRNL" };
    };

    struct CanConfig {
      std::string slcand{ "slcand" };
      std::string ip{ "ip" };
      std::string interface{ "can0" };
      std::string portPrefix{ "/dev/ttyACM" };
      unsigned bitrateCode{ 8 }; ///< slcand -s<N>, 8 == 1 Mbit/s
      unsigned txQueueLen{ 1000 };
    };

    /**
 * @struct DeployConfig
 * @brief Everything the shell recipes used to take from the environment.
 *
 *  Relative paths (hex, bootloader image) are resolved against `projectDir`.
 */
    struct DeployConfig {
      std::string projectDir{ "." };
      std::string hexPath{ "app.hex" };
      std::string sessionLog{}; ///< empty == no transcript
      std::string lockDir{ "/tmp" };
      BuildConfig build{};
      FlasherConfig flasher{};
      SerialConfig serial{};
      CanConfig can{};

      /// Mode for \p target: configured per-target mode, else the default.
      BuildMode modeFor(const std::string& target) const {
        auto it = build.targets.find(target);
        return it != build.targets.end() ? it->second : build.defaultMode;
      }

      /// \p p if absolute, else the absolute form of projectDir/p.
      std::string resolve(const std::string& p) const;
    };

  } // namespace core
} // namespace fwdeploy
