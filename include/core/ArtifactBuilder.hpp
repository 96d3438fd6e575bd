#pragma once
/** @file  ArtifactBuilder.hpp
 *  @brief Compiles a firmware target and converts it to Intel HEX.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// fwdeploy headers
#include "core/DeployConfig.hpp"
#include "io/ProcessRunner.hpp"

namespace fwdeploy {
  namespace core {

    /// Output of one successful build. Immutable once produced.
    struct BuildArtifact {
      std::string target;
      BuildMode mode{ BuildMode::Release };
      std::string binaryPath; ///< ELF produced by the compiler
      std::string hexPath;    ///< Intel HEX handed to the programmer
    };

    /**
 * @class ArtifactBuilder
 * @brief `cargo build` followed by `cargo objcopy -O ihex`.
 *
 *  * The hex path is fixed by configuration and removed before every build,
 *    so a failed build never leaves a stale or partial image behind.
 *  * Throws `BuildError` on any failure, with the toolchain output attached.
 */
    class ArtifactBuilder {
    public:
      ArtifactBuilder(const DeployConfig& cfg, io::ProcessRunner& runner);

      /// Builds \p target in \p mode, or in the target's configured mode if unset.
      BuildArtifact build(const std::string& target, std::optional<BuildMode> mode = std::nullopt);

      /// Where the compiler leaves the ELF for \p target.
      std::string binaryPathFor(const std::string& target, BuildMode mode) const;

    private:
      void removeStaleHex(const std::string& hexPath) const;
      io::Command toolchainCommand(const std::string& subcommand, const std::string& target,
                                   BuildMode mode) const;

      const DeployConfig& cfg_;
      io::ProcessRunner& runner_;
    };

  } // namespace core
} // namespace fwdeploy
