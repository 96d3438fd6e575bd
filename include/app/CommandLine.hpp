#pragma once
/** @file  CommandLine.hpp
 *  @brief fwdeploy argument parsing (getopt_long, subcommand first).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <ostream>
#include <string>

#include "core/DeployConfig.hpp"

namespace fwdeploy::app {

  enum class Subcommand { Help, Build, Flash, FlashBootloader, Serial, CanUp };

  struct Options {
    Subcommand command{ Subcommand::Help };
    std::string target{};
    core::TransportMode transport{ core::TransportMode::DebugProbe };
    std::optional<core::BuildMode> buildMode{};
    unsigned canIndex{ 0 };
    std::string configPath{ "fwdeploy.json" };
    bool configExplicit{ false }; ///< --config given, so the file must exist
    bool verbose{ false };
  };

  /// Throws `core::ConfigError` on malformed input (exit code 64).
  Options parseCommandLine(int argc, char** argv);

  void printUsage(std::ostream& os, const char* progName);

} // namespace fwdeploy::app
