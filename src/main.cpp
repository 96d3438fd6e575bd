/* @file main.cpp
 * @brief fwdeploy entry point: parse → load config → run one session → report
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>

// 3rd-party headers
#include <spdlog/spdlog.h>

// fwdeploy headers
#include "app/CommandLine.hpp"
#include "core/AdapterTools.hpp"
#include "core/ArtifactBuilder.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DeviceProgrammer.hpp"
#include "core/Errors.hpp"
#include "core/FlashSession.hpp"
#include "core/ResultReporter.hpp"
#include "core/TransportSelector.hpp"
#include "io/HostAccess.hpp"
#include "io/ProcessRunner.hpp"
#include "io/SessionLog.hpp"

using namespace fwdeploy;

namespace {

  int runCommand(const app::Options& opt, const core::DeployConfig& cfg, io::SessionLog& log,
                 core::ResultReporter& reporter) {
    io::PosixProcessRunner posixRunner;
    io::RecordingProcessRunner runner(posixRunner, log);
    io::HostAccess host;

    if (opt.command == app::Subcommand::Serial || opt.command == app::Subcommand::CanUp) {
      core::AdapterTools tools(cfg, runner, host);
      if (opt.command == app::Subcommand::Serial) {
        tools.openSerialConsole();
        return reporter.reportSuccess("serial console closed");
      }
      tools.bringUpCan(opt.canIndex);
      return reporter.reportSuccess(cfg.can.interface + " is up");
    }

    core::ArtifactBuilder builder(cfg, runner);
    core::TransportSelector selector(cfg.flasher);
    core::DeviceProgrammer programmer(cfg, runner, host);
    core::FlashSession session(builder, selector, programmer, &log);

    switch (opt.command) {
    case app::Subcommand::Build:
      return reporter.reportBuilt(session.build(opt.target, opt.buildMode));
    case app::Subcommand::Flash:
      return reporter.reportFlashed(session.flash(opt.target, opt.transport, opt.buildMode));
    case app::Subcommand::FlashBootloader:
      return reporter.reportFlashed(
          session.flashBootloader(opt.transport, cfg.flasher.bootloaderImage));
    default:
      throw core::ConfigError("no command given");
    }
  }

} // namespace

int main(int argc, char** argv) {
  io::SessionLog log;
  core::ResultReporter reporter(std::cout, &log);

  app::Options opt;
  try {
    opt = app::parseCommandLine(argc, argv);
  } catch (const core::ConfigError& e) {
    std::cerr << "fwdeploy: " << e.what() << "\n";
    app::printUsage(std::cerr, argv[0]);
    return core::ResultReporter::kUsage;
  }

  if (opt.command == app::Subcommand::Help) {
    app::printUsage(std::cout, argv[0]);
    return core::ResultReporter::kSuccess;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(opt.verbose ? spdlog::level::debug : spdlog::level::info);

  try {
    auto cfg = core::ConfigLoader(opt.configPath, opt.configExplicit).loadConfig();
    if (!cfg.sessionLog.empty() && !log.open(cfg.resolve(cfg.sessionLog)))
      spdlog::warn("[main] cannot open session log {}, continuing without it", cfg.sessionLog);
    return runCommand(opt, cfg, log, reporter);
  } catch (const core::DeployError& e) {
    return reporter.reportError(e);
  } catch (const std::exception& e) {
    return reporter.reportUnexpected(e);
  }
}
