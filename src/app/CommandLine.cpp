/* @file CommandLine.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <vector>

// Linux headers
#include <getopt.h>

// fwdeploy headers
#include "app/CommandLine.hpp"
#include "core/Errors.hpp"

using namespace fwdeploy::app;
using fwdeploy::core::BuildMode;
using fwdeploy::core::ConfigError;
using fwdeploy::core::TransportMode;

namespace {

  enum LongOnly : int { kUsb = 1000, kDebugProbe, kDebugBuild, kReleaseBuild };

  Subcommand parseSubcommand(const std::string& word) {
    if (word == "build")
      return Subcommand::Build;
    if (word == "flash")
      return Subcommand::Flash;
    if (word == "flash-bootloader")
      return Subcommand::FlashBootloader;
    if (word == "serial")
      return Subcommand::Serial;
    if (word == "can-up")
      return Subcommand::CanUp;
    if (word == "help")
      return Subcommand::Help;
    throw ConfigError("unknown command: " + word);
  }

} // namespace

void fwdeploy::app::printUsage(std::ostream& os, const char* progName) {
  os << "Usage: " << progName << " [options] <command> [args]\n\n";
  os << "Commands:\n";
  os << "  build <target>          Compile target and write the hex image\n";
  os << "  flash <target>          Build, program and (probe) restart the board\n";
  os << "  flash-bootloader        Program the configured bootloader image\n";
  os << "  serial                  Open the serial console (tio)\n";
  os << "  can-up <index>          Bring up CANable on <port_prefix><index>\n\n";
  os << "Options:\n";
  os << "  --usb                   Program through the USB bootloader port\n";
  os << "  --debug-probe           Program through the debug probe over SWD (default)\n";
  os << "  --debug, --release      Override the target's configured build mode\n";
  os << "  -c, --config <file>     Configuration file (default: fwdeploy.json)\n";
  os << "  -v, --verbose           Enable debug logging\n";
  os << "  -h, --help              Show this help menu\n";
  os << "\nExit codes: 0 ok, 1 build, 2 device not found, 3 tool failure,\n"
        "            4 device busy, 5 permission, 64 usage/config\n";
}

Options fwdeploy::app::parseCommandLine(int argc, char** argv) {
  Options opt;
  const char* shortopts = ":c:vh"; // leading ':' reports a missing argument as ':'
  static struct option longopts[] = {
    { "config", required_argument, nullptr, 'c' },
    { "verbose", no_argument, nullptr, 'v' },
    { "help", no_argument, nullptr, 'h' },
    { "usb", no_argument, nullptr, kUsb },
    { "debug-probe", no_argument, nullptr, kDebugProbe },
    { "debug", no_argument, nullptr, kDebugBuild },
    { "release", no_argument, nullptr, kReleaseBuild },
    { nullptr, 0, nullptr, 0 },
  };

  bool usb = false;
  bool probe = false;
  bool help = false;

  optind = 0; // full rescan, parseCommandLine may run more than once per process
  opterr = 0;
  int c = '\0';
  int optidx = 0;
  while ((c = getopt_long(argc, argv, shortopts, longopts, &optidx)) != -1) {
    switch (c) {
    case 'c':
      opt.configPath = optarg;
      opt.configExplicit = true;
      break;
    case 'v':
      opt.verbose = true;
      break;
    case 'h':
      help = true;
      break;
    case kUsb:
      usb = true;
      break;
    case kDebugProbe:
      probe = true;
      break;
    case kDebugBuild:
      if (opt.buildMode == BuildMode::Release)
        throw ConfigError("--debug and --release are mutually exclusive");
      opt.buildMode = BuildMode::Debug;
      break;
    case kReleaseBuild:
      if (opt.buildMode == BuildMode::Debug)
        throw ConfigError("--debug and --release are mutually exclusive");
      opt.buildMode = BuildMode::Release;
      break;
    case ':':
      throw ConfigError(std::string("missing argument for ") + argv[optind - 1]);
    case '?':
    default:
      // optopt is a letter only for short options; long ones get 0 or their long-only id
      if (optopt > 0 && optopt < 128 && std::string(argv[optind - 1]).rfind("--", 0) != 0)
        throw ConfigError(std::string("bad option -") + static_cast<char>(optopt));
      throw ConfigError(std::string("bad option ") + argv[optind - 1]);
    }
  }

  if (usb && probe)
    throw ConfigError("--usb and --debug-probe are mutually exclusive");
  opt.transport = usb ? TransportMode::Usb : TransportMode::DebugProbe;

  std::vector<std::string> positional(argv + optind, argv + argc);
  if (help || positional.empty()) {
    opt.command = Subcommand::Help;
    return opt;
  }

  opt.command = parseSubcommand(positional[0]);
  const std::size_t expected =
      (opt.command == Subcommand::Build || opt.command == Subcommand::Flash ||
       opt.command == Subcommand::CanUp)
          ? 2
          : 1;
  if (positional.size() != expected)
    throw ConfigError("wrong number of arguments for " + positional[0]);

  switch (opt.command) {
  case Subcommand::Build:
  case Subcommand::Flash:
    opt.target = positional[1];
    break;
  case Subcommand::CanUp: {
    char* end = nullptr;
    unsigned long idx = std::strtoul(positional[1].c_str(), &end, 10);
    if (positional[1].empty() || *end != '\0' || idx > 255)
      throw ConfigError("can-up expects a port index, got " + positional[1]);
    opt.canIndex = static_cast<unsigned>(idx);
    break;
  }
  default:
    break;
  }

  if ((usb || probe) && opt.command != Subcommand::Flash &&
      opt.command != Subcommand::FlashBootloader)
    throw ConfigError("--usb / --debug-probe only apply to flash commands");
  if (opt.buildMode && opt.command != Subcommand::Build && opt.command != Subcommand::Flash)
    throw ConfigError("--debug / --release only apply to build and flash");

  return opt;
}
