/* @file AdapterTools.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <spdlog/spdlog.h>

#include "core/AdapterTools.hpp"
#include "core/Errors.hpp"

using namespace fwdeploy::core;

AdapterTools::AdapterTools(const DeployConfig& cfg, io::ProcessRunner& runner,
                           const io::HostAccess& host)
    : cfg_(cfg), runner_(runner), host_(host) {}

fwdeploy::io::Command AdapterTools::serialCommand() const {
  io::Command cmd;
  cmd.program = cfg_.serial.program;
  cmd.args = { "-b", std::to_string(cfg_.serial.baud), cfg_.serial.port };
  cmd.args.insert(cmd.args.end(), cfg_.serial.extraArgs.begin(), cfg_.serial.extraArgs.end());
  cmd.interactive = true;
  return cmd;
}

void AdapterTools::openSerialConsole() {
  if (!host_.deviceExists(cfg_.serial.port))
    throw DeviceNotFoundError("[AdapterTools] serial port " + cfg_.serial.port + " not present",
                              cfg_.serial.port);
  spdlog::info("[AdapterTools] opening console on {} @ {}", cfg_.serial.port, cfg_.serial.baud);
  runStep(serialCommand(), "serial console");
}

void AdapterTools::bringUpCan(unsigned portIndex) {
  if (!host_.isPrivileged())
    throw PermissionError("[AdapterTools] bringing up " + cfg_.can.interface +
                          " needs root, re-run with sudo");

  const std::string port = cfg_.can.portPrefix + std::to_string(portIndex);
  if (!host_.deviceExists(port))
    throw DeviceNotFoundError("[AdapterTools] CAN adapter " + port + " not present", port);

  const std::string& iface = cfg_.can.interface;
  runStep({ cfg_.can.slcand,
            { "-o", "-c", "-s" + std::to_string(cfg_.can.bitrateCode), port, iface } },
          "slcand");
  runStep({ cfg_.can.ip, { "link", "set", iface, "up" } }, "ip link up");
  runStep({ cfg_.can.ip, { "link", "set", iface, "txqueuelen", std::to_string(cfg_.can.txQueueLen) } },
          "ip link txqueuelen");
  spdlog::info("[AdapterTools] {} up on {}", iface, port);
}

void AdapterTools::runStep(const io::Command& cmd, const char* what) {
  spdlog::debug("[AdapterTools] {}", cmd.toString());
  auto res = runner_.run(cmd);
  if (!res.ok())
    throw FlashError(std::string("[AdapterTools] ") + what + " failed (exit " +
                         std::to_string(res.exitCode) + ")",
                     res.exitCode, res.output);
}
