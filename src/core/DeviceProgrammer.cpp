/* @file DeviceProgrammer.cpp
 * @brief rfp-cli invocation per transport, device probing and locking
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>

// 3rd-party headers
#include <spdlog/spdlog.h>

// fwdeploy headers
#include "core/DeviceProgrammer.hpp"
#include "core/Errors.hpp"
#include "io/DeviceLock.hpp"

using namespace fwdeploy::core;

DeviceProgrammer::DeviceProgrammer(const DeployConfig& cfg, io::ProcessRunner& runner,
                                   const io::HostAccess& host)
    : cfg_(cfg), runner_(runner), host_(host) {}

FlashResult DeviceProgrammer::flashArtifact(const BuildArtifact& artifact,
                                            const TransportDescriptor& transport) {
  return program(artifact.hexPath, artifact, transport);
}

FlashResult DeviceProgrammer::flashImage(const std::string& imagePath,
                                         const TransportDescriptor& transport) {
  return program(cfg_.resolve(imagePath), std::nullopt, transport);
}

fwdeploy::io::Command DeviceProgrammer::programCommand(const std::string& imagePath,
                                                       const TransportDescriptor& transport) const {
  io::Command cmd;
  cmd.program = cfg_.flasher.program;
  if (const auto* probe = std::get_if<DebugProbe>(&transport)) {
    cmd.args = { "-device", probe->deviceFamily, "-t", probe->tool, "-if", probe->interface,
                 "-p",      imagePath,           "-run" };
  } else {
    const auto& usb = std::get<UsbSerial>(transport);
    cmd.args = { "-device", usb.deviceFamily, "-port", usb.port, "-p", imagePath };
  }
  cmd.workingDir = cfg_.projectDir;
  return cmd;
}

fwdeploy::io::Command DeviceProgrammer::resetCommand(const DebugProbe& probe) const {
  io::Command cmd;
  cmd.program = cfg_.flasher.program;
  cmd.args = { "-device", probe.deviceFamily, "-t", probe.tool, "-if", probe.interface, "-run" };
  cmd.workingDir = cfg_.projectDir;
  return cmd;
}

void DeviceProgrammer::checkPreconditions(const TransportDescriptor& transport) const {
  if (const auto* usb = std::get_if<UsbSerial>(&transport)) {
    if (!host_.deviceExists(usb->port))
      throw DeviceNotFoundError("[DeviceProgrammer] USB port " + usb->port + " not present",
                                usb->port);
    return;
  }
  const auto& probe = std::get<DebugProbe>(transport);
  if (probe.requiresPrivilege && !host_.isPrivileged())
    throw PermissionError("[DeviceProgrammer] " + describe(transport) +
                          " needs root, re-run with sudo");
}

FlashResult DeviceProgrammer::program(const std::string& imagePath,
                                      std::optional<BuildArtifact> artifact,
                                      const TransportDescriptor& transport) {
  checkPreconditions(transport);

  std::error_code ec;
  if (!std::filesystem::exists(imagePath, ec))
    throw FlashError("[DeviceProgrammer] image " + imagePath + " does not exist", -1, {});

  io::DeviceLock lock;
  const std::string lockPath = cfg_.lockDir + "/fwdeploy-" + lockKey(transport) + ".lock";
  if (!lock.tryLock(lockPath))
    throw DeviceBusyError("[DeviceProgrammer] " + describe(transport) +
                          " is in use by another session (" + lockPath + ")");

  FlashResult result{ transport, imagePath, std::move(artifact), 0, {}, {}, false };

  emit(Phase::Programming);
  spdlog::info("[DeviceProgrammer] writing {} via {}", imagePath, describe(transport));
  auto written = runner_.run(programCommand(imagePath, transport));
  result.exitCode = written.exitCode;
  result.duration += written.duration;
  result.output += written.output;
  if (!written.ok())
    throw FlashError("[DeviceProgrammer] " + cfg_.flasher.program + " failed to program " +
                         imagePath + " (exit " + std::to_string(written.exitCode) + ")",
                     written.exitCode, result.output);

  if (const auto* probe = std::get_if<DebugProbe>(&transport)) {
    // the write leaves the MCU halted in the bootloader; -run alone restarts it
    emit(Phase::Resetting);
    spdlog::info("[DeviceProgrammer] resetting target via {}", describe(transport));
    auto reset = runner_.run(resetCommand(*probe));
    result.exitCode = reset.exitCode;
    result.duration += reset.duration;
    result.output += reset.output;
    result.resetPerformed = true;
    if (!reset.ok())
      throw FlashError("[DeviceProgrammer] reset/run after programming failed (exit " +
                           std::to_string(reset.exitCode) + ")",
                       reset.exitCode, result.output);
  }

  return result;
}
