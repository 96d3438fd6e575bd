/* @file ArtifactBuilder.cpp
 * @brief compile → locate ELF → objcopy to ihex
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>

// 3rd-party headers
#include <spdlog/spdlog.h>

// fwdeploy headers
#include "core/ArtifactBuilder.hpp"
#include "core/Errors.hpp"

namespace fs = std::filesystem;
using namespace fwdeploy::core;

ArtifactBuilder::ArtifactBuilder(const DeployConfig& cfg, io::ProcessRunner& runner)
    : cfg_(cfg), runner_(runner) {}

std::string ArtifactBuilder::binaryPathFor(const std::string& target, BuildMode mode) const {
  fs::path p = "target";
  if (!cfg_.build.targetTriple.empty())
    p /= cfg_.build.targetTriple;
  p /= toString(mode);
  p /= target;
  return cfg_.resolve(p.string());
}

void ArtifactBuilder::removeStaleHex(const std::string& hexPath) const {
  std::error_code ec;
  fs::remove(hexPath, ec); // returns false without error when nothing was there
  if (ec)
    throw BuildError("[ArtifactBuilder] cannot remove stale " + hexPath + ": " + ec.message());
}

fwdeploy::io::Command ArtifactBuilder::toolchainCommand(const std::string& subcommand,
                                                        const std::string& target,
                                                        BuildMode mode) const {
  io::Command cmd;
  cmd.program = cfg_.build.toolchain;
  cmd.args = { subcommand, "--bin", target };
  if (mode == BuildMode::Release)
    cmd.args.push_back("--release");
  cmd.workingDir = cfg_.projectDir;
  return cmd;
}

BuildArtifact ArtifactBuilder::build(const std::string& target, std::optional<BuildMode> mode) {
  if (target.empty())
    throw BuildError("[ArtifactBuilder] no target given");

  BuildArtifact artifact;
  artifact.target = target;
  artifact.mode = mode.value_or(cfg_.modeFor(target));
  artifact.binaryPath = binaryPathFor(target, artifact.mode);
  artifact.hexPath = cfg_.resolve(cfg_.hexPath);

  removeStaleHex(artifact.hexPath);

  spdlog::info("[ArtifactBuilder] compiling {} ({})", target, toString(artifact.mode));
  auto compiled = runner_.run(toolchainCommand("build", target, artifact.mode));
  spdlog::debug("[ArtifactBuilder] {} exited {} after {} ms", cfg_.build.toolchain,
                compiled.exitCode, compiled.duration.count());
  if (!compiled.ok())
    throw BuildError("[ArtifactBuilder] compilation of " + target + " failed (exit " +
                         std::to_string(compiled.exitCode) + ")",
                     compiled.output);

  std::error_code ec;
  if (!fs::exists(artifact.binaryPath, ec))
    throw BuildError("[ArtifactBuilder] compiled binary not found at " + artifact.binaryPath,
                     compiled.output);

  // cargo objcopy --bin T [--release] -- -O ihex <hex>
  auto objcopy = toolchainCommand("objcopy", target, artifact.mode);
  objcopy.args.insert(objcopy.args.end(), { "--", "-O", "ihex", artifact.hexPath });

  spdlog::info("[ArtifactBuilder] converting {} to {}", artifact.binaryPath, artifact.hexPath);
  auto converted = runner_.run(objcopy);
  if (!converted.ok() || !fs::exists(artifact.hexPath, ec)) {
    fs::remove(artifact.hexPath, ec); // drop whatever half-written image objcopy left
    throw BuildError("[ArtifactBuilder] hex conversion of " + target + " failed (exit " +
                         std::to_string(converted.exitCode) + ")",
                     converted.output);
  }

  return artifact;
}
