/* @file DeployConfig.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>

#include "core/DeployConfig.hpp"

using namespace fwdeploy::core;

std::optional<BuildMode> fwdeploy::core::parseBuildMode(const std::string& s) {
  if (s == "release")
    return BuildMode::Release;
  if (s == "debug")
    return BuildMode::Debug;
  return std::nullopt;
}

std::string DeployConfig::resolve(const std::string& p) const {
  std::filesystem::path path(p);
  if (path.is_absolute())
    return path.lexically_normal().string();
  // absolute, because child tools run with projectDir as their cwd
  return std::filesystem::absolute(std::filesystem::path(projectDir) / path)
      .lexically_normal()
      .string();
}
