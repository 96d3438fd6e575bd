/* @file ConfigLoader.cpp
 * @brief JSON → DeployConfig mapping.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <type_traits>

// 3rd-party headers
#include <nlohmann/json.hpp>

// fwdeploy headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace fwdeploy::core;
using nlohmann::json;

namespace {

  template <typename T> void readInto(const json& obj, const char* key, T& field) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return;
    if constexpr (std::is_unsigned_v<T>) {
      // get<unsigned>() would wrap -1 to 4294967295
      if (!it->is_number_unsigned() ||
          it->template get<std::uint64_t>() > std::numeric_limits<T>::max())
        throw ConfigError(std::string("[ConfigLoader] \"") + key +
                          "\" must be a non-negative integer in range");
    }
    try {
      field = it->template get<T>();
    } catch (const json::exception& e) {
      throw ConfigError(std::string("[ConfigLoader] bad value for \"") + key + "\": " + e.what());
    }
  }

  void readMode(const json& obj, const char* key, BuildMode& field) {
    std::string s;
    readInto(obj, key, s);
    if (s.empty())
      return;
    auto mode = parseBuildMode(s);
    if (!mode)
      throw ConfigError(std::string("[ConfigLoader] \"") + key + "\" must be debug or release, got " + s);
    field = *mode;
  }

  const json* section(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null())
      return nullptr;
    if (!it->is_object())
      throw ConfigError(std::string("[ConfigLoader] \"") + key + "\" must be an object");
    return &*it;
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath, bool required)
    : path_(std::move(configPath)), required_(required) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw ConfigError("[ConfigLoader] cannot open " + path_);
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

DeployConfig ConfigLoader::loadConfig() const {
  std::error_code ec;
  if (!required_ && !std::filesystem::exists(path_, ec))
    return DeployConfig{};
  return fromJson(load());
}

DeployConfig ConfigLoader::fromJson(const json& j) {
  if (!j.is_object())
    throw ConfigError("[ConfigLoader] top level must be a JSON object");

  DeployConfig cfg;
  readInto(j, "project_dir", cfg.projectDir);
  readInto(j, "hex_path", cfg.hexPath);
  readInto(j, "session_log", cfg.sessionLog);
  readInto(j, "lock_dir", cfg.lockDir);

  if (const json* b = section(j, "build")) {
    readInto(*b, "toolchain", cfg.build.toolchain);
    readInto(*b, "target_triple", cfg.build.targetTriple);
    readMode(*b, "default_mode", cfg.build.defaultMode);
    if (const json* targets = section(*b, "targets")) {
      for (auto it = targets->begin(); it != targets->end(); ++it) {
        auto mode = it->is_string() ? parseBuildMode(it->get<std::string>()) : std::nullopt;
        if (!mode)
          throw ConfigError("[ConfigLoader] build mode of target " + it.key() +
                            " must be debug or release");
        cfg.build.targets[it.key()] = *mode;
      }
    }
  }

  if (const json* f = section(j, "flasher")) {
    readInto(*f, "program", cfg.flasher.program);
    readInto(*f, "device_family", cfg.flasher.deviceFamily);
    readInto(*f, "probe_tool", cfg.flasher.probeTool);
    readInto(*f, "probe_interface", cfg.flasher.probeInterface);
    readInto(*f, "usb_port", cfg.flasher.usbPort);
    readInto(*f, "bootloader_image", cfg.flasher.bootloaderImage);
  }

  if (const json* s = section(j, "serial")) {
    readInto(*s, "program", cfg.serial.program);
    readInto(*s, "port", cfg.serial.port);
    readInto(*s, "baud", cfg.serial.baud);
    readInto(*s, "extra_args", cfg.serial.extraArgs);
  }

  if (const json* c = section(j, "can")) {
    readInto(*c, "slcand", cfg.can.slcand);
    readInto(*c, "ip", cfg.can.ip);
    readInto(*c, "interface", cfg.can.interface);
    readInto(*c, "port_prefix", cfg.can.portPrefix);
    readInto(*c, "bitrate_code", cfg.can.bitrateCode);
    readInto(*c, "txqueuelen", cfg.can.txQueueLen);
  }

  if (cfg.hexPath.empty())
    throw ConfigError("[ConfigLoader] hex_path must not be empty");
  if (cfg.build.toolchain.empty() || cfg.flasher.program.empty())
    throw ConfigError("[ConfigLoader] toolchain and flasher program must be set");
  if (cfg.can.bitrateCode > 8)
    throw ConfigError("[ConfigLoader] can.bitrate_code must be 0..8");

  return cfg;
}
