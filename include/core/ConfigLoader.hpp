#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the project directory.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/DeployConfig.hpp"

namespace fwdeploy::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and maps it onto DeployConfig.
 *
 *  * No caching, every call to `load()` re-reads the file (cheap, tiny file).
 *  * Keys missing from the file keep their DeployConfig defaults.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    /// @param required    If false, a missing file yields the defaults.
    explicit ConfigLoader(std::string configPath, bool required = true);

    /// Parse the file into a nlohmann::json object or throw `ConfigError`.
    nlohmann::json load() const;

    /// load() + schema mapping. Throws `ConfigError` on bad types or values.
    DeployConfig loadConfig() const;

    /// Schema mapping only; exposed for tests.
    static DeployConfig fromJson(const nlohmann::json& j);

  private:
    std::string path_;
    bool required_;
  };

} // namespace fwdeploy::core
