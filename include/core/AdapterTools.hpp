#pragma once
/** @file  AdapterTools.hpp
 *  @brief Bench helpers around the board: serial console and CANable bring-up.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "core/DeployConfig.hpp"
#include "io/HostAccess.hpp"
#include "io/ProcessRunner.hpp"

namespace fwdeploy::core {

  /**
 * @class AdapterTools
 * @brief Shells out to tio / slcand / ip with the configured flags.
 *
 *  * Tool failures surface as `FlashError` (exit code 3, "tool failure").
 *  * Only configures the SocketCAN interface; no frames are sent or parsed.
 */
  class AdapterTools {
  public:
    AdapterTools(const DeployConfig& cfg, io::ProcessRunner& runner, const io::HostAccess& host);

    /// Runs tio interactively until the user quits it.
    void openSerialConsole();

    /// slcand on <port_prefix><index>, then link up + txqueuelen. Needs root.
    void bringUpCan(unsigned portIndex);

    io::Command serialCommand() const;

  private:
    void runStep(const io::Command& cmd, const char* what);

    const DeployConfig& cfg_;
    io::ProcessRunner& runner_;
    const io::HostAccess& host_;
  };

} // namespace fwdeploy::core
