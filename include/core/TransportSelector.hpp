#pragma once
/** @file  TransportSelector.hpp
 *  @brief Resolves a requested transport mode to a concrete interface/port.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <variant>

// fwdeploy headers
#include "core/DeployConfig.hpp"

namespace fwdeploy {
  namespace core {

    /// On-board or external debug probe, e.g. E2 Lite over SWD.
    struct DebugProbe {
      std::string interface;    ///< "swd"
      std::string tool;         ///< "e2l"
      std::string deviceFamily; ///< "ra"
      bool requiresPrivilege{ true };
    };

    /// USB CDC port exposed by the DFU bootloader.
    struct UsbSerial {
      std::string port; ///< "/dev/ttyACM0"
      std::string deviceFamily;
    };

    using TransportDescriptor = std::variant<DebugProbe, UsbSerial>;

    /// Human readable form for logs ("debug-probe e2l/swd", "usb /dev/ttyACM0").
    std::string describe(const TransportDescriptor& t);

    /// Stable file-name-safe key, used to name the transport's lock file.
    std::string lockKey(const TransportDescriptor& t);

    /**
 * @class TransportSelector
 * @brief Pure mapping from mode to descriptor; touches no hardware.
 *
 *  USB port existence is deliberately not checked here, the programmer
 *  probes it right before flashing.
 */
    class TransportSelector {
    public:
      explicit TransportSelector(const FlasherConfig& cfg) : cfg_(cfg) {}

      TransportDescriptor select(TransportMode mode) const;

    private:
      const FlasherConfig& cfg_;
    };

  } // namespace core
} // namespace fwdeploy
