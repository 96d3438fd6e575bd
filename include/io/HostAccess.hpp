#pragma once
/** @file  HostAccess.hpp
 *  @brief Host queries the pipeline needs before touching hardware.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

namespace fwdeploy {
  namespace io {

    /**
 * @class HostAccess
 * @brief Device-node and privilege probes, virtual so tests can fake a host.
 */
    class HostAccess {
    public:
      virtual ~HostAccess() = default;

      /// True if \p path names an existing file or device node.
      virtual bool deviceExists(const std::string& path) const;

      /// True if the process runs with an effective uid of 0.
      virtual bool isPrivileged() const;
    };

  } // namespace io
} // namespace fwdeploy
