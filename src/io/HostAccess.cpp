/* @file HostAccess.cpp
 * @brief stat()/geteuid() probes.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// Linux headers
#include <sys/stat.h>
#include <unistd.h>

// fwdeploy headers
#include "io/HostAccess.hpp"

using namespace fwdeploy::io;

bool HostAccess::deviceExists(const std::string& path) const {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

bool HostAccess::isPrivileged() const { return ::geteuid() == 0; }
