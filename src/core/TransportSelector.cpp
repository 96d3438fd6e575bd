/* @file TransportSelector.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>

// fwdeploy headers
#include "core/TransportSelector.hpp"

using namespace fwdeploy::core;

namespace {
  template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
  };
  template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

std::string fwdeploy::core::describe(const TransportDescriptor& t) {
  return std::visit(
      overloaded{ [](const DebugProbe& p) { return "debug-probe " + p.tool + "/" + p.interface; },
                  [](const UsbSerial& u) { return "usb " + u.port; } },
      t);
}

std::string fwdeploy::core::lockKey(const TransportDescriptor& t) {
  std::string raw = std::visit(
      overloaded{ [](const DebugProbe& p) { return "probe-" + p.tool + "-" + p.interface; },
                  [](const UsbSerial& u) { return "usb-" + u.port; } },
      t);
  std::string key;
  for (char c : raw) {
    unsigned char uc = static_cast<unsigned char>(c);
    key += (std::isalnum(uc) || c == '-' || c == '_') ? c : '_';
  }
  return key;
}

TransportDescriptor TransportSelector::select(TransportMode mode) const {
  switch (mode) {
  case TransportMode::Usb:
    return UsbSerial{ cfg_.usbPort, cfg_.deviceFamily };
  case TransportMode::DebugProbe:
  default:
    return DebugProbe{ cfg_.probeInterface, cfg_.probeTool, cfg_.deviceFamily, true };
  }
}
