// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace vprinter {

/**
 * @brief Source of the IPv4 address the printer advertises
 *
 * Used for the certificate SAN list and the SSDP Location header. Injected so
 * tests can pin an address instead of depending on real interfaces.
 */
class LocalAddressProvider {
  public:
    virtual ~LocalAddressProvider() = default;

    /// Dotted-quad IPv4 address; never empty
    virtual std::string local_ipv4() const = 0;
};

/**
 * @brief Always returns the address it was built with
 */
class StaticAddressProvider : public LocalAddressProvider {
  public:
    explicit StaticAddressProvider(std::string ip) : ip_(std::move(ip)) {}

    std::string local_ipv4() const override {
        return ip_;
    }

  private:
    std::string ip_;
};

/**
 * @brief Detects the LAN address from the host's interfaces
 *
 * Order of preference:
 * 1. Physical-looking interfaces (eth*, en*, wl*) with a non-loopback IPv4
 * 2. Any other interface except container/bridge ones (docker*, veth*, br-*)
 * 3. The source address the kernel picks for an outbound UDP socket
 * 4. 127.0.0.1
 */
class InterfaceAddressProvider : public LocalAddressProvider {
  public:
    std::string local_ipv4() const override;
};

/// One interface as reported by the OS
struct InterfaceAddress {
    std::string name;
    std::string ip;
};

/**
 * @brief Pick the advertised address from an interface list
 *
 * Pure selection logic behind InterfaceAddressProvider (exposed for tests).
 *
 * @return Chosen IPv4, or empty if no candidate qualifies
 */
std::string select_interface_address(const std::vector<InterfaceAddress>& interfaces);

} // namespace vprinter
