// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "local_address.h"

#include "hv/ifconfig.h"
#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace vprinter {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, strlen(prefix), prefix) == 0;
}

bool is_virtual_interface(const std::string& name) {
    return starts_with(name, "docker") || starts_with(name, "veth") || starts_with(name, "br-") ||
           starts_with(name, "virbr") || starts_with(name, "lo");
}

bool is_physical_interface(const std::string& name) {
    return starts_with(name, "eth") || starts_with(name, "en") || starts_with(name, "wl");
}

bool is_usable(const InterfaceAddress& iface) {
    return is_valid_ipv4(iface.ip) && !starts_with(iface.ip, "127.") && iface.ip != "0.0.0.0";
}

/**
 * @brief Ask the kernel which source address it would route a datagram from
 *
 * connect() on UDP sends nothing; it only resolves the route.
 */
std::string route_probe_address() {
    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        return "";
    }

    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    std::string result;
    if (connect(sock, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (getsockname(sock, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
            char buf[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf))) {
                result = buf;
            }
        }
    }
    close(sock);

    if (result == "0.0.0.0") {
        result.clear();
    }
    return result;
}

} // namespace

std::string select_interface_address(const std::vector<InterfaceAddress>& interfaces) {
    for (const auto& iface : interfaces) {
        if (is_physical_interface(iface.name) && is_usable(iface)) {
            return iface.ip;
        }
    }
    for (const auto& iface : interfaces) {
        if (!is_virtual_interface(iface.name) && is_usable(iface)) {
            return iface.ip;
        }
    }
    return "";
}

std::string InterfaceAddressProvider::local_ipv4() const {
    std::vector<ifconfig_t> raw;
    if (ifconfig(raw) == 0) {
        std::vector<InterfaceAddress> interfaces;
        interfaces.reserve(raw.size());
        for (const auto& ifc : raw) {
            interfaces.push_back({ifc.name, ifc.ip});
        }

        std::string ip = select_interface_address(interfaces);
        if (!ip.empty()) {
            spdlog::debug("[LocalAddress] Using interface address {}", ip);
            return ip;
        }
    } else {
        spdlog::debug("[LocalAddress] Interface enumeration failed");
    }

    std::string ip = route_probe_address();
    if (!ip.empty()) {
        spdlog::debug("[LocalAddress] Using routed source address {}", ip);
        return ip;
    }

    spdlog::warn("[LocalAddress] No LAN address found, falling back to 127.0.0.1");
    return "127.0.0.1";
}

} // namespace vprinter
