// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace vprinter::ssdp {

// Bambu printers use the standard SSDP group on a non-standard port
constexpr const char* MULTICAST_GROUP = "239.255.255.250";
constexpr uint16_t DEFAULT_PORT = 2021;

constexpr const char* SEARCH_TARGET = "urn:bambulab-com:device:3dprinter:1";
constexpr const char* SEARCH_ALL = "ssdp:all";
constexpr const char* SEARCH_MARKER = "M-SEARCH";

/**
 * @brief What the printer claims to be in every announcement
 *
 * serial_number doubles as the USN and must equal the TLS leaf CN.
 */
struct SsdpIdentity {
    std::string display_name;  ///< DevName, shown in the slicer's device list
    std::string serial_number; ///< USN
    std::string model_code;    ///< DevModel (BL-P001 = X1C)
};

/**
 * @brief Periodic presence announcement (NOTIFY ssdp:alive)
 *
 * @param identity Printer identity
 * @param location Advertised IPv4 (slicers connect here for FTPS/MQTT)
 * @param host_header "group:port" placed in the HOST header
 */
std::string build_notify_alive(const SsdpIdentity& identity, const std::string& location,
                               const std::string& host_header);

/**
 * @brief Unicast reply to a matching M-SEARCH
 *
 * @param now Timestamp for the Date header
 */
std::string build_search_response(const SsdpIdentity& identity, const std::string& location,
                                  std::chrono::system_clock::time_point now);

/// Departure announcement sent on stop (NOTIFY ssdp:byebye)
std::string build_notify_byebye(const SsdpIdentity& identity, const std::string& host_header);

/**
 * @brief True if the datagram is an M-SEARCH for Bambu printers (or for everything)
 *
 * The wildcard is matched case-insensitively; the search target exactly.
 */
bool is_search_request(const std::string& datagram);

/// RFC 1123 date in GMT, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string format_http_date(std::chrono::system_clock::time_point when);

} // namespace vprinter::ssdp
