// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ssdp_messages.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <ctime>

namespace vprinter::ssdp {

namespace {

constexpr const char* SERVER_HEADER = "Buildroot/2018.02-rc3 UPnP/1.0 ssdpd/1.8";

/**
 * @brief Vendor attribute block shared by NOTIFY and search responses
 *
 * DevBind "free" tells the slicer the printer is not cloud-bound, so it is
 * offered as a plain LAN device.
 */
std::string vendor_block(const SsdpIdentity& identity) {
    return fmt::format("DevModel.bambu.com: {}\r\n"
                       "DevName.bambu.com: {}\r\n"
                       "DevSignal.bambu.com: -44\r\n"
                       "DevConnect.bambu.com: lan\r\n"
                       "DevBind.bambu.com: free\r\n"
                       "Devseclink.bambu.com: secure\r\n"
                       "DevVersion.bambu.com: 01.07.00.00\r\n",
                       identity.model_code, identity.display_name);
}

} // namespace

std::string build_notify_alive(const SsdpIdentity& identity, const std::string& location,
                               const std::string& host_header) {
    return fmt::format("NOTIFY * HTTP/1.1\r\n"
                       "HOST: {}\r\n"
                       "Server: {}\r\n"
                       "Cache-Control: max-age=1800\r\n"
                       "Location: {}\r\n"
                       "NT: {}\r\n"
                       "NTS: ssdp:alive\r\n"
                       "EXT:\r\n"
                       "USN: {}\r\n"
                       "{}"
                       "\r\n",
                       host_header, SERVER_HEADER, location, SEARCH_TARGET,
                       identity.serial_number, vendor_block(identity));
}

std::string build_search_response(const SsdpIdentity& identity, const std::string& location,
                                  std::chrono::system_clock::time_point now) {
    return fmt::format("HTTP/1.1 200 OK\r\n"
                       "Server: {}\r\n"
                       "Date: {}\r\n"
                       "Location: {}\r\n"
                       "ST: {}\r\n"
                       "EXT:\r\n"
                       "USN: {}\r\n"
                       "Cache-Control: max-age=1800\r\n"
                       "{}"
                       "\r\n",
                       SERVER_HEADER, format_http_date(now), location, SEARCH_TARGET,
                       identity.serial_number, vendor_block(identity));
}

std::string build_notify_byebye(const SsdpIdentity& identity, const std::string& host_header) {
    return fmt::format("NOTIFY * HTTP/1.1\r\n"
                       "HOST: {}\r\n"
                       "NT: {}\r\n"
                       "NTS: ssdp:byebye\r\n"
                       "USN: {}\r\n"
                       "\r\n",
                       host_header, SEARCH_TARGET, identity.serial_number);
}

bool is_search_request(const std::string& datagram) {
    if (datagram.find(SEARCH_MARKER) == std::string::npos) {
        return false;
    }
    if (datagram.find(SEARCH_TARGET) != std::string::npos) {
        return true;
    }

    std::string lower = datagram;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find(SEARCH_ALL) != std::string::npos;
}

std::string format_http_date(std::chrono::system_clock::time_point when) {
    static const char* const DAYS[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);

    // Built by hand: strftime's %a/%b follow the process locale
    return fmt::format("{}, {:02d} {} {:04d} {:02d}:{:02d}:{:02d} GMT", DAYS[tm.tm_wday],
                       tm.tm_mday, MONTHS[tm.tm_mon], tm.tm_year + 1900, tm.tm_hour, tm.tm_min,
                       tm.tm_sec);
}

} // namespace vprinter::ssdp
