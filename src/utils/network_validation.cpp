// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/network_validation.h"

#include <cctype>

bool is_valid_ipv4(const std::string& ip) {
    if (ip.empty() || ip.length() > 15) {
        return false;
    }

    // Cannot start or end with dot
    if (ip.front() == '.' || ip.back() == '.') {
        return false;
    }

    // Parse and validate each octet
    size_t segment_start = 0;
    int octet_count = 0;
    for (size_t i = 0; i <= ip.length(); i++) {
        if (i == ip.length() || ip[i] == '.') {
            std::string segment = ip.substr(segment_start, i - segment_start);

            // Empty segment (e.g., "192..1.1")
            if (segment.empty() || segment.length() > 3) {
                return false;
            }

            // Only digits allowed in IP octets
            int value = 0;
            for (char c : segment) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return false;
                }
                value = value * 10 + (c - '0');
            }
            if (value > 255) {
                return false;
            }

            octet_count++;
            segment_start = i + 1;
        }
    }

    return octet_count == 4;
}

bool is_valid_port(const std::string& port_str) {
    if (port_str.empty() || port_str.length() > 5) {
        return false;
    }

    // Check all characters are digits
    for (char c : port_str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    // Reject leading zeros (could be confused with octal notation)
    // Exception: "0" alone is handled by range check below
    if (port_str.length() > 1 && port_str[0] == '0') {
        return false;
    }

    return is_valid_port(std::stoi(port_str));
}

bool is_valid_port(int port) {
    return port > 0 && port <= 65535;
}

bool is_valid_access_code(const std::string& code) {
    if (code.length() != 8) {
        return false;
    }
    for (char c : code) {
        if (!std::isgraph(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool is_valid_serial(const std::string& serial) {
    if (serial.empty() || serial.length() > 64) {
        return false;
    }
    for (char c : serial) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}
