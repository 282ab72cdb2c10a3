// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

/**
 * @brief Validate dotted-quad IPv4 address
 *
 * Exactly four decimal octets in 0-255, no leading/trailing dots, no
 * surrounding whitespace.
 *
 * @param ip Address string
 * @return true if valid, false otherwise
 */
bool is_valid_ipv4(const std::string& ip);

/**
 * @brief Validate port number
 *
 * Accepts port numbers in range 1-65535 (numeric only)
 *
 * @param port_str Port number as string
 * @return true if valid, false otherwise
 */
bool is_valid_port(const std::string& port_str);
bool is_valid_port(int port);

/**
 * @brief Validate the LAN access code slicers send as the FTP password
 *
 * Exactly 8 printable ASCII characters, no spaces.
 */
bool is_valid_access_code(const std::string& code);

/**
 * @brief Validate a printer serial number
 *
 * Non-empty, at most 64 characters, letters and digits only. The serial is
 * used as a certificate CN and DNS SAN, so anything else is rejected.
 */
bool is_valid_serial(const std::string& serial);
