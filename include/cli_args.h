// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the vprinter daemon
 *
 * Values given here override the config file. Unset fields keep their
 * "not set" marker (-1 or empty string) so the caller can tell them apart.
 */

#include <string>

namespace vprinter {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path; // -c/--config; empty = default location
    std::string data_dir;    // --data-dir; empty = default location

    // Service overrides
    int ftp_port = -1;  // -1 = not set
    int ssdp_port = -1; // -1 = not set
    std::string advertise_ip;
    bool no_ssdp = false;
    bool no_ftps = false;
    bool regenerate_certs = false;

    // Logging
    int verbosity = 0;
    std::string log_dest; // empty = use config
    std::string log_file;

    // Informational; the caller prints and exits
    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return false on invalid input (message already printed)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_help(const char* program_name);

} // namespace vprinter
