// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief Default spdlog logger for the vprinter daemon
 *
 * Console output is always available; a second sink goes to the journal,
 * syslog or a rotating file depending on LogTarget. libhv's own logger is
 * kept in step through to_hv_level().
 *
 * @pattern main() logs to the console while the config loads, then calls
 *          init(make_log_config(...)) once the final destination is known.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace vprinter {
namespace logging {

enum class LogTarget {
    Auto,    ///< Journal if available, then syslog (Linux); console elsewhere
    Journal, ///< systemd journal (requires VPRINTER_HAS_SYSTEMD)
    Syslog,
    File,    ///< Rotating file, 5 MB x 3
    Console, ///< No system sink
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< Only for LogTarget::File; empty means <data_dir>/logs/vprinter.log
    std::string data_dir;
};

/// Logging inputs from the command line and the config file
struct LogSources {
    int cli_verbosity = 0; ///< -v count
    std::string cli_dest;  ///< --log-dest
    std::string cli_file;  ///< --log-file
    std::string config_level; ///< /log_level
    std::string config_dest;  ///< /log_dest
    std::string config_file;  ///< /log_path
    std::string data_dir;
};

/**
 * @brief Replace the default spdlog logger
 *
 * Safe to call more than once; the previous default logger is dropped.
 * A sink that cannot be opened is reported on stderr and skipped.
 */
void init(const LogConfig& config);

/// Command line beats config for every field
LogConfig make_log_config(const LogSources& sources);

/// "trace" .. "off" (plus "warning"); case-sensitive, @p default_level otherwise
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// -v count to level: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// libhv LOG_LEVEL_* for an spdlog level; libhv has no trace, so trace maps to DEBUG
int to_hv_level(spdlog::level::level_enum level);

/// CLI verbosity wins, then the config string, then warn
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

/// "journal", "syslog", "file", "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// Where a File target with no explicit path writes
std::string default_log_file(const std::string& data_dir);

} // namespace logging
} // namespace vprinter
