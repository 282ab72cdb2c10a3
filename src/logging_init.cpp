// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include "hv/hlog.h" // libhv logging - sync level with spdlog

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <filesystem>
#include <utility>
#include <vector>

#ifdef __linux__
#ifdef VPRINTER_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace vprinter {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "vprinter";
constexpr size_t LOG_FILE_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

const std::pair<const char*, spdlog::level::level_enum> LEVEL_NAMES[] = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
    {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
};

const std::pair<const char*, LogTarget> TARGET_NAMES[] = {
    {"auto", LogTarget::Auto},     {"journal", LogTarget::Journal},
    {"syslog", LogTarget::Syslog}, {"file", LogTarget::File},
    {"console", LogTarget::Console},
};

LogTarget detect_best_target() {
#ifdef __linux__
#ifdef VPRINTER_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

spdlog::sink_ptr make_file_sink(const LogConfig& config) {
    std::string path =
        config.file_path.empty() ? default_log_file(config.data_dir) : config.file_path;

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, LOG_FILE_BYTES,
                                                                  LOG_FILE_COUNT);
}

/// nullptr when the target has no sink of its own
spdlog::sink_ptr make_system_sink(LogTarget target, const LogConfig& config) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Journal:
#ifdef VPRINTER_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(LOGGER_NAME);
#else
        [[fallthrough]];
#endif
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID, LOG_DAEMON,
                                                               false);
#else
    case LogTarget::Journal:
    case LogTarget::Syslog:
        return nullptr;
#endif
    case LogTarget::File:
        return make_file_sink(config);
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
    return nullptr;
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    try {
        if (auto sink = make_system_sink(effective_target, config)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        // Unwritable log file must not take the daemon down
        fprintf(stderr, "[Logging] Cannot open %s sink: %s\n", log_target_name(effective_target),
                e.what());
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    // Uploads and service failures should reach disk before a crash
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);

    hlog_set_level(to_hv_level(config.level));

    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

LogConfig make_log_config(const LogSources& sources) {
    LogConfig config;
    config.level = resolve_log_level(sources.cli_verbosity, sources.config_level);
    config.target =
        parse_log_target(sources.cli_dest.empty() ? sources.config_dest : sources.cli_dest);
    config.file_path = sources.cli_file.empty() ? sources.config_file : sources.cli_file;
    config.data_dir = sources.data_dir;
    return config;
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (str == entry.first) {
            return entry.second;
        }
    }
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity > 2 ? spdlog::level::trace : spdlog::level::warn;
    }
}

int to_hv_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG; // libhv VERBOSE is too noisy
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    default:
        return LOG_LEVEL_SILENT;
    }
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : TARGET_NAMES) {
        if (str == entry.first) {
            return entry.second;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : TARGET_NAMES) {
        if (entry.second == target) {
            return entry.first;
        }
    }
    return "unknown";
}

std::string default_log_file(const std::string& data_dir) {
    if (data_dir.empty()) {
        return "vprinter.log";
    }
    return (std::filesystem::path(data_dir) / "logs" / "vprinter.log").string();
}

} // namespace logging
} // namespace vprinter
