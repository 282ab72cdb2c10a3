// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "virtual_printer.h"
#include "vprinter_version.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <signal.h>
#include <thread>

using namespace vprinter;

// SIGTERM/SIGINT: graceful shutdown
// SIGUSR1: regenerate certificates and restart FTPS
static volatile sig_atomic_t g_quit = 0;
static volatile sig_atomic_t g_regenerate = 0;

static void signal_handler(int sig) {
    if (sig == SIGUSR1) {
        g_regenerate = 1;
    } else {
        g_quit = 1;
    }
}

static void setup_signal_handlers() {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
    signal(SIGUSR1, signal_handler);
    signal(SIGPIPE, SIG_IGN);
}

/// Command-line values win over the config file
static void apply_cli_overrides(const CliArgs& args, VirtualPrinterSettings& settings) {
    if (args.ftp_port > 0) {
        settings.ftps.port = static_cast<uint16_t>(args.ftp_port);
    }
    if (args.ssdp_port > 0) {
        settings.ssdp.port = static_cast<uint16_t>(args.ssdp_port);
    }
    if (!args.advertise_ip.empty()) {
        settings.advertise_ip = args.advertise_ip;
        settings.ssdp.advertise_ip = args.advertise_ip;
    }
    if (args.no_ssdp) {
        settings.ssdp_enabled = false;
    }
    if (args.no_ftps) {
        settings.ftps_enabled = false;
    }
}

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return 2;
    }
    if (args.show_help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.show_version) {
        printf("vprinter %s\n", version_string());
        return 0;
    }

    // Console-only until the config tells us where logs go
    logging::LogConfig early;
    early.level = logging::verbosity_to_level(args.verbosity);
    early.target = logging::LogTarget::Console;
    logging::init(early);

    std::string data_dir = resolve_data_dir(args.data_dir);
    std::string config_path = args.config_path.empty()
                                  ? (std::filesystem::path(data_dir) / "config.json").string()
                                  : args.config_path;

    Config config;
    config.init(config_path, data_dir);

    logging::LogSources log_sources;
    log_sources.cli_verbosity = args.verbosity;
    log_sources.cli_dest = args.log_dest;
    log_sources.cli_file = args.log_file;
    log_sources.config_level = config.get<std::string>("/log_level", "");
    log_sources.config_dest = config.get<std::string>("/log_dest", "auto");
    log_sources.config_file = config.get<std::string>("/log_path", "");
    log_sources.data_dir = data_dir;
    logging::LogConfig log_config = logging::make_log_config(log_sources);
    logging::init(log_config);

    spdlog::info("[Main] vprinter {} (config {}, data {})", version_string(), config_path,
                 data_dir);

    VirtualPrinterSettings settings = VirtualPrinterSettings::from_config(config);
    apply_cli_overrides(args, settings);

    VirtualPrinter printer(settings, [](const std::string& path, const std::string& source_ip) {
        spdlog::info("[Main] Received {} from {}", path, source_ip);
    });

    if (args.regenerate_certs) {
        if (!printer.regenerate_certificates()) {
            spdlog::error("[Main] Could not regenerate certificates");
        }
    }

    setup_signal_handlers();

    if (!printer.start()) {
        spdlog::critical("[Main] Nothing to run, exiting");
        return 1;
    }

    while (!g_quit) {
        if (g_regenerate) {
            g_regenerate = 0;
            spdlog::info("[Main] SIGUSR1: regenerating certificates");
            if (!printer.regenerate_certificates()) {
                spdlog::error("[Main] Certificate regeneration failed");
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("[Main] Shutting down");
    printer.stop();
    spdlog::default_logger()->flush();
    return 0;
}
