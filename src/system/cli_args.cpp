// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "ftps_server.h"
#include "ssdp_messages.h"
#include "utils/network_validation.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace vprinter {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (str[0] == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

/**
 * @brief Fetch the value of an option given as "--opt value" or "--opt=value"
 *
 * @return nullptr (after printing an error) if the value is missing
 */
static const char* option_value(int argc, char** argv, int& i, const char* long_name) {
    size_t len = strlen(long_name);
    if (strncmp(argv[i], long_name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", long_name);
    return nullptr;
}

static bool matches(const char* arg, const char* short_name, const char* long_name) {
    if (short_name && strcmp(arg, short_name) == 0) {
        return true;
    }
    size_t len = strlen(long_name);
    return strncmp(arg, long_name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>    Config file (default: <data-dir>/config.json)\n");
    printf("  --data-dir <dir>       Base directory for config, certificates and uploads\n");
    printf("  --ftp-port <n>         Implicit FTPS port (default: %d)\n", DEFAULT_FTPS_PORT);
    printf("  --ssdp-port <n>        SSDP discovery port (default: %d)\n", ssdp::DEFAULT_PORT);
    printf("  --advertise-ip <ip>    IPv4 address to advertise (default: autodetect)\n");
    printf("  --no-ssdp              Disable the discovery responder\n");
    printf("  --no-ftps              Disable the FTPS upload server\n");
    printf("  --regenerate-certs     Discard and regenerate TLS certificates on startup\n");
    printf("  -v, --verbose          Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>      Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>      Log file path (when --log-dest=file)\n");
    printf("  -h, --help             Show this help message\n");
    printf("  -V, --version          Show version information\n");
    printf("\nExamples:\n");
    printf("  %s --data-dir /tmp/vp --ftp-port 9990 -vv\n", program_name);
    printf("  %s --no-ssdp --advertise-ip 192.168.1.50\n", program_name);
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (matches(argv[i], "-c", "--config")) {
            const char* value = option_value(argc, argv, i, "--config");
            if (!value)
                return false;
            args.config_path = value;
        } else if (matches(argv[i], nullptr, "--data-dir")) {
            const char* value = option_value(argc, argv, i, "--data-dir");
            if (!value)
                return false;
            args.data_dir = value;
        } else if (matches(argv[i], nullptr, "--ftp-port")) {
            const char* value = option_value(argc, argv, i, "--ftp-port");
            if (!value || !parse_int(value, 1, 65535, args.ftp_port, "--ftp-port"))
                return false;
        } else if (matches(argv[i], nullptr, "--ssdp-port")) {
            const char* value = option_value(argc, argv, i, "--ssdp-port");
            if (!value || !parse_int(value, 1, 65535, args.ssdp_port, "--ssdp-port"))
                return false;
        } else if (matches(argv[i], nullptr, "--advertise-ip")) {
            const char* value = option_value(argc, argv, i, "--advertise-ip");
            if (!value)
                return false;
            if (!is_valid_ipv4(value)) {
                printf("Error: invalid --advertise-ip value: %s\n", value);
                return false;
            }
            args.advertise_ip = value;
        }
        // Simple boolean flags
        else if (strcmp(argv[i], "--no-ssdp") == 0) {
            args.no_ssdp = true;
        } else if (strcmp(argv[i], "--no-ftps") == 0) {
            args.no_ftps = true;
        } else if (strcmp(argv[i], "--regenerate-certs") == 0) {
            args.regenerate_certs = true;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Logging destination
        else if (matches(argv[i], nullptr, "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value)
                return false;
            if (strcmp(value, "auto") != 0 && strcmp(value, "journal") != 0 &&
                strcmp(value, "syslog") != 0 && strcmp(value, "file") != 0 &&
                strcmp(value, "console") != 0) {
                printf("Error: invalid --log-dest value: %s\n", value);
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
            args.log_dest = value;
        } else if (matches(argv[i], nullptr, "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value)
                return false;
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.show_help = true;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            args.show_version = true;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    if (args.no_ssdp && args.no_ftps) {
        printf("Error: --no-ssdp and --no-ftps together leave nothing to run\n");
        return false;
    }

    return true;
}

} // namespace vprinter
