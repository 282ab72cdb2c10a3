// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace vprinter {

namespace {

/// Copy keys present in @p defaults but missing from @p target (recursively)
/// @return true if anything was added
bool merge_missing(json& target, const json& defaults) {
    bool changed = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            changed = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            changed = merge_missing(target[it.key()], it.value()) || changed;
        }
    }
    return changed;
}

/// Run all versioned migrations in sequence up to CURRENT_CONFIG_VERSION
void run_versioned_migrations(json& config) {
    int version = 0;
    if (config.contains("config_version") && config["config_version"].is_number_integer()) {
        version = config["config_version"].get<int>();
    }

    if (version > CURRENT_CONFIG_VERSION) {
        spdlog::warn("[Config] config_version {} is newer than supported {}", version,
                     CURRENT_CONFIG_VERSION);
        return;
    }

    // No layout changes yet; v0 files only need the version stamp
    config["config_version"] = CURRENT_CONFIG_VERSION;
}

} // namespace

Config::Config() {}

json Config::default_config(const std::string& data_dir) {
    fs::path base(data_dir);
    return {{"config_version", CURRENT_CONFIG_VERSION},
            {"log_level", "info"},
            {"log_dest", "auto"},
            {"log_path", ""},
            {"printer",
             {{"name", "Virtual Printer"},
              {"serial", "00M09A391800001"},
              {"model", "BL-P001"},
              {"access_code", "12345678"},
              {"advertise_ip", ""}}},
            {"paths",
             {{"cert_dir", (base / "certs").string()},
              {"upload_dir", (base / "uploads").string()}}},
            {"ssdp", {{"enabled", true}, {"port", 2021}, {"announce_interval_sec", 30}}},
            {"ftps", {{"enabled", true}, {"port", 990}, {"idle_timeout_sec", 300}}}};
}

void Config::init(const std::string& config_path, const std::string& data_dir) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;
    json defaults = default_config(data_dir);

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        bool corrupt = false;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            if (!data.is_object()) {
                spdlog::error("[Config] {} does not contain a JSON object", config_path);
                corrupt = true;
            }
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            corrupt = true;
        }

        if (corrupt) {
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = defaults;
            config_modified = true;
        }

        json version_before = data.contains("config_version") ? data["config_version"] : json();
        run_versioned_migrations(data);
        if (data["config_version"] != version_before) {
            config_modified = true;
        }

        if (merge_missing(data, defaults)) {
            spdlog::debug("[Config] Added missing default keys");
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = defaults;
        config_modified = true;
    }

    if (config_modified) {
        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty()) {
            fs::create_directories(config_dir, ec);
        }
        if (!save()) {
            spdlog::warn("[Config] Continuing with unsaved configuration");
        }
    }

    spdlog::debug("[Config] initialized: printer={} serial={}",
                  get<std::string>("/printer/name", ""), get<std::string>("/printer/serial", ""));
}

bool Config::contains(const std::string& json_ptr) const {
    return data.contains(json::json_pointer(json_ptr));
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    std::string tmp_path = path + ".tmp";
    try {
        std::ofstream o(tmp_path, std::ios::trunc);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            return false;
        }
        o.close();
    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        spdlog::error("[Config] Could not replace {} with {}", path, tmp_path);
        std::remove(tmp_path.c_str());
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

} // namespace vprinter
