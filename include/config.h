// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __VPRINTER_CONFIG_H__
#define __VPRINTER_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace vprinter {

/// Bumped whenever the on-disk layout changes
constexpr int CURRENT_CONFIG_VERSION = 1;

/**
 * @brief Daemon configuration backed by a JSON file
 *
 * Values are addressed with JSON pointers (RFC 6901). Missing keys are filled
 * from the built-in defaults on init(), so callers can rely on every default
 * key being present afterwards.
 *
 * Thread safety: Not thread-safe. Load once at startup on the main thread.
 *
 * Example usage:
 * ```cpp
 * Config cfg;
 * cfg.init("/etc/vprinter/config.json", "/var/lib/vprinter");
 *
 * std::string serial = cfg.get<std::string>("/printer/serial", "");
 * cfg.set<int>("/ftps/port", 9990);
 * cfg.save();
 * ```
 */
class Config {
  private:
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Load configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails to
     * parse is renamed to `<path>.corrupt` and replaced with defaults.
     *
     * @param config_path Path to JSON configuration file
     * @param data_dir Base directory for the default cert and upload paths
     */
    void init(const std::string& config_path, const std::string& data_dir);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found or type mismatch
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path is missing or holds the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] {} has unexpected type: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /// Check whether a value exists at @p json_ptr
    bool contains(const std::string& json_ptr) const;

    /**
     * @brief Write the configuration to disk
     *
     * Written to `<path>.tmp` and renamed over the original.
     *
     * @return false if the file could not be written
     */
    bool save();

    /**
     * @brief Built-in default document
     *
     * @param data_dir Base directory for `paths/cert_dir` and `paths/upload_dir`
     */
    static json default_config(const std::string& data_dir);
};

} // namespace vprinter

#endif // __VPRINTER_CONFIG_H__
