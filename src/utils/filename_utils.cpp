// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/filename_utils.h"

#include <spdlog/spdlog.h>

namespace vprinter {

std::string get_filename_basename(const std::string& path) {
    if (path.empty()) {
        return path;
    }

    // Find last path separator
    size_t last_sep = path.find_last_of("/\\");
    if (last_sep == std::string::npos) {
        return path; // No separator, already just a filename
    }

    return path.substr(last_sep + 1);
}

std::string sanitize_upload_filename(const std::string& requested) {
    std::string name;
    name.reserve(requested.size());
    for (char c : get_filename_basename(requested)) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) {
            continue;
        }
        name.push_back(c);
    }

    if (name.empty() || name == "." || name == "..") {
        spdlog::debug("[sanitize_upload_filename] Rejected '{}'", requested);
        return "";
    }
    if (name != requested) {
        spdlog::debug("[sanitize_upload_filename] '{}' -> '{}'", requested, name);
    }
    return name;
}

} // namespace vprinter
