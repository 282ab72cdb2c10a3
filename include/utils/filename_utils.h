// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace vprinter {

/**
 * @brief Last path component, treating both '/' and '\' as separators
 *
 * "a/b/c.3mf" -> "c.3mf", "C:\\jobs\\c.3mf" -> "c.3mf", "dir/" -> ""
 */
std::string get_filename_basename(const std::string& path);

/**
 * @brief Turn a client-supplied STOR argument into a safe file name
 *
 * Keeps only the basename and drops control characters. "", "." and ".."
 * are rejected, so the result can never name a path outside the upload
 * directory.
 *
 * @return Sanitized name, or empty string if nothing usable remains
 */
std::string sanitize_upload_filename(const std::string& requested);

} // namespace vprinter
