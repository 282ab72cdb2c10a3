// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

namespace vprinter {

/**
 * @brief Outcome of a bounded socket/TLS operation
 *
 * Socket I/O never throws; callers branch on this instead.
 */
enum class IoStatus {
    Ok,       ///< Operation completed
    Timeout,  ///< Deadline passed before the operation completed
    Closed,   ///< Peer closed the connection (orderly or not)
    Overflow, ///< Control line exceeded the maximum length and was discarded
    Error     ///< Unrecoverable socket or TLS error
};

inline const char* io_status_name(IoStatus status) {
    switch (status) {
    case IoStatus::Ok:
        return "ok";
    case IoStatus::Timeout:
        return "timeout";
    case IoStatus::Closed:
        return "closed";
    case IoStatus::Overflow:
        return "overflow";
    case IoStatus::Error:
        return "error";
    }
    return "unknown";
}

} // namespace vprinter
