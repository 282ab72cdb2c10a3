// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

// Normally injected by the build from the project() version
#ifndef VPRINTER_VERSION
#define VPRINTER_VERSION "0.0.0-dev"
#endif

namespace vprinter {

inline const char* version_string() {
    return VPRINTER_VERSION;
}

} // namespace vprinter
