// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_UTIL_TIME_H
#define TRUSTMESH_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

/** Wall-clock Unix time in milliseconds. */
inline int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/** Render Unix milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC). */
std::string FormatISO8601(int64_t unix_millis);

#endif // TRUSTMESH_UTIL_TIME_H
