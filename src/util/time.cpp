// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include <util/time.h>

#include <cstdio>
#include <ctime>

std::string FormatISO8601(int64_t unix_millis) {
    int64_t secs = unix_millis / 1000;
    int64_t millis = unix_millis % 1000;
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(millis));
    return std::string(buf);
}
