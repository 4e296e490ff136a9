// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_UTIL_STRENCODINGS_H
#define TRUSTMESH_UTIL_STRENCODINGS_H

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#if defined(__GNUC__)
__attribute__((format(printf, 1, 2)))
#endif
inline std::string strprintf(const char* format, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    return std::string(buffer);
}

/**
 * Convert byte array to lowercase hexadecimal string
 */
std::string HexStr(const uint8_t* data, size_t len);

std::string HexStr(const std::vector<uint8_t>& vch);

/**
 * Escape a string for embedding inside a JSON string literal
 * (quotes, backslashes and control characters).
 */
std::string JsonEscape(const std::string& str);

#endif // TRUSTMESH_UTIL_STRENCODINGS_H
