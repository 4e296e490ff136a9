// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include <util/strencodings.h>

std::string HexStr(const uint8_t* data, size_t len) {
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(hexmap[(data[i] >> 4) & 0x0F]);
        result.push_back(hexmap[data[i] & 0x0F]);
    }

    return result;
}

std::string HexStr(const std::vector<uint8_t>& vch) {
    return HexStr(vch.data(), vch.size());
}

std::string JsonEscape(const std::string& str) {
    std::string out;
    out.reserve(str.size() + 2);

    for (unsigned char c : str) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }

    return out;
}
