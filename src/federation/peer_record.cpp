// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include "peer_record.h"

#include <util/strencodings.h>
#include <util/time.h>

#include <cstring>
#include <iomanip>
#include <sstream>

namespace trustmesh {

namespace {

// Strings longer than this are treated as corruption on read
constexpr uint32_t MAX_FIELD_LENGTH = 64 * 1024;

void write_u32(std::vector<uint8_t>& data, uint32_t value) {
    for (int i = 0; i < 4; i++)
        data.push_back(static_cast<uint8_t>(value >> (i * 8)));
}

void write_u64(std::vector<uint8_t>& data, uint64_t value) {
    for (int i = 0; i < 8; i++)
        data.push_back(static_cast<uint8_t>(value >> (i * 8)));
}

void write_string(std::vector<uint8_t>& data, const std::string& str) {
    write_u32(data, static_cast<uint32_t>(str.size()));
    data.insert(data.end(), str.begin(), str.end());
}

class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data) {}

    bool read_u8(uint8_t& out) {
        if (offset_ + 1 > data_.size()) return false;
        out = data_[offset_++];
        return true;
    }

    bool read_u32(uint32_t& out) {
        if (offset_ + 4 > data_.size()) return false;
        out = 0;
        for (int i = 0; i < 4; i++)
            out |= static_cast<uint32_t>(data_[offset_ + i]) << (i * 8);
        offset_ += 4;
        return true;
    }

    bool read_u64(uint64_t& out) {
        if (offset_ + 8 > data_.size()) return false;
        out = 0;
        for (int i = 0; i < 8; i++)
            out |= static_cast<uint64_t>(data_[offset_ + i]) << (i * 8);
        offset_ += 8;
        return true;
    }

    bool read_string(std::string& out) {
        uint32_t len = 0;
        if (!read_u32(len)) return false;
        if (len > MAX_FIELD_LENGTH || offset_ + len > data_.size()) return false;
        out.assign(reinterpret_cast<const char*>(data_.data() + offset_), len);
        offset_ += len;
        return true;
    }

    bool at_end() const { return offset_ == data_.size(); }

private:
    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;
};

} // namespace

std::string PeerRecord::to_json() const {
    std::ostringstream oss;
    oss << std::setprecision(17);
    oss << "{";
    oss << "\"id\": \"" << JsonEscape(id) << "\", ";
    oss << "\"name\": \"" << JsonEscape(display_name) << "\", ";
    oss << "\"lastSeen\": \"" << FormatISO8601(last_seen) << "\", ";
    oss << "\"geometryHash\": \"" << geometry_hash << "\", ";
    oss << "\"overlap\": " << overlap << ", ";
    oss << "\"status\": \"" << status_name(status) << "\", ";
    if (is_quarantined()) {
        oss << "\"quarantineReason\": \"" << JsonEscape(quarantine_reason) << "\", ";
    }
    oss << "\"registeredAt\": \"" << FormatISO8601(registered_at) << "\"";
    oss << "}";
    return oss.str();
}

std::vector<uint8_t> PeerRecord::serialize() const {
    std::vector<uint8_t> data;
    data.reserve(128 + id.size() + display_name.size() + quarantine_reason.size());

    data.push_back(SERIALIZATION_VERSION);

    write_string(data, id);
    write_string(data, display_name);
    write_string(data, geometry_hash);

    // overlap (8 bytes, IEEE-754 bits)
    uint64_t overlap_bits;
    std::memcpy(&overlap_bits, &overlap, sizeof(double));
    write_u64(data, overlap_bits);

    data.push_back(static_cast<uint8_t>(status));
    write_string(data, quarantine_reason);

    write_u64(data, static_cast<uint64_t>(last_seen));
    write_u64(data, static_cast<uint64_t>(registered_at));

    return data;
}

std::optional<PeerRecord> PeerRecord::deserialize(const std::vector<uint8_t>& data) {
    Reader reader(data);
    PeerRecord record;

    uint8_t version = 0;
    if (!reader.read_u8(version) || version != SERIALIZATION_VERSION) return std::nullopt;

    if (!reader.read_string(record.id) || record.id.empty()) return std::nullopt;
    if (!reader.read_string(record.display_name)) return std::nullopt;
    if (!reader.read_string(record.geometry_hash)) return std::nullopt;

    uint64_t overlap_bits = 0;
    if (!reader.read_u64(overlap_bits)) return std::nullopt;
    std::memcpy(&record.overlap, &overlap_bits, sizeof(double));
    if (!(record.overlap >= 0.0 && record.overlap <= 1.0)) return std::nullopt;

    uint8_t status = 0;
    if (!reader.read_u8(status) || status > static_cast<uint8_t>(PeerStatus::QUARANTINED)) {
        return std::nullopt;
    }
    record.status = static_cast<PeerStatus>(status);

    if (!reader.read_string(record.quarantine_reason)) return std::nullopt;

    uint64_t last_seen = 0;
    uint64_t registered_at = 0;
    if (!reader.read_u64(last_seen) || !reader.read_u64(registered_at)) return std::nullopt;
    record.last_seen = static_cast<int64_t>(last_seen);
    record.registered_at = static_cast<int64_t>(registered_at);

    if (!reader.at_end()) return std::nullopt;

    return record;
}

} // namespace trustmesh
