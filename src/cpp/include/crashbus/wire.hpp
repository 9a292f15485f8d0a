#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace crashbus {

// Big-endian writers. Readers advance (data, len) and return false on underflow.

inline void write_u8(std::vector<uint8_t>& buf, uint8_t val) {
    buf.push_back(val);
}

inline void write_u16_be(std::vector<uint8_t>& buf, uint16_t val) {
    buf.push_back(static_cast<uint8_t>(val >> 8)); buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

inline void write_u32_be(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>(val >> 24)); buf.push_back(static_cast<uint8_t>(val >> 16));
    buf.push_back(static_cast<uint8_t>(val >> 8)); buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

inline void write_u64_be(std::vector<uint8_t>& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
}

/// u32 length prefix
inline void write_string(std::vector<uint8_t>& buf, const std::string& s) {
    write_u32_be(buf, static_cast<uint32_t>(s.size()));
    buf.insert(buf.end(), s.begin(), s.end());
}

/// u16 length prefix, for envelope header fields
inline void write_short_string(std::vector<uint8_t>& buf, const std::string& s) {
    write_u16_be(buf, static_cast<uint16_t>(s.size()));
    buf.insert(buf.end(), s.begin(), s.end());
}

inline bool read_u8(const uint8_t*& data, size_t& len, uint8_t& out) {
    if (len < 1) return false;
    out = data[0]; data += 1; len -= 1;
    return true;
}

inline bool read_u16_be(const uint8_t*& data, size_t& len, uint16_t& out) {
    if (len < 2) return false;
    out = static_cast<uint16_t>((data[0] << 8) | data[1]); data += 2; len -= 2;
    return true;
}

inline bool read_u32_be(const uint8_t*& data, size_t& len, uint32_t& out) {
    if (len < 4) return false;
    out = (uint32_t(data[0]) << 24) | (uint32_t(data[1]) << 16) | (uint32_t(data[2]) << 8) | uint32_t(data[3]);
    data += 4; len -= 4;
    return true;
}

inline bool read_u64_be(const uint8_t*& data, size_t& len, uint64_t& out) {
    if (len < 8) return false;
    out = 0;
    for (int i = 0; i < 8; ++i) out = (out << 8) | data[i];
    data += 8; len -= 8;
    return true;
}

inline bool read_bytes(const uint8_t*& data, size_t& len, size_t count, std::string& out) {
    if (len < count) return false;
    out.assign(reinterpret_cast<const char*>(data), count);
    data += count; len -= count;
    return true;
}

inline bool read_string(const uint8_t*& data, size_t& len, std::string& out) {
    uint32_t n = 0;
    if (!read_u32_be(data, len, n)) return false;
    return read_bytes(data, len, n, out);
}

inline bool read_short_string(const uint8_t*& data, size_t& len, std::string& out) {
    uint16_t n = 0;
    if (!read_u16_be(data, len, n)) return false;
    return read_bytes(data, len, n, out);
}

} // namespace crashbus
