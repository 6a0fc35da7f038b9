#pragma once
#include <cstdint>
#include <vector>

/**
 * Internal big-endian helpers shared by the field codecs.
 * Not installed; the public headers expose serialize() instead.
 */
namespace cudp {
namespace detail {

inline uint16_t read_u16_be(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

inline uint8_t high_octet(uint16_t v) { return static_cast<uint8_t>(v >> 8); }
inline uint8_t low_octet(uint16_t v)  { return static_cast<uint8_t>(v & 0xFF); }

inline void append_u16_be(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(high_octet(v));
    out.push_back(low_octet(v));
}

} // namespace detail
} // namespace cudp
