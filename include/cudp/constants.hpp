#pragma once
#include <cstddef>
#include <cstdint>

namespace cudp {

/**
 * Fixed values of the UDP wire format (RFC 768).
 */
constexpr uint8_t     protocol_number    = 17;     // IP protocol number for UDP
constexpr uint16_t    minimum_length     = 8;      // Smallest legal length field
constexpr std::size_t header_size        = 8;      // Octets in a serialized header
constexpr std::size_t pseudo_header_size = 12;     // Octets in a serialized pseudo-header
constexpr std::size_t maximum_payload    = 65535 - header_size;

} // namespace cudp
