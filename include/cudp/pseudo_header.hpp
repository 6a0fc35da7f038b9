#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include "cudp/constants.hpp"
#include "cudp/ip.hpp"
#include "cudp/visibility.hpp"

namespace cudp {

/**
 * The IPv4 pseudo-header prefixed to the UDP checksum input.
 *
 * Never transmitted. Built right before computing or verifying a
 * checksum; `length` must be the total octet count of the datagram it
 * is used with (see Datagram::pseudo_header()).
 *
 * Layout (12 octets):
 *   0-3   source address
 *   4-7   destination address
 *   8     zero
 *   9     protocol (17)
 *   10-11 UDP length, big-endian
 */
class CUDP_API PseudoHeader {
public:
    PseudoHeader(const Ipv4Address& source, const Ipv4Address& destination, uint16_t length)
        : source_(source), destination_(destination), length_(length) {}

    const Ipv4Address& source() const { return source_; }
    const Ipv4Address& destination() const { return destination_; }
    uint16_t length() const { return length_; }

    std::array<uint8_t, pseudo_header_size> serialize() const;
    void serialize_into(std::vector<uint8_t>& out) const;

    bool operator==(const PseudoHeader& o) const {
        return source_ == o.source_ && destination_ == o.destination_ && length_ == o.length_;
    }
    bool operator!=(const PseudoHeader& o) const { return !(*this == o); }

private:
    Ipv4Address source_;
    Ipv4Address destination_;
    uint16_t length_;
};

} // namespace cudp
