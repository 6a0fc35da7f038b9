/**
 * IPv4 address helpers for the pseudo-header.
 *
 * Text conversion goes through the platform inet_pton()/inet_ntop(),
 * the same calls the socket layer uses, so "what the OS accepts" and
 * "what cudp accepts" never diverge.
 */

#include "cudp/ip.hpp"

#if defined(_WIN32)
  #ifndef WIN32_LEAN_AND_MEAN
  #  define WIN32_LEAN_AND_MEAN
  #endif
  #include <winsock2.h>
  #include <ws2tcpip.h>
#else
  #include <arpa/inet.h>
  #include <netinet/in.h>
#endif

#include <cstring>

namespace cudp {

Ipv4Address Ipv4Address::from_octets(const std::array<uint8_t, 4>& octets) {
    return Ipv4Address(octets[0], octets[1], octets[2], octets[3]);
}

Ipv4Address Ipv4Address::from_host_order(uint32_t value) {
    return Ipv4Address(static_cast<uint8_t>(value >> 24),
                       static_cast<uint8_t>(value >> 16),
                       static_cast<uint8_t>(value >> 8),
                       static_cast<uint8_t>(value));
}

Result<Ipv4Address, AddressError> Ipv4Address::parse(const std::string& text) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return AddressError::invalid_format;
    }

    // in_addr is already in network order
    std::array<uint8_t, 4> octets{};
    std::memcpy(octets.data(), &addr, octets.size());
    return from_octets(octets);
}

Result<Ipv4Address, AddressError> Ipv4Address::from_bytes(const uint8_t* data, std::size_t len) {
    if (!data || len < 4) {
        return AddressError::insufficient_bytes;
    }
    return Ipv4Address(data[0], data[1], data[2], data[3]);
}

uint32_t Ipv4Address::to_host_order() const {
    return (static_cast<uint32_t>(octets_[0]) << 24) |
           (static_cast<uint32_t>(octets_[1]) << 16) |
           (static_cast<uint32_t>(octets_[2]) << 8)  |
            static_cast<uint32_t>(octets_[3]);
}

std::string to_string(const Ipv4Address& address) {
    in_addr addr{};
    std::memcpy(&addr, address.octets().data(), 4);

    char buf[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf))) {
        // Formatting four octets cannot realistically fail; fall back anyway
        const auto& o = address.octets();
        return std::to_string(o[0]) + "." + std::to_string(o[1]) + "." +
               std::to_string(o[2]) + "." + std::to_string(o[3]);
    }
    return buf;
}

std::string to_string(AddressError error) {
    switch (error) {
    case AddressError::invalid_format:
        return "Address is not a dotted-quad IPv4 address";
    case AddressError::insufficient_bytes:
        return "Address requires 4 bytes";
    }
    return "Unknown address error";
}

} // namespace cudp
