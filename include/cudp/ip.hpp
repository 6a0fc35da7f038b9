#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include "cudp/result.hpp"
#include "cudp/visibility.hpp"

namespace cudp {

/**
 * Reasons an IPv4 address could not be read.
 */
enum class AddressError {
    invalid_format,     // Text is not a dotted-quad IPv4 address
    insufficient_bytes  // Fewer than 4 octets supplied
};

/**
 * IPv4 address as consumed by the UDP pseudo-header.
 *
 * Stored as four octets in network byte order; the codec never looks
 * inside it beyond copying those octets.
 */
class CUDP_API Ipv4Address {
public:
    Ipv4Address() = default;
    Ipv4Address(uint8_t a, uint8_t b, uint8_t c, uint8_t d) : octets_{{a, b, c, d}} {}

    static Ipv4Address from_octets(const std::array<uint8_t, 4>& octets);

    /** Builds an address from a host-order integer (0x7F000001 = 127.0.0.1). */
    static Ipv4Address from_host_order(uint32_t value);

    /** Parses dotted-quad text ("192.168.1.10"). */
    static Result<Ipv4Address, AddressError> parse(const std::string& text);

    /** Reads the first 4 octets of a buffer. */
    static Result<Ipv4Address, AddressError> from_bytes(const uint8_t* data, std::size_t len);

    uint32_t to_host_order() const;
    const std::array<uint8_t, 4>& octets() const { return octets_; }
    std::array<uint8_t, 4> serialize() const { return octets_; }

    bool operator==(const Ipv4Address& o) const { return octets_ == o.octets_; }
    bool operator!=(const Ipv4Address& o) const { return !(*this == o); }

private:
    std::array<uint8_t, 4> octets_{};
};

CUDP_API std::string to_string(const Ipv4Address& address);
CUDP_API std::string to_string(AddressError error);

inline std::ostream& operator<<(std::ostream& os, const Ipv4Address& a) { return os << to_string(a); }
inline std::ostream& operator<<(std::ostream& os, AddressError e) { return os << to_string(e); }

} // namespace cudp

namespace std {
template <>
struct hash<cudp::Ipv4Address> {
    size_t operator()(const cudp::Ipv4Address& a) const noexcept {
        return std::hash<uint32_t>{}(a.to_host_order());
    }
};
} // namespace std
