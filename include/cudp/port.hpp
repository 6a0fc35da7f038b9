#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>
#include "cudp/result.hpp"
#include "cudp/visibility.hpp"

namespace cudp {

/**
 * Failure reading a port field.
 */
enum class PortError {
    empty,              // No bytes supplied
    insufficient_bytes  // Only one byte supplied
};

/**
 * A 16-bit UDP port. Every value 0..65535 is legal.
 *
 * The port space splits into three conventional ranges:
 *   - well-known  [0, 1024)
 *   - registered  [1024, 49152)
 *   - dynamic     [49152, 65535]
 */
class CUDP_API Port {
public:
    constexpr explicit Port(uint16_t raw_value) : raw_(raw_value) {}

    static Port from_raw_value(uint16_t raw_value) { return Port(raw_value); }

    /** Reads a big-endian port from the first two bytes. */
    static Result<Port, PortError> from_bytes(const uint8_t* data, std::size_t len);
    static Result<Port, PortError> from_bytes(const std::vector<uint8_t>& bytes);

    // Well-known services
    static constexpr Port dns()    { return Port(53); }
    static constexpr Port dhcp()   { return Port(67); }
    static constexpr Port tftp()   { return Port(69); }
    static constexpr Port ntp()    { return Port(123); }
    static constexpr Port snmp()   { return Port(161); }
    static constexpr Port syslog() { return Port(514); }

    uint16_t raw_value() const { return raw_; }

    bool is_well_known() const { return raw_ < 1024; }
    bool is_registered() const { return raw_ >= 1024 && raw_ < 49152; }
    bool is_dynamic() const    { return raw_ >= 49152; }

    std::array<uint8_t, 2> serialize() const;
    void serialize_into(std::vector<uint8_t>& out) const;

    bool operator==(const Port& o) const { return raw_ == o.raw_; }
    bool operator!=(const Port& o) const { return raw_ != o.raw_; }

private:
    uint16_t raw_;
};

CUDP_API std::string to_string(const Port& port);
CUDP_API std::string to_string(PortError error);

inline std::ostream& operator<<(std::ostream& os, const Port& p) { return os << p.raw_value(); }
inline std::ostream& operator<<(std::ostream& os, PortError e) { return os << to_string(e); }

} // namespace cudp

namespace std {
template <>
struct hash<cudp::Port> {
    size_t operator()(const cudp::Port& p) const noexcept {
        return std::hash<uint16_t>{}(p.raw_value());
    }
};
} // namespace std
