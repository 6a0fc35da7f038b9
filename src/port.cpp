#include "cudp/port.hpp"
#include "byte_order.hpp"

namespace cudp {

Result<Port, PortError> Port::from_bytes(const uint8_t* data, std::size_t len) {
    if (!data || len == 0) return PortError::empty;
    if (len < 2) return PortError::insufficient_bytes;

    return Port(detail::read_u16_be(data));
}

Result<Port, PortError> Port::from_bytes(const std::vector<uint8_t>& bytes) {
    return from_bytes(bytes.data(), bytes.size());
}

std::array<uint8_t, 2> Port::serialize() const {
    return {{ detail::high_octet(raw_), detail::low_octet(raw_) }};
}

void Port::serialize_into(std::vector<uint8_t>& out) const {
    detail::append_u16_be(out, raw_);
}

std::string to_string(const Port& port) {
    return std::to_string(port.raw_value());
}

std::string to_string(PortError error) {
    switch (error) {
    case PortError::empty:
        return "Port bytes cannot be empty";
    case PortError::insufficient_bytes:
        return "Port requires 2 bytes";
    }
    return "Unknown port error";
}

} // namespace cudp
