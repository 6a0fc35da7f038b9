#include "cudp/length.hpp"
#include "byte_order.hpp"

namespace cudp {

Result<Length, LengthError> Length::from_value(uint16_t value) {
    if (value < minimum_length) {
        return LengthError::too_short(value);
    }
    return Length(value);
}

Result<Length, LengthError> Length::from_bytes(const uint8_t* data, std::size_t len) {
    if (!data || len == 0) return LengthError::empty();
    if (len < 2) return LengthError::insufficient_bytes();

    return from_value(detail::read_u16_be(data));
}

Result<Length, LengthError> Length::from_bytes(const std::vector<uint8_t>& bytes) {
    return from_bytes(bytes.data(), bytes.size());
}

std::array<uint8_t, 2> Length::serialize() const {
    return {{ detail::high_octet(raw_), detail::low_octet(raw_) }};
}

void Length::serialize_into(std::vector<uint8_t>& out) const {
    detail::append_u16_be(out, raw_);
}

std::string to_string(const Length& length) {
    return std::to_string(length.raw_value());
}

std::string to_string(const LengthError& error) {
    switch (error.kind()) {
    case LengthError::Kind::empty:
        return "Length bytes cannot be empty";
    case LengthError::Kind::insufficient_bytes:
        return "Length requires 2 bytes";
    case LengthError::Kind::too_short:
        return "Length " + std::to_string(error.value()) +
               " is less than minimum " + std::to_string(minimum_length);
    }
    return "Unknown length error";
}

} // namespace cudp
