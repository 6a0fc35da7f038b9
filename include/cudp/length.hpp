#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>
#include "cudp/constants.hpp"
#include "cudp/result.hpp"
#include "cudp/visibility.hpp"

namespace cudp {

/**
 * Failure reading or validating a length field.
 */
class CUDP_API LengthError {
public:
    enum class Kind {
        empty,              // No bytes supplied
        insufficient_bytes, // Only one byte supplied
        too_short           // Value below minimum_length
    };

    static LengthError empty()              { return LengthError(Kind::empty, 0); }
    static LengthError insufficient_bytes() { return LengthError(Kind::insufficient_bytes, 0); }
    static LengthError too_short(uint16_t value) { return LengthError(Kind::too_short, value); }

    Kind kind() const { return kind_; }

    /** Rejected value; meaningful for Kind::too_short only. */
    uint16_t value() const { return value_; }

    bool operator==(const LengthError& o) const { return kind_ == o.kind_ && value_ == o.value_; }
    bool operator!=(const LengthError& o) const { return !(*this == o); }

private:
    LengthError(Kind kind, uint16_t value) : kind_(kind), value_(value) {}

    Kind kind_;
    uint16_t value_;
};

/**
 * The UDP length field: octets in header plus payload.
 * Never below 8, since the header alone takes 8 octets.
 */
class CUDP_API Length {
public:
    static Result<Length, LengthError> from_value(uint16_t value);

    /**
     * Reads a big-endian length from the first two bytes, then applies
     * the same minimum as from_value().
     */
    static Result<Length, LengthError> from_bytes(const uint8_t* data, std::size_t len);
    static Result<Length, LengthError> from_bytes(const std::vector<uint8_t>& bytes);

    uint16_t raw_value() const { return raw_; }

    /** Payload octets described by this length. */
    uint16_t data() const { return static_cast<uint16_t>(raw_ - minimum_length); }

    std::array<uint8_t, 2> serialize() const;
    void serialize_into(std::vector<uint8_t>& out) const;

    bool operator==(const Length& o) const { return raw_ == o.raw_; }
    bool operator!=(const Length& o) const { return raw_ != o.raw_; }

private:
    explicit Length(uint16_t raw_value) : raw_(raw_value) {}

    uint16_t raw_;
};

CUDP_API std::string to_string(const Length& length);
CUDP_API std::string to_string(const LengthError& error);

inline std::ostream& operator<<(std::ostream& os, const Length& l) { return os << l.raw_value(); }
inline std::ostream& operator<<(std::ostream& os, const LengthError& e) { return os << to_string(e); }

} // namespace cudp

namespace std {
template <>
struct hash<cudp::Length> {
    size_t operator()(const cudp::Length& l) const noexcept {
        return std::hash<uint16_t>{}(l.raw_value());
    }
};
} // namespace std
