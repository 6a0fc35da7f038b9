#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "cudp/checksum.hpp"
#include "cudp/constants.hpp"
#include "cudp/length.hpp"
#include "cudp/port.hpp"
#include "cudp/result.hpp"
#include "cudp/visibility.hpp"

namespace cudp {

/**
 * Failure parsing a UDP header.
 *
 * Field failures keep the underlying field error, so a caller can tell
 * "bad length" from "bad checksum" and still see why the field failed.
 */
class CUDP_API HeaderError {
public:
    enum class Kind {
        insufficient_bytes, // Buffer shorter than header_size
        source,             // Source port field
        destination,        // Destination port field
        length,             // Length field
        checksum            // Checksum field
    };

    static HeaderError insufficient_bytes(std::size_t count) {
        return HeaderError(Kind::insufficient_bytes, count);
    }
    static HeaderError source(PortError e)      { return HeaderError(Kind::source, e); }
    static HeaderError destination(PortError e) { return HeaderError(Kind::destination, e); }
    static HeaderError length(LengthError e)    { return HeaderError(Kind::length, e); }
    static HeaderError checksum(ChecksumError e){ return HeaderError(Kind::checksum, e); }

    Kind kind() const { return kind_; }

    // Payload accessors; each one is only valid for its matching kind and
    // throws std::bad_variant_access otherwise.
    std::size_t count() const                   { return std::get<std::size_t>(cause_); }
    PortError port_error() const                { return std::get<PortError>(cause_); }
    const LengthError& length_error() const     { return std::get<LengthError>(cause_); }
    ChecksumError checksum_error() const        { return std::get<ChecksumError>(cause_); }

    bool operator==(const HeaderError& o) const { return kind_ == o.kind_ && cause_ == o.cause_; }
    bool operator!=(const HeaderError& o) const { return !(*this == o); }

private:
    using Cause = std::variant<std::size_t, PortError, LengthError, ChecksumError>;

    HeaderError(Kind kind, Cause cause) : kind_(kind), cause_(std::move(cause)) {}

    Kind kind_;
    Cause cause_;
};

/**
 * The fixed 8-octet UDP header.
 *
 *   0-1 source port | 2-3 destination port | 4-5 length | 6-7 checksum
 */
class CUDP_API Header {
public:
    Header(Port source, Port destination, Length length, Checksum checksum)
        : source_(source), destination_(destination), length_(length), checksum_(checksum) {}

    /**
     * Parses the first header_size bytes of a buffer.
     * Fields are read in wire order; the first failing field wins.
     */
    static Result<Header, HeaderError> parse(const uint8_t* data, std::size_t len);
    static Result<Header, HeaderError> parse(const std::vector<uint8_t>& bytes);

    Port source() const { return source_; }
    Port destination() const { return destination_; }
    Length length() const { return length_; }
    Checksum checksum() const { return checksum_; }

    /** Copy of this header carrying a different checksum. */
    Header with_checksum(Checksum checksum) const {
        return Header(source_, destination_, length_, checksum);
    }

    std::array<uint8_t, header_size> serialize() const;
    void serialize_into(std::vector<uint8_t>& out) const;

    bool operator==(const Header& o) const {
        return source_ == o.source_ && destination_ == o.destination_ &&
               length_ == o.length_ && checksum_ == o.checksum_;
    }
    bool operator!=(const Header& o) const { return !(*this == o); }

private:
    Port source_;
    Port destination_;
    Length length_;
    Checksum checksum_;
};

/** "UDP src=12345 dst=53 len=20 csum=0x0" */
CUDP_API std::string to_string(const Header& header);
CUDP_API std::string to_string(const HeaderError& error);

inline std::ostream& operator<<(std::ostream& os, const Header& h) { return os << to_string(h); }
inline std::ostream& operator<<(std::ostream& os, const HeaderError& e) { return os << to_string(e); }

} // namespace cudp

namespace std {
template <>
struct hash<cudp::Header> {
    size_t operator()(const cudp::Header& h) const noexcept {
        // All four fields fit in one 64-bit word
        const uint64_t packed =
            (static_cast<uint64_t>(h.source().raw_value()) << 48) |
            (static_cast<uint64_t>(h.destination().raw_value()) << 32) |
            (static_cast<uint64_t>(h.length().raw_value()) << 16) |
             static_cast<uint64_t>(h.checksum().raw_value());
        return std::hash<uint64_t>{}(packed);
    }
};
} // namespace std
