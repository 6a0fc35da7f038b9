#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "cudp/checksum.hpp"
#include "cudp/header.hpp"
#include "cudp/ip.hpp"
#include "cudp/length.hpp"
#include "cudp/port.hpp"
#include "cudp/pseudo_header.hpp"
#include "cudp/result.hpp"
#include "cudp/visibility.hpp"

namespace cudp {

/**
 * Failure building or parsing a datagram.
 */
class CUDP_API DatagramError {
public:
    enum class Kind {
        data_too_large,   // Payload does not fit the 16-bit length field
        length,           // Length construction failed
        header,           // Header parse failed
        insufficient_data // Fewer payload bytes than the header declares
    };

    static DatagramError data_too_large(std::size_t size) {
        return DatagramError(Kind::data_too_large, size);
    }
    static DatagramError length(LengthError e) { return DatagramError(Kind::length, e); }
    static DatagramError header(HeaderError e) { return DatagramError(Kind::header, std::move(e)); }
    static DatagramError insufficient_data(std::size_t expected, std::size_t got) {
        return DatagramError(Kind::insufficient_data, std::make_pair(expected, got));
    }

    Kind kind() const { return kind_; }

    /** Rejected payload size (Kind::data_too_large). */
    std::size_t size() const { return std::get<std::size_t>(cause_); }

    const LengthError& length_error() const { return std::get<LengthError>(cause_); }
    const HeaderError& header_error() const { return std::get<HeaderError>(cause_); }

    /** Declared and available payload octets (Kind::insufficient_data). */
    std::size_t expected() const { return std::get<Span>(cause_).first; }
    std::size_t got() const      { return std::get<Span>(cause_).second; }

    bool operator==(const DatagramError& o) const { return kind_ == o.kind_ && cause_ == o.cause_; }
    bool operator!=(const DatagramError& o) const { return !(*this == o); }

private:
    using Span  = std::pair<std::size_t, std::size_t>;
    using Cause = std::variant<std::size_t, LengthError, HeaderError, Span>;

    DatagramError(Kind kind, Cause cause) : kind_(kind), cause_(std::move(cause)) {}

    Kind kind_;
    Cause cause_;
};

/**
 * A complete UDP datagram: header followed by payload.
 *
 * Values are immutable. create() derives the length field from the
 * payload, so header().length().data() == data().size() holds for every
 * datagram built here or returned by parse().
 */
class CUDP_API Datagram {
public:
    /** Pairs an existing header with its payload. No consistency check. */
    Datagram(const Header& header, std::vector<uint8_t> data)
        : header_(header), data_(std::move(data)) {}

    /**
     * Builds a datagram and fills in the length field.
     *
     * @param source       Sending port
     * @param destination  Receiving port
     * @param data         Payload, at most maximum_payload octets
     * @param checksum     Checksum field to carry (absent by default;
     *                     use with_checksum() to compute a real one)
     */
    static Result<Datagram, DatagramError> create(Port source,
                                                  Port destination,
                                                  std::vector<uint8_t> data,
                                                  Checksum checksum = Checksum::zero());

    /**
     * Parses header and payload.
     *
     * The header's length field is authoritative: bytes past the
     * declared length are ignored, missing bytes are an error.
     */
    static Result<Datagram, DatagramError> parse(const uint8_t* bytes, std::size_t len);
    static Result<Datagram, DatagramError> parse(const std::vector<uint8_t>& bytes);

    const Header& header() const { return header_; }
    const std::vector<uint8_t>& data() const { return data_; }

    /** Octets on the wire, header included. */
    uint16_t total_length() const { return header_.length().raw_value(); }

    /** Pseudo-header for this datagram between two hosts. */
    PseudoHeader pseudo_header(const Ipv4Address& source, const Ipv4Address& destination) const {
        return PseudoHeader(source, destination, total_length());
    }

    /**
     * Returns a copy whose checksum is computed over `pseudo`, this
     * header (checksum field zeroed) and the payload.
     */
    Datagram with_checksum(const PseudoHeader& pseudo) const;

    /**
     * Receive-side validation. An absent checksum always passes;
     * otherwise the transmitted value must verify against `pseudo`.
     */
    bool verify_checksum(const PseudoHeader& pseudo) const;

    std::vector<uint8_t> serialize() const;
    void serialize_into(std::vector<uint8_t>& out) const;

    bool operator==(const Datagram& o) const { return header_ == o.header_ && data_ == o.data_; }
    bool operator!=(const Datagram& o) const { return !(*this == o); }

private:
    Header header_;
    std::vector<uint8_t> data_;
};

/** "UDP src=8080 dst=514 len=12 csum=0x0 payload=4" */
CUDP_API std::string to_string(const Datagram& datagram);
CUDP_API std::string to_string(const DatagramError& error);

inline std::ostream& operator<<(std::ostream& os, const Datagram& d) { return os << to_string(d); }
inline std::ostream& operator<<(std::ostream& os, const DatagramError& e) { return os << to_string(e); }

} // namespace cudp
