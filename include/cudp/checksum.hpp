#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <ostream>
#include <string>
#include <vector>
#include "cudp/result.hpp"
#include "cudp/visibility.hpp"

namespace cudp {

/**
 * One's-complement checksum engine (RFC 768 / RFC 1071).
 *
 * The UDP checksum covers three regions that never live in one buffer:
 * the pseudo-header, the UDP header (checksum field zeroed) and the
 * payload. The engine folds them one after another into a single
 * running sum instead of concatenating them.
 *
 * Every span is paired on its own: an odd-length span is padded with
 * a zero low octet and its last byte is never combined with the first
 * byte of the following span.
 */
namespace checksum_engine {

/**
 * Adds the big-endian 16-bit words of [first, last) to `initial`.
 *
 * The sum is partially folded whenever its top bit becomes set, which
 * leaves the one's-complement value unchanged and keeps arbitrarily
 * long spans from wrapping the 32-bit accumulator.
 */
template <typename It>
uint32_t sum_words(uint32_t initial, It first, It last) {
    uint32_t sum = initial;
    while (first != last) {
        const uint32_t high = static_cast<uint8_t>(*first);
        ++first;

        uint32_t low = 0;
        if (first != last) {
            low = static_cast<uint8_t>(*first);
            ++first;
        }

        sum += (high << 8) | low;
        if (sum & 0x80000000u) {
            sum = (sum & 0xFFFF) + (sum >> 16);
        }
    }
    return sum;
}

/** Pointer/length form of sum_words(). A null pointer contributes nothing. */
CUDP_API uint32_t sum_words(uint32_t initial, const uint8_t* data, std::size_t len);

/** Any container of octets with begin()/end(). */
template <typename Bytes>
uint32_t sum_span(uint32_t initial, const Bytes& bytes) {
    using std::begin;
    using std::end;
    return sum_words(initial, begin(bytes), end(bytes));
}

/**
 * End-around carry folding.
 * Loops until no carry is left; one pass is not enough when the sum
 * carries into bit 16 a second time.
 */
CUDP_API uint16_t fold(uint32_t sum);

/**
 * Turns an accumulated sum into the value transmitted on the wire:
 * fold, complement, and map a zero result to 0xFFFF (0 means "absent").
 */
CUDP_API uint16_t finalize(uint32_t sum);

/** True iff the folded sum of a checksummed region is all ones. */
CUDP_API bool is_valid_sum(uint32_t sum);

} // namespace checksum_engine


/**
 * Failure reading a checksum field.
 */
enum class ChecksumError {
    empty,              // No bytes supplied
    insufficient_bytes  // Only one byte supplied
};

/**
 * The 16-bit UDP checksum field.
 *
 * Any value is legal. 0x0000 on the wire means the sender did not
 * compute a checksum; compute() therefore never yields 0 and sends a
 * genuine zero sum as 0xFFFF.
 */
class CUDP_API Checksum {
public:
    constexpr explicit Checksum(uint16_t raw_value) : raw_(raw_value) {}

    static Checksum from_raw_value(uint16_t raw_value) { return Checksum(raw_value); }

    /** The "no checksum" sentinel. */
    static constexpr Checksum zero() { return Checksum(0); }

    /** Reads a big-endian checksum from the first two bytes. */
    static Result<Checksum, ChecksumError> from_bytes(const uint8_t* data, std::size_t len);
    static Result<Checksum, ChecksumError> from_bytes(const std::vector<uint8_t>& bytes);

    uint16_t raw_value() const { return raw_; }
    bool is_absent() const { return raw_ == 0; }

    std::array<uint8_t, 2> serialize() const;
    void serialize_into(std::vector<uint8_t>& out) const;

    /**
     * Computes the checksum over pseudo-header, header and payload.
     *
     * Each argument may be a different container type. The header
     * span must carry a zeroed checksum field.
     */
    template <typename Pseudo, typename HeaderBytes, typename Data>
    static Checksum compute(const Pseudo& pseudo, const HeaderBytes& header, const Data& data) {
        uint32_t sum = 0;
        sum = checksum_engine::sum_span(sum, pseudo);
        sum = checksum_engine::sum_span(sum, header);
        sum = checksum_engine::sum_span(sum, data);
        return Checksum(checksum_engine::finalize(sum));
    }

    static Checksum compute(const uint8_t* pseudo, std::size_t pseudo_len,
                            const uint8_t* header, std::size_t header_len,
                            const uint8_t* data, std::size_t data_len);

    /**
     * Receive-side check. The header span carries the transmitted
     * checksum. Callers skip this for absent (0x0000) checksums.
     */
    template <typename Pseudo, typename HeaderBytes, typename Data>
    static bool verify(const Pseudo& pseudo, const HeaderBytes& header, const Data& data) {
        uint32_t sum = 0;
        sum = checksum_engine::sum_span(sum, pseudo);
        sum = checksum_engine::sum_span(sum, header);
        sum = checksum_engine::sum_span(sum, data);
        return checksum_engine::is_valid_sum(sum);
    }

    static bool verify(const uint8_t* pseudo, std::size_t pseudo_len,
                       const uint8_t* header, std::size_t header_len,
                       const uint8_t* data, std::size_t data_len);

    bool operator==(const Checksum& o) const { return raw_ == o.raw_; }
    bool operator!=(const Checksum& o) const { return raw_ != o.raw_; }

private:
    uint16_t raw_;
};

/** "0x" followed by uppercase hex digits, e.g. "0xABCD" or "0x0". */
CUDP_API std::string to_string(const Checksum& checksum);
CUDP_API std::string to_string(ChecksumError error);

inline std::ostream& operator<<(std::ostream& os, const Checksum& c) { return os << to_string(c); }
inline std::ostream& operator<<(std::ostream& os, ChecksumError e) { return os << to_string(e); }

} // namespace cudp

namespace std {
template <>
struct hash<cudp::Checksum> {
    size_t operator()(const cudp::Checksum& c) const noexcept {
        return std::hash<uint16_t>{}(c.raw_value());
    }
};
} // namespace std
