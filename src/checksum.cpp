#include "cudp/checksum.hpp"
#include "byte_order.hpp"

#include <cstdio>

namespace cudp {
namespace checksum_engine {

/**
 * Sum big-endian 16-bit words of a raw buffer.
 *
 * Words are assembled octet by octet, so the result does not depend on
 * host byte order or on the buffer's alignment.
 */
uint32_t sum_words(uint32_t initial, const uint8_t* data, std::size_t len) {
    if (!data) return initial;
    return sum_words(initial, data, data + len);
}

uint16_t fold(uint32_t sum) {
    // Fold carries
    while (sum > 0xFFFF) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(sum);
}

uint16_t finalize(uint32_t sum) {
    uint16_t result = static_cast<uint16_t>(~fold(sum) & 0xFFFF);

    // 0 on the wire means "no checksum"; a real zero is sent as all ones
    if (result == 0) {
        result = 0xFFFF;
    }
    return result;
}

bool is_valid_sum(uint32_t sum) {
    return fold(sum) == 0xFFFF;
}

} // namespace checksum_engine


// ---------------------------------------------------------------------------
// Checksum field
// ---------------------------------------------------------------------------
Result<Checksum, ChecksumError> Checksum::from_bytes(const uint8_t* data, std::size_t len) {
    if (!data || len == 0) return ChecksumError::empty;
    if (len < 2) return ChecksumError::insufficient_bytes;

    return Checksum(detail::read_u16_be(data));
}

Result<Checksum, ChecksumError> Checksum::from_bytes(const std::vector<uint8_t>& bytes) {
    return from_bytes(bytes.data(), bytes.size());
}

std::array<uint8_t, 2> Checksum::serialize() const {
    return {{ detail::high_octet(raw_), detail::low_octet(raw_) }};
}

void Checksum::serialize_into(std::vector<uint8_t>& out) const {
    detail::append_u16_be(out, raw_);
}

Checksum Checksum::compute(const uint8_t* pseudo, std::size_t pseudo_len,
                           const uint8_t* header, std::size_t header_len,
                           const uint8_t* data, std::size_t data_len)
{
    uint32_t sum = 0;
    sum = checksum_engine::sum_words(sum, pseudo, pseudo_len);
    sum = checksum_engine::sum_words(sum, header, header_len);
    sum = checksum_engine::sum_words(sum, data, data_len);
    return Checksum(checksum_engine::finalize(sum));
}

bool Checksum::verify(const uint8_t* pseudo, std::size_t pseudo_len,
                      const uint8_t* header, std::size_t header_len,
                      const uint8_t* data, std::size_t data_len)
{
    uint32_t sum = 0;
    sum = checksum_engine::sum_words(sum, pseudo, pseudo_len);
    sum = checksum_engine::sum_words(sum, header, header_len);
    sum = checksum_engine::sum_words(sum, data, data_len);
    return checksum_engine::is_valid_sum(sum);
}

std::string to_string(const Checksum& checksum) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%X", static_cast<unsigned>(checksum.raw_value()));
    return buf;
}

std::string to_string(ChecksumError error) {
    switch (error) {
    case ChecksumError::empty:
        return "Checksum bytes cannot be empty";
    case ChecksumError::insufficient_bytes:
        return "Checksum requires 2 bytes";
    }
    return "Unknown checksum error";
}

} // namespace cudp
