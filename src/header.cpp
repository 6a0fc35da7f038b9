/**
 * UDP header codec.
 *
 * Parsing delegates each 2-octet field to its own value type and wraps
 * the field's error with the field's position, so diagnostics keep both
 * "which field" and "why".
 */

#include "cudp/header.hpp"

#include <algorithm>

namespace cudp {

Result<Header, HeaderError> Header::parse(const uint8_t* data, std::size_t len) {
    if (!data || len < header_size) {
        return HeaderError::insufficient_bytes(data ? len : 0);
    }

    auto src = Port::from_bytes(data, 2);
    if (!src) return HeaderError::source(src.error());

    auto dst = Port::from_bytes(data + 2, 2);
    if (!dst) return HeaderError::destination(dst.error());

    auto len_field = Length::from_bytes(data + 4, 2);
    if (!len_field) return HeaderError::length(len_field.error());

    auto sum = Checksum::from_bytes(data + 6, 2);
    if (!sum) return HeaderError::checksum(sum.error());

    return Header(src.value(), dst.value(), len_field.value(), sum.value());
}

Result<Header, HeaderError> Header::parse(const std::vector<uint8_t>& bytes) {
    return parse(bytes.data(), bytes.size());
}

std::array<uint8_t, header_size> Header::serialize() const {
    std::array<uint8_t, header_size> out{};
    auto it = out.begin();

    const auto src = source_.serialize();
    const auto dst = destination_.serialize();
    const auto len = length_.serialize();
    const auto sum = checksum_.serialize();

    it = std::copy(src.begin(), src.end(), it);
    it = std::copy(dst.begin(), dst.end(), it);
    it = std::copy(len.begin(), len.end(), it);
    std::copy(sum.begin(), sum.end(), it);
    return out;
}

void Header::serialize_into(std::vector<uint8_t>& out) const {
    source_.serialize_into(out);
    destination_.serialize_into(out);
    length_.serialize_into(out);
    checksum_.serialize_into(out);
}

std::string to_string(const Header& header) {
    return "UDP src=" + to_string(header.source()) +
           " dst=" + to_string(header.destination()) +
           " len=" + to_string(header.length()) +
           " csum=" + to_string(header.checksum());
}

std::string to_string(const HeaderError& error) {
    switch (error.kind()) {
    case HeaderError::Kind::insufficient_bytes:
        return "Header requires " + std::to_string(header_size) +
               " bytes, got " + std::to_string(error.count());
    case HeaderError::Kind::source:
        return "Invalid source port: " + to_string(error.port_error());
    case HeaderError::Kind::destination:
        return "Invalid destination port: " + to_string(error.port_error());
    case HeaderError::Kind::length:
        return "Invalid length: " + to_string(error.length_error());
    case HeaderError::Kind::checksum:
        return "Invalid checksum: " + to_string(error.checksum_error());
    }
    return "Unknown header error";
}

} // namespace cudp
