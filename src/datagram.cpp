/**
 * UDP datagram assembly, parsing and checksum attachment.
 *
 * Checksum handling never concatenates buffers: the pseudo-header,
 * header and payload are handed to the engine as three separate spans.
 */

#include "cudp/datagram.hpp"

namespace cudp {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Result<Datagram, DatagramError> Datagram::create(Port source,
                                                 Port destination,
                                                 std::vector<uint8_t> data,
                                                 Checksum checksum)
{
    const std::size_t total = header_size + data.size();
    if (total > 0xFFFF) {
        return DatagramError::data_too_large(data.size());
    }

    auto length = Length::from_value(static_cast<uint16_t>(total));
    if (!length) {
        return DatagramError::length(length.error());
    }

    return Datagram(Header(source, destination, length.value(), checksum), std::move(data));
}


// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------
Result<Datagram, DatagramError> Datagram::parse(const uint8_t* bytes, std::size_t len) {
    auto header = Header::parse(bytes, len);
    if (!header) {
        return DatagramError::header(header.error());
    }

    const std::size_t expected  = header->length().data();
    const std::size_t available = len - header_size;

    if (available < expected) {
        return DatagramError::insufficient_data(expected, available);
    }

    // Trailing bytes past the declared length are not part of the datagram
    const uint8_t* payload = bytes + header_size;
    return Datagram(header.value(), std::vector<uint8_t>(payload, payload + expected));
}

Result<Datagram, DatagramError> Datagram::parse(const std::vector<uint8_t>& bytes) {
    return parse(bytes.data(), bytes.size());
}


// ---------------------------------------------------------------------------
// Checksum
// ---------------------------------------------------------------------------
Datagram Datagram::with_checksum(const PseudoHeader& pseudo) const {
    const auto zeroed = header_.with_checksum(Checksum::zero()).serialize();
    const auto pseudo_bytes = pseudo.serialize();

    const Checksum checksum = Checksum::compute(pseudo_bytes, zeroed, data_);
    return Datagram(header_.with_checksum(checksum), data_);
}

bool Datagram::verify_checksum(const PseudoHeader& pseudo) const {
    if (header_.checksum().is_absent()) {
        return true;
    }
    return Checksum::verify(pseudo.serialize(), header_.serialize(), data_);
}


// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------
std::vector<uint8_t> Datagram::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(header_size + data_.size());
    serialize_into(out);
    return out;
}

void Datagram::serialize_into(std::vector<uint8_t>& out) const {
    header_.serialize_into(out);
    out.insert(out.end(), data_.begin(), data_.end());
}

std::string to_string(const Datagram& datagram) {
    return to_string(datagram.header()) +
           " payload=" + std::to_string(datagram.data().size());
}

std::string to_string(const DatagramError& error) {
    switch (error.kind()) {
    case DatagramError::Kind::data_too_large:
        return "Data too large: " + std::to_string(error.size()) +
               " bytes exceeds maximum";
    case DatagramError::Kind::length:
        return "Invalid length: " + to_string(error.length_error());
    case DatagramError::Kind::header:
        return "Invalid header: " + to_string(error.header_error());
    case DatagramError::Kind::insufficient_data:
        return "Insufficient data: expected " + std::to_string(error.expected()) +
               " bytes, got " + std::to_string(error.got());
    }
    return "Unknown datagram error";
}

} // namespace cudp
