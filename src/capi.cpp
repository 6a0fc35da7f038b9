/**
 * C API wrapper for cudp (C++ backend).
 *
 * Exposes a stable C ABI for:
 * - Checksum compute / verify over three separate spans
 * - Header and datagram parsing (zero-copy payload view)
 * - Datagram serialization with optional checksum
 *
 * This layer is meant for consumption by C projects or foreign
 * language bindings (e.g., Rust, Go, Python FFI).
 */

#include "cudp_capi.h"
#include "cudp/udp.hpp"

#include <algorithm>
#include <vector>

using namespace cudp;

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------
static void to_out(const Header& in, CUdpHeaderC* out) {
    if (!out) return;
    out->source_port      = in.source().raw_value();
    out->destination_port = in.destination().raw_value();
    out->length           = in.length().raw_value();
    out->checksum         = in.checksum().raw_value();
}

static int status_of(const HeaderError& e) {
    switch (e.kind()) {
    case HeaderError::Kind::insufficient_bytes:
        return CUDP_ERR_HEADER_TRUNCATED;
    case HeaderError::Kind::length:
        return CUDP_ERR_HEADER_LENGTH;
    case HeaderError::Kind::source:
    case HeaderError::Kind::destination:
    case HeaderError::Kind::checksum:
        return CUDP_ERR_HEADER_FIELD;
    }
    return CUDP_ERR_HEADER_FIELD;
}

static int status_of(const DatagramError& e) {
    switch (e.kind()) {
    case DatagramError::Kind::data_too_large:
        return CUDP_ERR_DATA_TOO_LARGE;
    case DatagramError::Kind::length:
        return CUDP_ERR_HEADER_LENGTH;
    case DatagramError::Kind::header:
        return status_of(e.header_error());
    case DatagramError::Kind::insufficient_data:
        return CUDP_ERR_DATA_TRUNCATED;
    }
    return CUDP_ERR_ARGUMENT;
}


// ---------------------------------------------------------------------------
// C API implementation
// ---------------------------------------------------------------------------
extern "C" {

CUDP_CAPI uint16_t cudp_checksum_compute(const uint8_t* pseudo, size_t pseudo_len,
                                         const uint8_t* header, size_t header_len,
                                         const uint8_t* data, size_t data_len)
{
    return Checksum::compute(pseudo, pseudo_len,
                             header, header_len,
                             data, data_len).raw_value();
}

CUDP_CAPI int cudp_checksum_verify(const uint8_t* pseudo, size_t pseudo_len,
                                   const uint8_t* header, size_t header_len,
                                   const uint8_t* data, size_t data_len)
{
    return Checksum::verify(pseudo, pseudo_len,
                            header, header_len,
                            data, data_len) ? 1 : 0;
}

CUDP_CAPI int cudp_header_parse(const uint8_t* bytes, size_t len,
                                struct CUdpHeaderC* out)
{
    if (!bytes || !out) return CUDP_ERR_ARGUMENT;

    auto res = Header::parse(bytes, len);
    if (!res) return status_of(res.error());

    to_out(res.value(), out);
    return CUDP_OK;
}

// ---------------------------------------------------------------------------
// Datagram parse: header is validated by the C++ codec, the payload is
// returned as a view into the caller's buffer instead of a copy.
// ---------------------------------------------------------------------------
CUDP_CAPI int cudp_datagram_parse(const uint8_t* bytes, size_t len,
                                  struct CUdpDatagramC* out)
{
    if (!bytes || !out) return CUDP_ERR_ARGUMENT;

    auto header = Header::parse(bytes, len);
    if (!header) return status_of(header.error());

    const size_t expected = header->length().data();
    if (len - header_size < expected) return CUDP_ERR_DATA_TRUNCATED;

    to_out(header.value(), &out->header);
    out->data     = bytes + header_size;
    out->data_len = expected;
    return CUDP_OK;
}

CUDP_CAPI int cudp_datagram_build(uint16_t source_port,
                                  uint16_t destination_port,
                                  const uint8_t* data, size_t data_len,
                                  uint32_t source_addr,
                                  uint32_t destination_addr,
                                  int with_checksum,
                                  uint8_t* out, size_t out_cap,
                                  size_t* out_len)
{
    if (!out || !out_len) return CUDP_ERR_ARGUMENT;
    if (!data && data_len > 0) return CUDP_ERR_ARGUMENT;

    std::vector<uint8_t> payload;
    if (data) payload.assign(data, data + data_len);

    auto res = Datagram::create(Port(source_port), Port(destination_port), std::move(payload));
    if (!res) return status_of(res.error());

    Datagram datagram = std::move(res).value();
    if (with_checksum) {
        const auto pseudo = datagram.pseudo_header(Ipv4Address::from_host_order(source_addr),
                                                   Ipv4Address::from_host_order(destination_addr));
        datagram = datagram.with_checksum(pseudo);
    }

    const std::vector<uint8_t> wire = datagram.serialize();
    if (wire.size() > out_cap) return CUDP_ERR_BUFFER_TOO_SMALL;

    std::copy(wire.begin(), wire.end(), out);
    *out_len = wire.size();
    return CUDP_OK;
}

CUDP_CAPI const char* cudp_strerror(int status) {
    switch (status) {
    case CUDP_OK:                   return "Success";
    case CUDP_ERR_ARGUMENT:         return "Invalid argument";
    case CUDP_ERR_HEADER_TRUNCATED: return "Header requires 8 bytes";
    case CUDP_ERR_HEADER_LENGTH:    return "Length is less than minimum 8";
    case CUDP_ERR_HEADER_FIELD:     return "Invalid header field";
    case CUDP_ERR_DATA_TRUNCATED:   return "Insufficient data";
    case CUDP_ERR_DATA_TOO_LARGE:   return "Data too large";
    case CUDP_ERR_BUFFER_TOO_SMALL: return "Output buffer too small";
    default:                        return "Unknown error";
    }
}

} // extern "C"
