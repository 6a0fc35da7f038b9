#include "cudp/pseudo_header.hpp"
#include "byte_order.hpp"

#include <algorithm>

namespace cudp {

std::array<uint8_t, pseudo_header_size> PseudoHeader::serialize() const {
    std::array<uint8_t, pseudo_header_size> out{};

    const auto src = source_.serialize();
    const auto dst = destination_.serialize();
    std::copy(src.begin(), src.end(), out.begin());
    std::copy(dst.begin(), dst.end(), out.begin() + 4);

    out[8]  = 0;
    out[9]  = protocol_number;
    out[10] = detail::high_octet(length_);
    out[11] = detail::low_octet(length_);
    return out;
}

void PseudoHeader::serialize_into(std::vector<uint8_t>& out) const {
    const auto bytes = serialize();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace cudp
