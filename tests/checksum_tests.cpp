#include "cudp/udp.hpp"
#include "harness.hpp"

#include <array>
#include <string>

using namespace cudp;
namespace engine = cudp::checksum_engine;

bool test_sum_words_big_endian() {
    const Bytes b{0x12, 0x34, 0x56, 0x78};
    uint32_t sum = engine::sum_words(0, b.data(), b.size());
    if (sum != 0x1234 + 0x5678) return fail("expected 0x68AC, got " + std::to_string(sum));
    return true;
}

bool test_sum_words_odd_length_pads_low_octet() {
    const Bytes b{0xAB};
    if (engine::sum_words(0, b.data(), b.size()) != 0xAB00) return fail("odd octet must be the high byte");

    const Bytes c{0x01, 0x02, 0x03};
    if (engine::sum_words(0, c.data(), c.size()) != 0x0102 + 0x0300) return fail("3-byte span");
    return true;
}

bool test_spans_padded_independently() {
    // 0x01 | 0x02 as two spans is 0x0100 + 0x0200, never the word 0x0102
    const Bytes a{0x01};
    const Bytes b{0x02};
    uint32_t sum = engine::sum_words(0, a.data(), a.size());
    sum = engine::sum_words(sum, b.data(), b.size());
    if (sum != 0x0300) return fail("carried odd byte across span boundary");

    const Checksum split = Checksum::compute(a, b, Bytes{});
    const Checksum joined = Checksum::compute(Bytes{0x01, 0x02}, Bytes{}, Bytes{});
    if (split == joined) return fail("split and joined spans must differ");
    return true;
}

bool test_null_span_contributes_nothing() {
    if (engine::sum_words(0x1234, nullptr, 10) != 0x1234) return fail("null span changed the sum");
    return true;
}

bool test_fold_loops_until_no_carry() {
    // 0x1FFFF -> 0xFFFF + 0x1 = 0x10000 -> 0x0000 + 0x1 = 0x1
    if (engine::fold(0x1FFFF) != 0x0001) return fail("second carry was dropped");
    if (engine::fold(0xFFFF) != 0xFFFF) return fail("fold changed a 16-bit value");
    if (engine::fold(0x2FFFD) != 0xFFFF) return fail("0x2FFFD must fold to 0xFFFF");
    if (engine::fold(0) != 0) return fail("fold(0)");
    return true;
}

bool test_compute_double_overflow() {
    // 0xFFFF + 0xFFFF + 0x0001 = 0x1FFFF, which needs two folding passes
    const Bytes pseudo{0xFF, 0xFF};
    const Bytes header{0xFF, 0xFF};
    const Bytes data{0x00, 0x01};
    const Checksum c = Checksum::compute(pseudo, header, data);
    if (c.raw_value() != 0xFFFE) return fail("expected 0xFFFE, got " + to_string(c));
    return true;
}

bool test_rfc1071_example() {
    const Bytes b{0x00, 0x01, 0xF2, 0x03, 0xF4, 0xF5, 0xF6, 0xF7};
    if (engine::fold(engine::sum_words(0, b.data(), b.size())) != 0xDDF2) return fail("folded sum");

    const Checksum c = Checksum::compute(b, Bytes{}, Bytes{});
    if (c.raw_value() != 0x220D) return fail("expected 0x220D, got " + to_string(c));
    return true;
}

bool test_zero_result_maps_to_all_ones() {
    // 0x1234 + 0xEDCB = 0xFFFF, complement is 0
    const Checksum c = Checksum::compute(Bytes{0x12, 0x34}, Bytes{0xED, 0xCB}, Bytes{});
    if (c.raw_value() != 0xFFFF) return fail("zero result must be sent as 0xFFFF");
    if (c.is_absent()) return fail("computed checksum reported absent");

    if (engine::finalize(0xFFFF) != 0xFFFF) return fail("finalize(0xFFFF)");
    if (engine::finalize(0x1FFFE) != 0xFFFF) return fail("finalize(0x1FFFE)");
    return true;
}

bool test_all_zero_input() {
    const Checksum c = Checksum::compute(Bytes(12, 0), Bytes(8, 0), Bytes{});
    if (c.raw_value() != 0xFFFF) return fail("sum 0 complements to 0xFFFF");
    return true;
}

bool test_compute_is_pure() {
    const Bytes pseudo{192, 168, 0, 1, 192, 168, 0, 199, 0, 17, 0, 12};
    const Bytes header{0x1F, 0x90, 0x02, 0x02, 0x00, 0x0C, 0x00, 0x00};
    const Bytes data{0xDE, 0xAD, 0xBE, 0xEF};

    const Checksum first = Checksum::compute(pseudo, header, data);
    const Checksum second = Checksum::compute(pseudo, header, data);
    if (first != second) return fail("compute is not repeatable");
    if (first.raw_value() != 0xBE8D) return fail("expected 0xBE8D, got " + to_string(first));
    return true;
}

bool test_verify_accepts_own_checksum() {
    const Bytes pseudo{10, 0, 0, 1, 10, 0, 0, 2, 0, 17, 0, 11};
    Bytes header{0x30, 0x39, 0x00, 0x35, 0x00, 0x0B, 0x00, 0x00};
    const Bytes data{'a', 'b', 'c'};

    const Checksum c = Checksum::compute(pseudo, header, data);
    if (c.raw_value() != 0xF704) return fail("expected 0xF704, got " + to_string(c));

    header[6] = static_cast<uint8_t>(c.raw_value() >> 8);
    header[7] = static_cast<uint8_t>(c.raw_value() & 0xFF);
    if (!Checksum::verify(pseudo, header, data)) return fail("verify rejected computed checksum");

    header[7] ^= 0x01;
    if (Checksum::verify(pseudo, header, data)) return fail("verify accepted corrupted checksum");
    return true;
}

bool test_mixed_container_types() {
    const std::array<uint8_t, 4> pseudo{{0x01, 0x02, 0x03, 0x04}};
    const Bytes header{0x05, 0x06};
    const std::string data("\x07\x08\x09", 3);

    const Checksum a = Checksum::compute(pseudo, header, data);
    const Bytes d(data.begin(), data.end());
    const Checksum b = Checksum::compute(pseudo.data(), pseudo.size(),
                                         header.data(), header.size(),
                                         d.data(), d.size());
    if (a != b) return fail("container and pointer forms disagree");
    return true;
}

bool test_long_span_does_not_wrap() {
    // 100000 words of 0xFFFF overflow a plain 32-bit accumulator
    const Bytes big(200000, 0xFF);
    const uint32_t sum = engine::sum_words(0, big.data(), big.size());
    if (engine::fold(sum) != 0xFFFF) return fail("long span lost carries");
    return true;
}

int main() {
    std::cout << "Running checksum engine tests...\n";

    run_test("sum_words big-endian pairing", test_sum_words_big_endian);
    run_test("sum_words odd length", test_sum_words_odd_length_pads_low_octet);
    run_test("Per-span padding", test_spans_padded_independently);
    run_test("Null span", test_null_span_contributes_nothing);
    run_test("Fold loops", test_fold_loops_until_no_carry);
    run_test("Compute double overflow", test_compute_double_overflow);
    run_test("RFC 1071 example", test_rfc1071_example);
    run_test("Zero maps to all ones", test_zero_result_maps_to_all_ones);
    run_test("All-zero input", test_all_zero_input);
    run_test("Compute is pure", test_compute_is_pure);
    run_test("Verify own checksum", test_verify_accepts_own_checksum);
    run_test("Mixed container types", test_mixed_container_types);
    run_test("Long span", test_long_span_does_not_wrap);

    return finish("Checksum tests");
}
