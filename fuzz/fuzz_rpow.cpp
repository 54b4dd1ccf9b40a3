/**
 * @file  fuzz_rpow.cpp
 * @brief libFuzzer target for FixedPoint::rpow and FixedPoint::mul_div
 *
 * Build:
 *   cmake -DDEMURRAGE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_rpow
 *
 * Run for 60 seconds:
 *   ./fuzz_rpow -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort; overflow is reported as nullopt.
 *   2. scale == 0 always yields nullopt.
 *   3. exponent == 0 yields scale; exponent == 1 yields base.
 *   4. base <= scale implies rpow <= scale.
 *   5. mul_div(a, b, d) == a·b/d computed in 512 bits whenever it fits.
 *
 * Fuzzer strategy:
 *   The first 8 bytes are the exponent. The remainder is split into three
 *   little-endian integers of up to 32 bytes each: base, scale, multiplier.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>

#include "demurrage/fixed_point.hpp"

using namespace demurrage;
using demurrage::fixed_point::FixedPoint;

namespace {

Amount read_amount(const uint8_t* data, size_t size) {
    Amount value = 0;
    for (size_t i = size; i > 0; --i) {
        value <<= 8;
        value |= data[i - 1];
    }
    return value;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < sizeof(uint64_t)) return 0;

    uint64_t exponent{};
    std::memcpy(&exponent, data, sizeof(exponent));
    data += sizeof(exponent);
    size -= sizeof(exponent);

    const size_t chunk = size / 3 > 32 ? 32 : size / 3;
    const Amount base       = read_amount(data, chunk);
    const Amount scale      = read_amount(data + chunk, chunk);
    const Amount multiplier = read_amount(data + 2 * chunk, chunk);

    const auto result = FixedPoint::rpow(base, exponent, scale);

    // Invariant 2
    if (scale == 0) {
        assert(!result.has_value());
        return 0;
    }

    if (result.has_value()) {
        // Invariant 3
        if (exponent == 0) assert(*result == scale);
        if (exponent == 1) assert(*result == base);

        // Invariant 4
        if (base <= scale) assert(*result <= scale);
    }

    // Invariant 5
    const auto product = FixedPoint::mul_div(base, multiplier, scale);
    const WideAmount wide = WideAmount{base} * WideAmount{multiplier} / WideAmount{scale};
    if (product.has_value()) {
        assert(WideAmount{*product} == wide);
    } else {
        assert((wide >> 256) != 0);
    }

    return 0;
}
