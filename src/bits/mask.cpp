#include "bits/mask.hpp"

#include <stdexcept>
#include <string>

#include "utils/logging.hpp"

namespace bits {

static inline void require(bool ok, const char* what, int value) {
    if (ok) return;
    LOG_DEBUG("[bits] contract violation: %s (got %d)", what, value);
    throw std::invalid_argument(std::string(what) + " (got " + std::to_string(value) + ")");
}

Mask mask(int width, int offset) {
    require(width >= 0 && width <= kWordBits, "mask: width must be in [0, 64]", width);
    require(offset >= 0 && offset < kWordBits, "mask: offset must be in [0, 64)", offset);

    if (width == 0)
        return 0;

    // Clip the run at bit 63
    if (width + offset >= kWordBits)
        return ~0ULL << offset;

    return ((1ULL << width) - 1ULL) << offset;
}

int mask_offset(Mask m) {
    if (m == 0)
        return 0;

    int c = 0;
    while (((m >> c) & 0x1ULL) == 0)
        ++c;
    return c;
}

int mask_width(Mask m) {
    const Mask run = m >> mask_offset(m);

    int c = 0;
    while (c < kWordBits && ((run >> c) & 0x1ULL) != 0)
        ++c;
    return c;
}

bool is_contiguous(Mask m) {
    return mask(mask_width(m), mask_offset(m)) == m;
}

int64_t expt(int64_t num, int pow) {
    require(pow >= 0, "expt: pow must be non-negative", pow);

    // Unsigned accumulator: wraps instead of overflowing
    uint64_t acc = 1;
    for (int p = pow; p > 0; --p)
        acc *= static_cast<uint64_t>(num);
    return static_cast<int64_t>(acc);
}

uint64_t expt2(int pow) {
    require(pow >= 0 && pow < kWordBits, "expt2: pow must be in [0, 64)", pow);
    return 1ULL << pow;
}

} // namespace bits
