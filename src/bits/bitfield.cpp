#include "bits/bitfield.hpp"

namespace bits {

uint64_t ldb(Mask m, Word word) {
    const int off = mask_offset(m);
    return (m >> off) & (static_cast<uint64_t>(word) >> off);
}

Word dpb(Mask m, Word word, int64_t value) {
    const int off = mask_offset(m);
    const uint64_t w = static_cast<uint64_t>(word);
    const uint64_t v = static_cast<uint64_t>(value) << off;
    return static_cast<Word>((w & ~m) | (m & v));
}

int bit_count(int64_t x) {
    // low 63 bits, then the sign bit
    uint64_t n = ldb(mask(63, 0), x);
    int c = (x < 0) ? 1 : 0;
    while (n != 0) {
        c += static_cast<int>(n & 0x1ULL);
        n >>= 1;
    }
    return c;
}

} // namespace bits
