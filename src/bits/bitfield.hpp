#pragma once

#include <cstdint>

#include "bits/mask.hpp"

namespace bits {

// Load the field selected by `m` from `word`, right-justified to bit 0.
// The result is always the unsigned field value.
uint64_t ldb(Mask m, Word word);

// Deposit `value` into the field selected by `m`.
// Bits outside the mask are returned unchanged; bits of `value`
// wider than the field are dropped.
Word dpb(Mask m, Word word, int64_t value);

// Number of set bits in `x`, sign bit included.
int bit_count(int64_t x);

} // namespace bits
