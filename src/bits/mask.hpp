#pragma once

#include <cstdint>

namespace bits {

// A mask is a contiguous run of set bits inside a 64-bit word,
// addressed by (width, offset). Bit 0 is the LSB.
//
// Masks are unsigned throughout; a run that would extend past bit 63
// is clipped there, so mask(8, 60) covers bits 60..63 only.
using Mask = uint64_t;

// Words are signed 64-bit values (UUID halves are carried as int64_t).
using Word = int64_t;

constexpr int kWordBits = 64;

// Build a mask of `width` ones starting at bit `offset`.
// Requires 0 <= width <= 64 and 0 <= offset < 64, throws
// std::invalid_argument otherwise.
Mask mask(int width, int offset);

// Index of the lowest set bit, 0 for an empty mask.
int mask_offset(Mask m);

// Length of the run of ones starting at mask_offset(m).
int mask_width(Mask m);

// True when `m` is a single run of ones (or empty), i.e.
// mask(mask_width(m), mask_offset(m)) == m.
bool is_contiguous(Mask m);

// num^pow by repeated multiplication (wraps on overflow). pow >= 0.
int64_t expt(int64_t num, int pow);

// 2^pow for 0 <= pow < 64.
uint64_t expt2(int pow);

} // namespace bits
