#pragma once

#include <cstdint>

namespace bits {

// Unsigned narrowing: keep the low W bits of `num`.
// Results are held in explicitly unsigned types so a set top bit
// never reads back as negative.
uint8_t ub4(int64_t num);
uint8_t ub8(int64_t num);
uint16_t ub16(int64_t num);
uint32_t ub24(int64_t num);
uint32_t ub32(int64_t num);
uint64_t ub48(int64_t num);
uint64_t ub56(int64_t num);
uint64_t ub64(int64_t num);

// Signed reinterpretation of the low W bits (two's complement).
// sb8(0xFF) == -1, sb8(0x7F) == 127.
int8_t sb8(int64_t num);
int16_t sb16(int64_t num);
int32_t sb32(int64_t num);
int64_t sb64(int64_t num);

} // namespace bits
