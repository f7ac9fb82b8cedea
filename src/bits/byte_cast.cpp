#include "bits/byte_cast.hpp"

namespace bits {

static constexpr uint64_t kUb4Mask = 0xFULL;
static constexpr uint64_t kUb8Mask = 0xFFULL;
static constexpr uint64_t kUb16Mask = 0xFFFFULL;
static constexpr uint64_t kUb24Mask = 0xFFFFFFULL;
static constexpr uint64_t kUb32Mask = 0xFFFFFFFFULL;
static constexpr uint64_t kUb48Mask = 0xFFFFFFFFFFFFULL;
static constexpr uint64_t kUb56Mask = 0xFFFFFFFFFFFFFFULL;

static inline uint64_t low_bits(int64_t num, uint64_t m) {
    return static_cast<uint64_t>(num) & m;
}

uint8_t ub4(int64_t num) { return static_cast<uint8_t>(low_bits(num, kUb4Mask)); }
uint8_t ub8(int64_t num) { return static_cast<uint8_t>(low_bits(num, kUb8Mask)); }
uint16_t ub16(int64_t num) { return static_cast<uint16_t>(low_bits(num, kUb16Mask)); }
uint32_t ub24(int64_t num) { return static_cast<uint32_t>(low_bits(num, kUb24Mask)); }
uint32_t ub32(int64_t num) { return static_cast<uint32_t>(low_bits(num, kUb32Mask)); }
uint64_t ub48(int64_t num) { return low_bits(num, kUb48Mask); }
uint64_t ub56(int64_t num) { return low_bits(num, kUb56Mask); }
uint64_t ub64(int64_t num) { return static_cast<uint64_t>(num); }

int8_t sb8(int64_t num) { return static_cast<int8_t>(ub8(num)); }
int16_t sb16(int64_t num) { return static_cast<int16_t>(ub16(num)); }
int32_t sb32(int64_t num) { return static_cast<int32_t>(ub32(num)); }
int64_t sb64(int64_t num) { return num; }

} // namespace bits
