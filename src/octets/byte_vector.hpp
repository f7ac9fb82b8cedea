#pragma once

#include <cstdint>
#include <initializer_list>
#include <vector>

namespace octets {

// Unsigned (0..255) and signed (-128..127) views of the same octets.
using UByteVector = std::vector<uint8_t>;
using SByteVector = std::vector<int8_t>;

constexpr int kDefaultPadCount = 8;

// Big-endian bytes of `value`, left-padded with zeros to exactly
// `pad_count` bytes.
// - pad_count < 0 throws std::invalid_argument
// - pad_count smaller than the minimal encoding throws std::length_error
// Negative values always need all 8 bytes.
UByteVector long_to_octets(int64_t value, int pad_count = kDefaultPadCount);

// Minimal number of bytes needed to hold `value` (0 for zero).
int minimal_octets(int64_t value);

// Reassemble a big-endian byte sequence (last byte least significant).
// Leading bytes beyond the low eight must be zero, otherwise
// std::overflow_error.
int64_t bytes_to_value(const UByteVector& bytes);
int64_t bytes_to_value(const SByteVector& bytes);

// Byte vector of an integer
UByteVector ubvec(int64_t value, int pad_count = kDefaultPadCount);
SByteVector sbvec(int64_t value, int pad_count = kDefaultPadCount);

// Byte vector of a collection; each element narrowed on its own
UByteVector ubvec(const std::vector<int64_t>& values);
SByteVector sbvec(const std::vector<int64_t>& values);

UByteVector ubvector(std::initializer_list<int64_t> values);
SByteVector sbvector(std::initializer_list<int64_t> values);

// `length` copies of `initial`, narrowed. length <= 0 gives an empty vector.
UByteVector make_ubvector(int length, int64_t initial);
SByteVector make_sbvector(int length, int64_t initial);

// Switch views without changing the bit patterns
SByteVector to_signed(const UByteVector& bytes);
UByteVector to_unsigned(const SByteVector& bytes);

} // namespace octets
