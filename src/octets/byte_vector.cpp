#include "octets/byte_vector.hpp"

#include <stdexcept>
#include <string>

#include "bits/bitfield.hpp"
#include "bits/byte_cast.hpp"
#include "utils/logging.hpp"

namespace octets {

namespace {

constexpr int kWordOctets = 8;

// byte i covers bits [8i, 8i+8)
uint8_t octet_at(int64_t value, int i) {
    return static_cast<uint8_t>(bits::ldb(bits::mask(8, i * 8), value));
}

} // namespace

int minimal_octets(int64_t value) {
    int n = kWordOctets;
    while (n > 0 && octet_at(value, n - 1) == 0)
        --n;
    return n;
}

UByteVector long_to_octets(int64_t value, int pad_count) {
    if (pad_count < 0) {
        LOG_DEBUG("[octets] negative pad_count %d", pad_count);
        throw std::invalid_argument("long_to_octets: pad_count must be >= 0 (got " +
                                    std::to_string(pad_count) + ")");
    }

    const int used = minimal_octets(value);
    if (pad_count < used) {
        LOG_DEBUG("[octets] pad_count %d truncates a %d byte value", pad_count, used);
        throw std::length_error("long_to_octets: pad_count " + std::to_string(pad_count) +
                                " is smaller than the " + std::to_string(used) +
                                " bytes needed for " + std::to_string(value));
    }

    UByteVector out(static_cast<size_t>(pad_count - used), 0);
    out.reserve(static_cast<size_t>(pad_count));
    for (int i = used - 1; i >= 0; --i)
        out.push_back(octet_at(value, i));
    return out;
}

int64_t bytes_to_value(const UByteVector& bytes) {
    int64_t tot = 0;
    const size_t n = bytes.size();
    for (size_t k = 0; k < n; ++k) {
        // k counts from the least significant (last) byte
        const uint8_t b = bytes[n - 1 - k];
        if (k >= static_cast<size_t>(kWordOctets)) {
            if (b != 0) {
                LOG_DEBUG("[octets] %zu byte sequence overflows 64 bits", n);
                throw std::overflow_error("bytes_to_value: " + std::to_string(n) +
                                          " byte sequence does not fit in 64 bits");
            }
            continue;
        }
        tot = bits::dpb(bits::mask(8, static_cast<int>(k) * 8), tot, b);
    }
    return tot;
}

int64_t bytes_to_value(const SByteVector& bytes) {
    return bytes_to_value(to_unsigned(bytes));
}

UByteVector ubvec(int64_t value, int pad_count) {
    return long_to_octets(value, pad_count);
}

SByteVector sbvec(int64_t value, int pad_count) {
    return to_signed(long_to_octets(value, pad_count));
}

UByteVector ubvec(const std::vector<int64_t>& values) {
    UByteVector out;
    out.reserve(values.size());
    for (int64_t v : values)
        out.push_back(bits::ub8(v));
    return out;
}

SByteVector sbvec(const std::vector<int64_t>& values) {
    SByteVector out;
    out.reserve(values.size());
    for (int64_t v : values)
        out.push_back(bits::sb8(v));
    return out;
}

UByteVector ubvector(std::initializer_list<int64_t> values) {
    return ubvec(std::vector<int64_t>(values));
}

SByteVector sbvector(std::initializer_list<int64_t> values) {
    return sbvec(std::vector<int64_t>(values));
}

UByteVector make_ubvector(int length, int64_t initial) {
    if (length <= 0)
        return {};
    return UByteVector(static_cast<size_t>(length), bits::ub8(initial));
}

SByteVector make_sbvector(int length, int64_t initial) {
    if (length <= 0)
        return {};
    return SByteVector(static_cast<size_t>(length), bits::sb8(initial));
}

SByteVector to_signed(const UByteVector& bytes) {
    SByteVector out;
    out.reserve(bytes.size());
    for (uint8_t b : bytes)
        out.push_back(bits::sb8(b));
    return out;
}

UByteVector to_unsigned(const SByteVector& bytes) {
    UByteVector out;
    out.reserve(bytes.size());
    for (int8_t b : bytes)
        out.push_back(bits::ub8(b));
    return out;
}

} // namespace octets
