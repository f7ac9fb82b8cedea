#include "hex/hex_codec.hpp"

#include <stdexcept>

#include "bits/bitfield.hpp"
#include "utils/logging.hpp"

namespace hex {

namespace {

constexpr char kLowerDigits[] = "0123456789abcdef";
constexpr char kUpperDigits[] = "0123456789ABCDEF";

// 64 bits / 4 bits per digit
constexpr size_t kMaxSignificantDigits = 16;

} // namespace

const char* HexCodec::digits(HexCase hc) {
    return (hc == HexCase::Upper) ? kUpperDigits : kLowerDigits;
}

int HexCodec::nibble_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void HexCodec::reject(const std::string& hex, const std::string& why) {
    LOG_DEBUG("[hex] rejecting \"%s\": %s", hex.c_str(), why.c_str());
    throw std::invalid_argument("Malformed hex string \"" + hex + "\": " + why);
}

std::string HexCodec::octet_hex(uint8_t octet, HexCase hc) {
    const char* d = digits(hc);
    std::string out(2, '0');
    out[0] = d[octet >> 4];
    out[1] = d[octet & 0x0F];
    return out;
}

std::string HexCodec::to_hex(int64_t value, HexCase hc) {
    return to_hex(octets::ubvec(value), hc);
}

std::string HexCodec::to_hex_padded(int64_t value, int pad_count, HexCase hc) {
    return to_hex(octets::long_to_octets(value, pad_count), hc);
}

std::string HexCodec::to_hex(const octets::UByteVector& bytes, HexCase hc) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes)
        out += octet_hex(b, hc);
    return out;
}

std::string HexCodec::to_hex(const octets::SByteVector& bytes, HexCase hc) {
    return to_hex(octets::to_unsigned(bytes), hc);
}

std::string HexCodec::hex_of_text(const std::string& text, HexCase hc) {
    return to_hex(octets::UByteVector(text.begin(), text.end()), hc);
}

int64_t HexCodec::from_hex(const std::string& hex) {
    if (hex.empty())
        reject(hex, "empty input");

    uint64_t acc = 0;
    size_t significant = 0;
    for (size_t i = 0; i < hex.size(); ++i) {
        const int v = nibble_value(hex[i]);
        if (v < 0)
            reject(hex, "invalid character at position " + std::to_string(i));

        if (significant == 0 && v == 0)
            continue;
        if (++significant > kMaxSignificantDigits) {
            LOG_DEBUG("[hex] \"%s\" is wider than 64 bits", hex.c_str());
            throw std::overflow_error("Hex string \"" + hex + "\" does not fit in 64 bits");
        }
        acc = (acc << 4) | static_cast<uint64_t>(v);
    }
    return static_cast<int64_t>(acc);
}

octets::UByteVector HexCodec::hex_to_bytes(const std::string& hex) {
    if (hex.size() % 2 != 0)
        reject(hex, "odd number of digits");

    octets::UByteVector out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = nibble_value(hex[i]);
        const int lo = nibble_value(hex[i + 1]);
        if (hi < 0)
            reject(hex, "invalid character at position " + std::to_string(i));
        if (lo < 0)
            reject(hex, "invalid character at position " + std::to_string(i + 1));
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string HexCodec::text_of_hex(const std::string& hex) {
    const octets::UByteVector bytes = hex_to_bytes(hex);
    return std::string(bytes.begin(), bytes.end());
}

std::string HexCodec::pphex(int64_t value) {
    std::string out = "[" + to_hex(value, HexCase::Upper) + "] [";
    for (int i = bits::kWordBits - 1; i >= 0; --i)
        out.push_back(bits::ldb(bits::mask(1, i), value) ? '1' : '0');
    out.push_back(']');
    return out;
}

} // namespace hex
