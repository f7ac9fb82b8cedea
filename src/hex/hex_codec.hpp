#pragma once

#include <cstdint>
#include <string>

#include "octets/byte_vector.hpp"

namespace hex {

enum class HexCase {
    Lower, // 0123456789abcdef
    Upper  // 0123456789ABCDEF
};

// Byte <-> hex text. Two digits per byte, high nibble first, no separators.
// Encoders default to lowercase; decoders accept either case.
class HexCodec {
public:
    // "ff" for 255, "00" for 0, "10" for 16
    static std::string octet_hex(uint8_t octet, HexCase hc = HexCase::Lower);

    // Integer -> 8 big-endian bytes -> 16 hex digits
    static std::string to_hex(int64_t value, HexCase hc = HexCase::Lower);

    // Integer with explicit padding (see octets::long_to_octets for the rules)
    static std::string to_hex_padded(int64_t value, int pad_count, HexCase hc = HexCase::Lower);

    // Byte sequence, in order
    static std::string to_hex(const octets::UByteVector& bytes, HexCase hc = HexCase::Lower);
    static std::string to_hex(const octets::SByteVector& bytes, HexCase hc = HexCase::Lower);

    // Raw bytes of a (UTF-8) string
    static std::string hex_of_text(const std::string& text, HexCase hc = HexCase::Lower);

    // Base-16 numeral -> int64_t.
    // - empty or non-hex input throws std::invalid_argument
    // - more than 16 significant digits throws std::overflow_error
    // Sixteen digits with the top bit set wrap into the negative range.
    static int64_t from_hex(const std::string& hex);

    // Pairwise decode; odd length or non-hex input throws std::invalid_argument
    static octets::UByteVector hex_to_bytes(const std::string& hex);

    // Inverse of hex_of_text
    static std::string text_of_hex(const std::string& hex);

    // "[0123456789ABCDEF] [0000...1111]" debug view of a word
    static std::string pphex(int64_t value);

private:
    static const char* digits(HexCase hc);
    static int nibble_value(char c);
    [[noreturn]] static void reject(const std::string& hex, const std::string& why);
};

} // namespace hex
