// test/test_mask.cpp
/**
 * Unit Test: Mask Algebra
 *
 * Tests construction and introspection of 64-bit field masks.
 *
 * Test Coverage:
 *   1. Known mask values (byte masks, full word, sign bit)
 *   2. Runs clipped at bit 63
 *   3. Offset/width round-trip over every (width, offset)
 *   4. Contract violations
 *   5. Integer powers
 *   6. Contiguous run detection
 */

#include "bits/mask.hpp"
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void check(bool ok, const std::string& msg) {
        if (ok) pass(msg); else fail(msg);
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

template <typename Fn>
bool throws_invalid_argument(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

// Test 1: Known values
void test_known_masks(TestResult& result) {
    std::cout << "\n=== Test 1: Known Mask Values ===\n";

    result.check(bits::mask(8, 0) == 0xFFULL, "mask(8, 0) == 0xFF");
    result.check(bits::mask(8, 8) == 0xFF00ULL, "mask(8, 8) == 0xFF00");
    result.check(bits::mask(4, 12) == 0xF000ULL, "mask(4, 12) == 0xF000");
    result.check(bits::mask(0, 0) == 0, "mask(0, 0) is empty");
    result.check(bits::mask(0, 17) == 0, "mask(0, 17) is empty");
    result.check(bits::mask(63, 0) == 0x7FFFFFFFFFFFFFFFULL, "mask(63, 0) covers all but the sign bit");
    result.check(bits::mask(64, 0) == ~0ULL, "mask(64, 0) is the full word");
    result.check(bits::mask(1, 63) == 0x8000000000000000ULL, "mask(1, 63) is the sign bit");
    result.check(bits::mask(48, 16) == 0xFFFFFFFFFFFF0000ULL, "mask(48, 16) reaches bit 63");
}

// Test 2: Runs longer than the word are clipped at bit 63
void test_clipped_masks(TestResult& result) {
    std::cout << "\n=== Test 2: Clipped Masks ===\n";

    const bits::Mask m = bits::mask(8, 60);
    result.check(m == 0xF000000000000000ULL, "mask(8, 60) keeps bits 60..63");
    result.check(bits::mask_offset(m) == 60, "mask_offset(mask(8, 60)) == 60");
    result.check(bits::mask_width(m) == 4, "mask_width(mask(8, 60)) == 4");

    result.check(bits::mask(64, 32) == 0xFFFFFFFF00000000ULL, "mask(64, 32) keeps the high half");
}

// Test 3: Round-trip law
void test_round_trip(TestResult& result) {
    std::cout << "\n=== Test 3: Offset/Width Round-Trip ===\n";

    int bad = 0;
    int checked = 0;
    for (int width = 1; width <= 64; ++width) {
        for (int offset = 0; offset < 64 && width + offset <= 64; ++offset) {
            const bits::Mask m = bits::mask(width, offset);
            ++checked;
            if (bits::mask_offset(m) != offset || bits::mask_width(m) != width) {
                if (bad < 5) {
                    result.fail("Round-trip failed for width=" + std::to_string(width) +
                                " offset=" + std::to_string(offset));
                }
                ++bad;
            }
        }
    }
    result.check(bad == 0, "Round-trip holds for " + std::to_string(checked) + " (width, offset) pairs");

    result.check(bits::mask_offset(0) == 0, "mask_offset(0) == 0");
    result.check(bits::mask_width(0) == 0, "mask_width(0) == 0");
}

// Test 4: Contract violations
void test_contract_violations(TestResult& result) {
    std::cout << "\n=== Test 4: Contract Violations ===\n";

    result.check(throws_invalid_argument([] { bits::mask(65, 0); }), "width 65 rejected");
    result.check(throws_invalid_argument([] { bits::mask(-1, 0); }), "negative width rejected");
    result.check(throws_invalid_argument([] { bits::mask(1, 64); }), "offset 64 rejected");
    result.check(throws_invalid_argument([] { bits::mask(1, -1); }), "negative offset rejected");
}

// Test 5: Powers
void test_powers(TestResult& result) {
    std::cout << "\n=== Test 5: Integer Powers ===\n";

    result.check(bits::expt(2, 10) == 1024, "expt(2, 10) == 1024");
    result.check(bits::expt(7, 0) == 1, "expt(7, 0) == 1");
    result.check(bits::expt(-2, 3) == -8, "expt(-2, 3) == -8");
    result.check(bits::expt(10, 18) == 1000000000000000000LL, "expt(10, 18)");
    result.check(throws_invalid_argument([] { bits::expt(2, -1); }), "expt with negative power rejected");

    result.check(bits::expt2(0) == 1, "expt2(0) == 1");
    result.check(bits::expt2(32) == 0x100000000ULL, "expt2(32) == 2^32");
    result.check(bits::expt2(63) == 0x8000000000000000ULL, "expt2(63) is the sign bit");
    result.check(throws_invalid_argument([] { bits::expt2(64); }), "expt2(64) rejected");
}

// Test 6: Contiguous runs
void test_contiguity(TestResult& result) {
    std::cout << "\n=== Test 6: Contiguous Runs ===\n";

    result.check(bits::is_contiguous(0), "empty mask is contiguous");
    result.check(bits::is_contiguous(0xFF00ULL), "0xFF00 is contiguous");
    result.check(bits::is_contiguous(~0ULL), "full word is contiguous");
    result.check(bits::is_contiguous(0xF000000000000000ULL), "run ending at bit 63 is contiguous");
    result.check(!bits::is_contiguous(0x0F0FULL), "0x0F0F has a gap");
    result.check(!bits::is_contiguous(0x8000000000000001ULL), "sign bit plus bit 0 has a gap");

    int bad = 0;
    for (int width = 1; width <= 64; ++width) {
        for (int offset = 0; offset < 64; ++offset) {
            if (!bits::is_contiguous(bits::mask(width, offset))) ++bad;
        }
    }
    result.check(bad == 0, "every constructed mask is contiguous");
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              Mask Algebra Unit Tests                        ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_known_masks(result);
    test_clipped_masks(result);
    test_round_trip(result);
    test_contract_violations(result);
    test_powers(result);
    test_contiguity(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
