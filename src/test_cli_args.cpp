// test_cli_args.cpp
// Validates prime_check's argument handling.

#include <iostream>
#include <string>
#include <vector>
#include <cstdint>
#include "cli_args.hpp"

using namespace eratos;

// Returns true if parse_limit rejects `text` with UsageError.
static bool rejects(const std::string& text) {
    try {
        uint64_t n = parse_limit(text);
        std::cout << "  '" << text << "' accepted as " << n << "\n";
        return false;
    } catch (const UsageError&) {
        return true;
    }
}

int main() {
    bool all_passed = true;

    // -------------------------------------------------------
    // Test 1: Valid limits
    // -------------------------------------------------------
    {
        struct TestCase { std::string text; uint64_t expected; };
        TestCase cases[] = {
            {"0",                     0},
            {"1",                     1},
            {"97",                    97},
            {"007",                   7},
            {"+5",                    5},
            {"+0",                    0},
            {"4294967296",            4'294'967'296ULL},
            {"18446744073709551614",  18'446'744'073'709'551'614ULL},
        };

        for (auto& [text, expected] : cases) {
            uint64_t got = 0;
            bool pass = false;
            try {
                got = parse_limit(text);
                pass = (got == expected);
            } catch (const UsageError& e) {
                std::cout << "  " << e.what() << "\n";
            }
            std::cout << "parse_limit(\"" << text << "\") = " << got
                      << (pass ? "  PASS" : "  FAIL") << "\n";
            all_passed &= pass;
        }
    }

    // -------------------------------------------------------
    // Test 2: Rejected input
    // -------------------------------------------------------
    {
        std::vector<std::string> bad = {
            "", "abc", "12abc", "1.5", " 12", "12 ", "1 2", "+", "++5", "+-5", "-", "0x10",
            "-1", "-0", "-00", "-0x", "18446744073709551615", "18446744073709551616",
            "100000000000000000000000000000000000000000000000000",
        };
        bool pass = true;
        for (auto& text : bad) pass &= rejects(text);
        std::cout << "Test 2 (rejects bad N): " << (pass ? "PASS" : "FAIL") << "\n";
        all_passed &= pass;
    }

    // -------------------------------------------------------
    // Test 3: Argument count
    // -------------------------------------------------------
    {
        char prog[] = "prime_check";
        char arg1[] = "13";
        char arg2[] = "17";

        char* none[] = {prog, nullptr};
        char* one[]  = {prog, arg1, nullptr};
        char* two[]  = {prog, arg1, arg2, nullptr};

        bool pass = parse_args(2, one) == 13;
        try {
            parse_args(1, none);
            pass = false;
        } catch (const UsageError& e) {
            pass &= std::string(e.what()) == "Too few args passed!";
        }
        try {
            parse_args(3, two);
            pass = false;
        } catch (const UsageError& e) {
            pass &= std::string(e.what()) == "Too many args passed!";
        }
        std::cout << "Test 3 (argument count): " << (pass ? "PASS" : "FAIL") << "\n";
        all_passed &= pass;
    }

    std::cout << "\n" << (all_passed ? "All tests passed." : "SOME TESTS FAILED.") << "\n";
    return all_passed ? 0 : 1;
}
