// cli_args.cpp
// N is parsed through GMP so any digit string is classified exactly:
// garbage, negative, or simply too large for a uint64_t sieve.

#include "cli_args.hpp"
#include <gmp.h>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace eratos {

namespace {

// Owns one mpz_t for the duration of a parse.
struct MpzGuard {
    mpz_t v;
    MpzGuard()  { mpz_init(v); }
    ~MpzGuard() { mpz_clear(v); }
    MpzGuard(const MpzGuard&) = delete;
    MpzGuard& operator=(const MpzGuard&) = delete;
};

} // namespace

uint64_t parse_limit(const std::string& text) {
    // mpz_set_str skips whitespace inside the string; reject it up front.
    // Accepted form: [+]digits. Any leading '-' is rejected, "-0" included.
    if (text.empty())
        throw UsageError("N must not be empty");
    if (text[0] == '-')
        throw UsageError("N must be non-negative, got " + text);

    std::string digits = (text[0] == '+') ? text.substr(1) : text;
    if (digits.empty())
        throw UsageError("N is not an integer: '" + text + "'");
    for (unsigned char c : digits)
        if (!std::isdigit(c))
            throw UsageError("N is not an integer: '" + text + "'");

    MpzGuard n;
    if (mpz_set_str(n.v, digits.c_str(), 10) != 0)
        throw UsageError("N is not an integer: '" + text + "'");

    // Largest usable limit: the table needs limit + 1 entries.
    MpzGuard max_limit;
    mpz_set_ui(max_limit.v, 0);
    mpz_setbit(max_limit.v, 64);
    mpz_sub_ui(max_limit.v, max_limit.v, 2);

    if (mpz_cmp(n.v, max_limit.v) > 0) {
        char* max_str = mpz_get_str(nullptr, 10, max_limit.v);
        std::string msg = "N is too large (max " + std::string(max_str) + ")";
        free(max_str);
        throw UsageError(msg);
    }

    // Export as two 32-bit halves; unsigned long may be 32 bits.
    uint64_t lo = mpz_get_ui(n.v) & 0xFFFFFFFFULL;
    mpz_fdiv_q_2exp(n.v, n.v, 32);
    uint64_t hi = mpz_get_ui(n.v) & 0xFFFFFFFFULL;
    return (hi << 32) | lo;
}

uint64_t parse_args(int argc, char* argv[]) {
    if (argc < 2)
        throw UsageError("Too few args passed!");
    if (argc > 2)
        throw UsageError("Too many args passed!");
    return parse_limit(argv[1]);
}

} // namespace eratos
