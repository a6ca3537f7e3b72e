// sieve.cpp
// Single-threaded Sieve of Eratosthenes over a packed bitset.

#include "sieve.hpp"
#include <bitset>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace eratos {

static inline uint64_t isqrt(uint64_t n) {
    uint64_t r = std::sqrt((double)n);
    // Correct the floating estimate; r*r must not wrap for n near 2^64.
    while (r > 0 && (r > UINT32_MAX || r * r > n)) r--;
    while (r < UINT32_MAX && (r + 1) * (r + 1) <= n) r++;
    return r;
}

static inline uint64_t popcount_u64(uint64_t word) {
    return std::bitset<64>(word).count();
}

// Words needed for limit + 1 bits.
static uint64_t word_count(uint64_t limit) {
    if (limit == std::numeric_limits<uint64_t>::max())
        throw std::length_error("Sieve limit too large: " +
                                std::to_string(limit));
    return limit / 64 + 1;
}

Sieve::Sieve(uint64_t limit)
    : limit_(limit)
    , words_(word_count(limit), ~0ULL)
{}

Sieve Sieve::create(uint64_t limit) {
    Sieve sieve(limit);
    sieve.fill();
    return sieve;
}

void Sieve::fill() {
    if (filled_) return;

    // 0 and 1 are never prime. A limit-0 table has no index 1.
    clear(0);
    if (limit_ >= 1) clear(1);

    // Any composite <= limit has a prime factor <= sqrt(limit).
    // Indices already cleared were eliminated by a smaller factor.
    uint64_t sq = isqrt(limit_);
    for (uint64_t i = 2; i <= sq; i++) {
        if (!test(i)) continue;
        for (uint64_t j = 2 * i; j <= limit_; j += i) {
            clear(j);
            if (j > limit_ - i) break;  // next step would wrap
        }
    }

    filled_ = true;
}

bool Sieve::lookup(uint64_t target) const {
    if (!filled_)
        throw NotPopulatedError();
    if (target > limit_)
        throw OutOfBoundsError(target, limit_);
    return test(target);
}

std::vector<uint64_t> Sieve::filter(const std::vector<uint64_t>& candidates) const {
    std::vector<uint64_t> result;
    for (uint64_t n : candidates)
        if (lookup(n)) result.push_back(n);
    return result;
}

uint64_t Sieve::count() const {
    if (!filled_)
        throw NotPopulatedError();

    uint64_t total = 0;
    for (uint64_t w = 0; w < words_.size(); w++) {
        uint64_t word = words_[w];
        // Bits past limit in the last word were never cleared.
        if (w == words_.size() - 1 && bit_idx(limit_) != 63)
            word &= (1ULL << (bit_idx(limit_) + 1)) - 1;
        total += popcount_u64(word);
    }
    return total;
}

} // namespace eratos
