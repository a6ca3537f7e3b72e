// sieve.hpp
// Sieve of Eratosthenes over the closed range [0, limit].
//
// One bit per index, packed into uint64_t words:
//   index i  →  word i / 64, bit i % 64
//
// Lifecycle:
//   Sieve::unfilled(n)  table allocated, every bit set, not yet populated
//   fill()              clears composites, one-shot (repeat calls are no-ops)
//   Sieve::create(n)    unfilled(n) + fill()
//
// lookup()/filter()/count() throw NotPopulatedError before fill().
// After fill() the sieve is read-only and may be shared between threads.

#pragma once
#include <cstdint>
#include <vector>
#include "sieve_error.hpp"

namespace eratos {

class Sieve {
public:
    // Unfilled sieve covering [0, limit]. All bits start at 1.
    // Throws std::length_error if limit + 1 does not fit in uint64_t.
    explicit Sieve(uint64_t limit);

    static Sieve unfilled(uint64_t limit) { return Sieve(limit); }
    static Sieve create(uint64_t limit);

    // Populate the table. No effect on an already filled sieve.
    void fill();

    // -------------------------------------------------------
    // Queries
    // -------------------------------------------------------

    // Is `target` prime? Throws NotPopulatedError / OutOfBoundsError.
    bool lookup(uint64_t target) const;

    // Primes among `candidates`, original order and duplicates kept.
    // The first failing lookup is rethrown; nothing partial is returned.
    std::vector<uint64_t> filter(const std::vector<uint64_t>& candidates) const;

    // pi(limit)
    uint64_t count() const;

    // -------------------------------------------------------
    // Accessors
    // -------------------------------------------------------
    uint64_t limit()  const noexcept { return limit_; }
    uint64_t max()    const noexcept { return limit_; }
    bool     filled() const noexcept { return filled_; }
    uint64_t size()   const noexcept { return limit_ + 1; }

    uint64_t memory_bytes() const {
        return words_.size() * sizeof(uint64_t);
    }

private:
    uint64_t limit_;
    std::vector<uint64_t> words_;
    bool filled_ = false;

    void clear(uint64_t i) {
        words_[word_idx(i)] &= ~(1ULL << bit_idx(i));
    }

    bool test(uint64_t i) const {
        return (words_[word_idx(i)] >> bit_idx(i)) & 1ULL;
    }

    static inline constexpr uint64_t word_idx(uint64_t i) { return i / 64; }
    static inline constexpr uint64_t bit_idx(uint64_t i)  { return i % 64; }
};

} // namespace eratos
