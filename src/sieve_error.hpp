// sieve_error.hpp
// Errors raised by Sieve queries.
//
//   NotPopulatedError  — lookup before fill(); call fill() and retry
//   OutOfBoundsError   — value above the sieve's limit; needs a bigger sieve

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace eratos {

class SieveError : public std::runtime_error {
public:
    explicit SieveError(const std::string& what)
        : std::runtime_error(what)
    {}
};

class NotPopulatedError : public SieveError {
public:
    NotPopulatedError()
        : SieveError("Sieve not populated!")
    {}
};

class OutOfBoundsError : public SieveError {
public:
    OutOfBoundsError(uint64_t value, uint64_t limit)
        : SieveError(std::to_string(value) +
                     " is out of this sieve's bounds (max " +
                     std::to_string(limit) + ")")
        , value_(value)
        , limit_(limit)
    {}

    uint64_t value() const { return value_; }
    uint64_t limit() const { return limit_; }

private:
    uint64_t value_;
    uint64_t limit_;
};

} // namespace eratos
