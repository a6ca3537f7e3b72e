// cli_args.hpp
// Command-line handling for prime_check.

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace eratos {

// Bad invocation: missing/extra arguments or an unusable N.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what)
        : std::runtime_error(what)
    {}
};

// Parse a decimal, non-negative integer that fits a sieve limit.
// Surrounding whitespace is not accepted. Throws UsageError.
uint64_t parse_limit(const std::string& text);

// Validate argv and return N. Throws UsageError.
uint64_t parse_args(int argc, char* argv[]);

} // namespace eratos
