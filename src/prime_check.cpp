// prime_check.cpp
// Is N prime? Builds a sieve up to N and looks N up.
//
// Usage:
//   ./prime_check N            (N a non-negative decimal integer)
//
// Prints "<N> is prime" or "<N> is not prime".
// Exit status 1 on a usage error or if the sieve can't be built.

#include <iostream>
#include <new>
#include <stdexcept>
#include "cli_args.hpp"
#include "sieve.hpp"

using namespace eratos;

int main(int argc, char* argv[]) {
    uint64_t n = 0;
    try {
        n = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Usage: " << (argc > 0 ? argv[0] : "prime_check") << " N\n";
        return 1;
    }

    try {
        auto sieve = Sieve::create(n);
        std::cout << n << (sieve.lookup(n) ? " is prime" : " is not prime") << "\n";
    } catch (const SieveError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::bad_alloc&) {
        std::cerr << "Error: not enough memory for a sieve up to " << n << "\n";
        return 1;
    } catch (const std::length_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
