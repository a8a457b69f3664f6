#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include <fmt/core.h>

// Number of failed checks in the current test program
inline int testFailures = 0;

inline void check(bool condition, const std::string &description)
{
    fmt::print("{} {}\n", condition ? "PASS" : "FAIL", description);
    if (!condition)
    {
        ++testFailures;
    }
}

/**
 * Run `fn` and report whether it threw an exception of type E.
 * The caught exception is handed to `inspect` for further checks.
 */
template <typename E, typename Fn, typename Inspect>
bool throwsAs(Fn &&fn, Inspect &&inspect)
{
    try
    {
        fn();
    }
    catch (const E &e)
    {
        inspect(e);
        return true;
    }
    catch (const std::exception &e)
    {
        fmt::print("  unexpected exception: {}\n", e.what());
        return false;
    }
    return false;
}

template <typename E, typename Fn>
bool throwsAs(Fn &&fn)
{
    return throwsAs<E>(std::forward<Fn>(fn), [](const E &) {});
}

/**
 * Deterministic pseudo-random payload (xorshift) so mismatched offsets show up.
 */
inline std::vector<char> makePayload(size_t size, std::uint32_t seed = 0x9E3779B9u)
{
    std::vector<char> payload(size);
    std::uint32_t state = seed;
    for (auto &byte : payload)
    {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        byte = static_cast<char>(state & 0xFF);
    }
    return payload;
}

inline int finishTests(const char *suite)
{
    if (testFailures == 0)
    {
        fmt::print("\n✅ All {} tests passed!\n", suite);
        return 0;
    }
    fmt::print(stderr, "\n❌ {} {} check(s) failed\n", testFailures, suite);
    return 1;
}
