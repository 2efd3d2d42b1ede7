#include "hashing.hpp"

namespace sceneasm::common
{
    namespace
    {
        constexpr std::uint64_t kOffsetBasis = 14695981039346656037ull;
        constexpr std::uint64_t kPrime = 1099511628211ull;
    } // namespace

    std::uint64_t contentHash(std::string_view text) noexcept
    {
        std::uint64_t hash = kOffsetBasis;
        for (unsigned char c : text)
        {
            hash ^= static_cast<std::uint64_t>(c);
            hash *= kPrime;
        }
        return hash;
    }

    std::uint64_t combineHash(std::uint64_t seed, std::uint64_t value) noexcept
    {
        std::uint64_t hash = seed;
        for (int shift = 0; shift < 64; shift += 8)
        {
            hash ^= (value >> shift) & 0xffu;
            hash *= kPrime;
        }
        return hash;
    }

    std::uint64_t combineHash(std::uint64_t seed, std::string_view text) noexcept
    {
        std::uint64_t hash = seed;
        for (unsigned char c : text)
        {
            hash ^= static_cast<std::uint64_t>(c);
            hash *= kPrime;
        }
        // Length terminator keeps "ab"+"c" apart from "a"+"bc".
        return combineHash(hash, static_cast<std::uint64_t>(text.size()));
    }
} // namespace sceneasm::common
