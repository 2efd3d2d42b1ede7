#pragma once

#include <cstdint>
#include <string_view>

namespace sceneasm::common
{
    // 64-bit FNV-1a.
    [[nodiscard]] std::uint64_t contentHash(std::string_view text) noexcept;
    [[nodiscard]] std::uint64_t combineHash(std::uint64_t seed, std::uint64_t value) noexcept;
    [[nodiscard]] std::uint64_t combineHash(std::uint64_t seed, std::string_view text) noexcept;
} // namespace sceneasm::common
