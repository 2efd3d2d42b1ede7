#pragma once

#include "../middle_ir/module.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sceneasm::disasm
{
    using common::NumberSpec;

    struct DecodeFailure
    {
        std::string code;
        std::string message;
        // Byte offset where decoding gave up.
        std::size_t offset{0};
    };

    struct DecodeResult
    {
        mir::Instruction instruction;
        std::size_t size{0};
        std::optional<DecodeFailure> failure;

        [[nodiscard]] bool succeeded() const noexcept
        {
            return !failure.has_value();
        }
    };

    // Decodes the instruction starting at offset. Code targets stay absolute addresses.
    [[nodiscard]] DecodeResult decodeInstruction(const std::vector<std::uint8_t>& code, std::size_t offset);

    // Reads one NumberSpec and advances offset past it.
    [[nodiscard]] std::optional<NumberSpec> decodeNumberSpec(const std::vector<std::uint8_t>& code, std::size_t& offset);
} // namespace sceneasm::disasm
