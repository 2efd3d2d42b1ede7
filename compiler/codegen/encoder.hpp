#pragma once

#include "byte_writer.hpp"
#include "../middle_ir/module.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sceneasm::codegen
{
    using common::Diagnostic;
    using common::NumberSpec;
    using common::SourceSpan;

    // A u32 code address left for the fix-up pass.
    struct Relocation
    {
        enum class Kind : std::uint8_t
        {
            Symbol,
            // Address of a position inside the same unit.
            UnitOffset
        };

        Kind kind{Kind::Symbol};
        // Unit-relative position of the u32 to patch.
        std::size_t offset{0};
        std::string symbol;
        std::uint32_t unitOffset{0};
        SourceSpan span{};
    };

    struct EncodedLabel
    {
        std::string name;
        std::uint32_t offset{0};
        SourceSpan span{};
    };

    struct EncodedUnit
    {
        std::string name;
        std::vector<std::uint8_t> bytes;
        std::vector<Relocation> relocations;
        std::vector<EncodedLabel> labels;
        std::vector<std::uint32_t> instructionOffsets;
        std::vector<Diagnostic> diagnostics;
    };

    // Shortest NumberSpec form, or nothing when the value has none.
    [[nodiscard]] std::optional<std::vector<std::uint8_t>> encodeNumberSpec(const NumberSpec& number);

    // Encodes one unit at offset 0. Code addresses are written as zero and recorded as
    // relocations.
    [[nodiscard]] EncodedUnit encodeUnit(const mir::Unit& unit);
} // namespace sceneasm::codegen
