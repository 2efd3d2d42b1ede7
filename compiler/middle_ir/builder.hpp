#pragma once

#include "module.hpp"

#include <string_view>

namespace sceneasm::mir
{
    class Builder
    {
    public:
        explicit Builder(Unit& unit);

        Instruction& appendInstruction(Opcode opcode, std::uint8_t subtype = 0, SourceSpan span = {});
        LabelMark& placeLabel(std::string_view name, SourceSpan span = {});

        [[nodiscard]] std::size_t instructionCount() const noexcept;

    private:
        Unit& m_unit;
    };
} // namespace sceneasm::mir
