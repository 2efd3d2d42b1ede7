#pragma once

#include "module.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace sceneasm::mir
{
    struct OperandSpec
    {
        OperandKind kind{OperandKind::Number};
        // Flag operands are written by keyword, never by position.
        std::string_view flagName{};
        std::uint8_t flagDefault{0};
    };

    enum class OperandLayout : std::uint8_t
    {
        // Operands follow the opcode byte in table order.
        Plain,
        // A type byte comes first; bit 0x80 says the optional middle operand is present.
        TypedOptional,
        // A condition byte comes first (jc).
        Conditional
    };

    struct OpcodeInfo
    {
        Opcode opcode{Opcode::Exit};
        std::string_view mnemonic;
        OperandLayout layout{OperandLayout::Plain};
        std::uint8_t subtype{0};
        std::vector<OperandSpec> operands;
    };

    inline constexpr std::uint8_t kExplicitOperandBit = 0x80;
    inline constexpr std::uint8_t kNegatedConditionBit = 0x80;

    enum class Condition : std::uint8_t
    {
        Equal = 0,
        NotEqual = 1,
        GreaterOrEqual = 2,
        Greater = 3,
        LowerOrEqual = 4,
        Lower = 5,
        AndNotZero = 6,
        BitSet = 7
    };

    [[nodiscard]] const std::vector<OpcodeInfo>& opcodeTable();
    // Mnemonics match case-insensitively.
    [[nodiscard]] const OpcodeInfo* findByMnemonic(std::string_view mnemonic);
    // For uo/bo the subtype without the explicit-operand bit selects the entry.
    [[nodiscard]] const OpcodeInfo* findByOpcode(Opcode opcode, std::uint8_t subtype = 0);
    [[nodiscard]] const OpcodeInfo* findForInstruction(const Instruction& instruction);

    [[nodiscard]] bool endsControlFlow(Opcode opcode) noexcept;
    [[nodiscard]] std::string_view conditionOperator(Condition condition);
} // namespace sceneasm::mir
