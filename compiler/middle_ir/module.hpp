#pragma once

#include "../common/diagnostic.hpp"
#include "../common/vm_elements.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sceneasm::mir
{
    using common::ExpressionTerm;
    using common::NumberSpec;
    using common::Register;
    using common::SourceSpan;

    enum class Opcode : std::uint16_t
    {
        Exit = 0x00,
        UnaryOperation = 0x40,
        BinaryOperation = 0x41,
        Expression = 0x42,
        GetTable = 0x44,
        JumpConditional = 0x46,
        Jump = 0x47,
        Gosub = 0x48,
        Retsub = 0x49,
        JumpTable = 0x4a,
        Random = 0x4c,
        Push = 0x4d,
        Pop = 0x4e,
        Call = 0x4f,
        Return = 0x50,
        MessageSet = 0x86,
        MessageClose = 0x8a,
        Select = 0x8d,
        DebugOut = 0xff,
        // Not a VM opcode: raw bytes written through unchanged.
        RawData = 0x100
    };

    enum class OperandKind : std::uint8_t
    {
        Number,
        Register,
        Byte,
        Flag,
        MessageId,
        String,
        NumberList,
        RegisterList,
        BitmaskNumbers,
        Target,
        TargetTable,
        PaddedNumberTable,
        Expression,
        ByteList
    };

    struct CodeTarget
    {
        // Empty once the target is an absolute address.
        std::string symbol;
        std::uint32_t address{0};
        SourceSpan span{};

        [[nodiscard]] bool isSymbolic() const noexcept
        {
            return !symbol.empty();
        }
    };

    struct Operand
    {
        OperandKind kind{OperandKind::Number};
        NumberSpec number{};
        Register reg{};
        std::uint32_t value{0};
        std::string text;
        std::vector<NumberSpec> numbers;
        std::vector<Register> registers;
        std::vector<CodeTarget> targets;
        // Case keys of a jump table, parallel to targets.
        std::vector<std::int32_t> keys;
        std::vector<ExpressionTerm> terms;
        std::vector<std::uint8_t> bytes;
        SourceSpan span{};
    };

    struct Instruction
    {
        Opcode opcode{Opcode::Exit};
        // Operation type of uo/bo (0x80 marks the explicit operand) and condition of jc.
        std::uint8_t subtype{0};
        std::vector<Operand> operands;
        SourceSpan span{};
    };

    enum class UnitKind : std::uint8_t
    {
        Script,
        Function,
        Subroutine
    };

    struct LabelMark
    {
        std::string name;
        // Index of the first instruction after the label.
        std::size_t instructionIndex{0};
        SourceSpan span{};
    };

    struct Unit
    {
        UnitKind kind{UnitKind::Script};
        std::string name;
        std::vector<Instruction> instructions;
        std::vector<LabelMark> labels;
        SourceSpan span{};
    };

    [[nodiscard]] Operand makeNumberOperand(NumberSpec number, SourceSpan span = {});
    [[nodiscard]] Operand makeRegisterOperand(Register reg, SourceSpan span = {});
    [[nodiscard]] Operand makeByteOperand(OperandKind kind, std::uint32_t value, SourceSpan span = {});
    [[nodiscard]] Operand makeTargetOperand(CodeTarget target);
} // namespace sceneasm::mir
