#include "builder.hpp"

namespace sceneasm::mir
{
    Builder::Builder(Unit& unit)
        : m_unit(unit)
    {
    }

    Instruction& Builder::appendInstruction(Opcode opcode, std::uint8_t subtype, SourceSpan span)
    {
        m_unit.instructions.emplace_back();
        Instruction& inst = m_unit.instructions.back();
        inst.opcode = opcode;
        inst.subtype = subtype;
        inst.span = span;
        return inst;
    }

    LabelMark& Builder::placeLabel(std::string_view name, SourceSpan span)
    {
        m_unit.labels.emplace_back();
        LabelMark& mark = m_unit.labels.back();
        mark.name = std::string{name};
        mark.instructionIndex = m_unit.instructions.size();
        mark.span = span;
        return mark;
    }

    std::size_t Builder::instructionCount() const noexcept
    {
        return m_unit.instructions.size();
    }

    Operand makeNumberOperand(NumberSpec number, SourceSpan span)
    {
        Operand operand;
        operand.kind = OperandKind::Number;
        operand.number = number;
        operand.span = span;
        return operand;
    }

    Operand makeRegisterOperand(Register reg, SourceSpan span)
    {
        Operand operand;
        operand.kind = OperandKind::Register;
        operand.reg = reg;
        operand.span = span;
        return operand;
    }

    Operand makeByteOperand(OperandKind kind, std::uint32_t value, SourceSpan span)
    {
        Operand operand;
        operand.kind = kind;
        operand.value = value;
        operand.span = span;
        return operand;
    }

    Operand makeTargetOperand(CodeTarget target)
    {
        Operand operand;
        operand.kind = OperandKind::Target;
        operand.span = target.span;
        operand.targets.push_back(std::move(target));
        return operand;
    }
} // namespace sceneasm::mir
