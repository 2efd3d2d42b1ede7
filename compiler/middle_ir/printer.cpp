#include "printer.hpp"

#include "opcodes.hpp"
#include "../frontend/token.hpp"

#include <cstdio>
#include <sstream>

namespace sceneasm::mir
{
    namespace
    {
        using common::ExpressionTermKind;

        struct Fragment
        {
            std::string text;
            bool compound{false};
        };

        std::string_view infixOperator(ExpressionTermKind kind)
        {
            switch (kind)
            {
            case ExpressionTermKind::Add: return "+";
            case ExpressionTermKind::Subtract: return "-";
            case ExpressionTermKind::Multiply: return "*";
            case ExpressionTermKind::Divide: return "div";
            case ExpressionTermKind::Modulo: return "mod";
            case ExpressionTermKind::ShiftLeft: return "<<";
            case ExpressionTermKind::ShiftRight: return ">>";
            case ExpressionTermKind::BitwiseAnd: return "&";
            case ExpressionTermKind::BitwiseOr: return "|";
            case ExpressionTermKind::BitwiseXor: return "^";
            case ExpressionTermKind::CmpEqual: return "==";
            case ExpressionTermKind::CmpNotEqual: return "!=";
            case ExpressionTermKind::CmpGreaterOrEqual: return ">=";
            case ExpressionTermKind::CmpGreater: return ">";
            case ExpressionTermKind::CmpLowerOrEqual: return "<=";
            case ExpressionTermKind::CmpLower: return "<";
            case ExpressionTermKind::LogicalAnd: return "&&";
            case ExpressionTermKind::LogicalOr: return "||";
            case ExpressionTermKind::MultiplyReal: return ".*";
            case ExpressionTermKind::DivideReal: return "./";
            default: return {};
            }
        }

        std::string_view intrinsicName(ExpressionTermKind kind)
        {
            switch (kind)
            {
            case ExpressionTermKind::Abs: return "abs";
            case ExpressionTermKind::CmpNotZero: return "nonzero";
            case ExpressionTermKind::Sin: return "sin";
            case ExpressionTermKind::Cos: return "cos";
            case ExpressionTermKind::Tan: return "tan";
            case ExpressionTermKind::Min: return "min";
            case ExpressionTermKind::Max: return "max";
            case ExpressionTermKind::Select: return "select";
            default: return {};
            }
        }

        std::string wrap(const Fragment& fragment)
        {
            return fragment.compound ? "(" + fragment.text + ")" : fragment.text;
        }

        std::string joinNumbers(const std::vector<NumberSpec>& numbers)
        {
            std::string text;
            for (std::size_t index = 0; index < numbers.size(); ++index)
            {
                if (index > 0)
                {
                    text += ", ";
                }
                text += numbers[index].toString();
            }
            return text;
        }

        std::string formatBitmask(const std::vector<NumberSpec>& slots)
        {
            std::size_t used = slots.size();
            while (used > 0 && slots[used - 1] == NumberSpec::makeConstant(0))
            {
                --used;
            }
            return "[" + joinNumbers(std::vector<NumberSpec>(slots.begin(), slots.begin() + static_cast<std::ptrdiff_t>(used))) + "]";
        }

        std::string formatTargetTable(const Operand& operand)
        {
            std::string text = "{";
            for (std::size_t index = 0; index < operand.targets.size(); ++index)
            {
                text += index == 0 ? " " : ", ";
                const std::int32_t key = index < operand.keys.size() ? operand.keys[index] : static_cast<std::int32_t>(index);
                text += std::to_string(key) + " => " + formatTarget(operand.targets[index]);
            }
            text += operand.targets.empty() ? "}" : " }";
            return text;
        }

        std::string formatHexByte(std::uint8_t value)
        {
            char buffer[8];
            std::snprintf(buffer, sizeof(buffer), "0x%02x", static_cast<unsigned>(value));
            return buffer;
        }

        std::string formatOperand(const Operand& operand)
        {
            switch (operand.kind)
            {
            case OperandKind::Number:
                return operand.number.toString();
            case OperandKind::Register:
                return operand.reg.toString();
            case OperandKind::Byte:
            case OperandKind::MessageId:
            case OperandKind::Flag:
                return std::to_string(operand.value);
            case OperandKind::String:
                return frontend::encodeStringLiteral(operand.text);
            case OperandKind::NumberList:
                return joinNumbers(operand.numbers);
            case OperandKind::RegisterList:
            {
                std::string text;
                for (std::size_t index = 0; index < operand.registers.size(); ++index)
                {
                    text += (index == 0 ? "" : ", ") + operand.registers[index].toString();
                }
                return text;
            }
            case OperandKind::BitmaskNumbers:
                return formatBitmask(operand.numbers);
            case OperandKind::Target:
                return operand.targets.empty() ? std::string{"0"} : formatTarget(operand.targets.front());
            case OperandKind::TargetTable:
                return formatTargetTable(operand);
            case OperandKind::PaddedNumberTable:
                return "[" + joinNumbers(operand.numbers) + "]";
            case OperandKind::Expression:
                return formatExpression(operand.terms).value_or("<malformed expression>");
            case OperandKind::ByteList:
            {
                std::string text;
                for (std::size_t index = 0; index < operand.bytes.size(); ++index)
                {
                    text += (index == 0 ? "" : ", ") + formatHexByte(operand.bytes[index]);
                }
                return text;
            }
            }
            return {};
        }

        std::string formatCondition(const Instruction& instruction)
        {
            if (instruction.operands.size() != 3)
            {
                return "<malformed condition>";
            }

            const auto condition = static_cast<Condition>(instruction.subtype & ~kNegatedConditionBit);
            const std::string left = instruction.operands[0].number.toString();
            const std::string right = instruction.operands[1].number.toString();

            std::string text = condition == Condition::BitSet
                ? left + " & (1 << " + right + ")"
                : left + " " + std::string{conditionOperator(condition)} + " " + right;
            if ((instruction.subtype & kNegatedConditionBit) != 0)
            {
                text = "!(" + text + ")";
            }
            return text + ", " + formatOperand(instruction.operands[2]);
        }
    } // namespace

    std::string formatTarget(const CodeTarget& target)
    {
        if (target.isSymbolic())
        {
            return target.symbol;
        }

        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "0x%x", static_cast<unsigned>(target.address));
        return buffer;
    }

    std::optional<std::string> formatExpression(const std::vector<ExpressionTerm>& terms)
    {
        std::vector<Fragment> stack;
        for (const auto& term : terms)
        {
            if (term.kind == ExpressionTermKind::Push)
            {
                stack.push_back(Fragment{term.operand.toString(), false});
                continue;
            }

            const std::size_t arity = common::termArity(term.kind);
            if (stack.size() < arity)
            {
                return std::nullopt;
            }

            std::vector<Fragment> arguments(stack.end() - static_cast<std::ptrdiff_t>(arity), stack.end());
            stack.resize(stack.size() - arity);

            Fragment result;
            if (const auto op = infixOperator(term.kind); !op.empty())
            {
                result.text = wrap(arguments[0]) + " " + std::string{op} + " " + wrap(arguments[1]);
                result.compound = true;
            }
            else if (term.kind == ExpressionTermKind::Negate)
            {
                result.text = "-" + wrap(arguments[0]);
            }
            else if (term.kind == ExpressionTermKind::BitwiseNot)
            {
                result.text = "~" + wrap(arguments[0]);
            }
            else if (term.kind == ExpressionTermKind::CmpZero)
            {
                result.text = "!" + wrap(arguments[0]);
            }
            else if (term.kind == ExpressionTermKind::Select)
            {
                // Stack order is false value, true value, condition.
                result.text = "select(" + arguments[2].text + ", " + arguments[1].text + ", " + arguments[0].text + ")";
            }
            else
            {
                result.text = std::string{intrinsicName(term.kind)} + "(";
                for (std::size_t index = 0; index < arguments.size(); ++index)
                {
                    result.text += (index == 0 ? "" : ", ") + arguments[index].text;
                }
                result.text += ")";
            }
            stack.push_back(std::move(result));
        }

        if (stack.size() != 1)
        {
            return std::nullopt;
        }
        return stack.front().text;
    }

    std::string formatInstruction(const Instruction& instruction)
    {
        const OpcodeInfo* info = findForInstruction(instruction);
        if (info == nullptr)
        {
            std::ostringstream stream;
            stream << "<unknown opcode 0x" << std::hex << static_cast<unsigned>(instruction.opcode) << ">";
            return stream.str();
        }

        std::string text{info->mnemonic};
        if (info->layout == OperandLayout::Conditional)
        {
            return text + " " + formatCondition(instruction);
        }

        std::vector<std::string> positional;
        std::vector<std::string> flags;
        for (std::size_t index = 0; index < instruction.operands.size(); ++index)
        {
            const Operand& operand = instruction.operands[index];
            if (operand.kind == OperandKind::Flag)
            {
                const OperandSpec* spec = nullptr;
                for (const auto& candidate : info->operands)
                {
                    if (candidate.kind == OperandKind::Flag)
                    {
                        spec = &candidate;
                    }
                }
                if (spec != nullptr && operand.value != spec->flagDefault)
                {
                    flags.emplace_back(spec->flagName);
                }
                continue;
            }

            std::string rendered = formatOperand(operand);
            const bool isList = operand.kind == OperandKind::NumberList || operand.kind == OperandKind::RegisterList;
            if (isList && rendered.empty())
            {
                continue;
            }
            positional.push_back(std::move(rendered));
        }

        positional.insert(positional.end(), flags.begin(), flags.end());
        for (std::size_t index = 0; index < positional.size(); ++index)
        {
            text += index == 0 ? " " : ", ";
            text += positional[index];
        }
        return text;
    }

    void print(const Unit& unit, std::ostream& stream)
    {
        switch (unit.kind)
        {
        case UnitKind::Script:
            stream << "script " << unit.name << '\n';
            break;
        case UnitKind::Function:
            stream << "function " << unit.name << '\n';
            break;
        case UnitKind::Subroutine:
            stream << "subroutine " << unit.name << '\n';
            break;
        }

        std::size_t nextLabel = 0;
        for (std::size_t index = 0; index <= unit.instructions.size(); ++index)
        {
            while (nextLabel < unit.labels.size() && unit.labels[nextLabel].instructionIndex == index)
            {
                stream << "  " << unit.labels[nextLabel].name << ":\n";
                ++nextLabel;
            }
            if (index < unit.instructions.size())
            {
                stream << "    " << formatInstruction(unit.instructions[index]) << '\n';
            }
        }
    }
} // namespace sceneasm::mir
