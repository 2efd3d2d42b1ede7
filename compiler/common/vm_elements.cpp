#include "vm_elements.hpp"

#include <cctype>

namespace sceneasm::common
{
    namespace
    {
        std::optional<std::uint32_t> parseDecimalIndex(std::string_view digits)
        {
            if (digits.empty() || digits.size() > 5)
            {
                return std::nullopt;
            }

            std::uint32_t value = 0;
            for (char ch : digits)
            {
                if (!std::isdigit(static_cast<unsigned char>(ch)))
                {
                    return std::nullopt;
                }
                value = value * 10 + static_cast<std::uint32_t>(ch - '0');
            }
            return value;
        }
    } // namespace

    std::optional<Register> Register::value(std::uint32_t index) noexcept
    {
        if (index >= kRegisterIndexLimit)
        {
            return std::nullopt;
        }
        return Register{static_cast<std::uint16_t>(index)};
    }

    std::optional<Register> Register::argument(std::uint32_t index) noexcept
    {
        if (index >= kRegisterIndexLimit)
        {
            return std::nullopt;
        }
        return Register{static_cast<std::uint16_t>(kArgumentRegisterBase + index)};
    }

    std::optional<Register> Register::fromRaw(std::uint16_t raw) noexcept
    {
        if (raw >= kArgumentRegisterBase + kRegisterIndexLimit)
        {
            return std::nullopt;
        }
        return Register{raw};
    }

    std::optional<Register> Register::parse(std::string_view text)
    {
        if (text.size() < 3 || text[0] != '$')
        {
            return std::nullopt;
        }

        const auto index = parseDecimalIndex(text.substr(2));
        if (!index.has_value())
        {
            return std::nullopt;
        }

        if (text[1] == 'v')
        {
            return value(*index);
        }
        if (text[1] == 'a')
        {
            return argument(*index);
        }
        return std::nullopt;
    }

    std::string Register::toString() const
    {
        return (isArgument() ? "$a" : "$v") + std::to_string(index());
    }

    std::string NumberSpec::toString() const
    {
        return isConstant() ? std::to_string(constant) : reg.toString();
    }

    bool isValidTermCode(std::uint8_t code) noexcept
    {
        return code <= static_cast<std::uint8_t>(ExpressionTermKind::Max);
    }

    std::size_t termArity(ExpressionTermKind kind) noexcept
    {
        switch (kind)
        {
        case ExpressionTermKind::Push:
            return 0;
        case ExpressionTermKind::Negate:
        case ExpressionTermKind::BitwiseNot:
        case ExpressionTermKind::Abs:
        case ExpressionTermKind::CmpZero:
        case ExpressionTermKind::CmpNotZero:
        case ExpressionTermKind::Sin:
        case ExpressionTermKind::Cos:
        case ExpressionTermKind::Tan:
            return 1;
        case ExpressionTermKind::Select:
            return 3;
        default:
            return 2;
        }
    }

    std::string_view toString(ExpressionTermKind kind)
    {
        switch (kind)
        {
        case ExpressionTermKind::Push: return "push";
        case ExpressionTermKind::Add: return "add";
        case ExpressionTermKind::Subtract: return "sub";
        case ExpressionTermKind::Multiply: return "mul";
        case ExpressionTermKind::Divide: return "div";
        case ExpressionTermKind::Modulo: return "mod";
        case ExpressionTermKind::ShiftLeft: return "shl";
        case ExpressionTermKind::ShiftRight: return "shr";
        case ExpressionTermKind::BitwiseAnd: return "and";
        case ExpressionTermKind::BitwiseOr: return "or";
        case ExpressionTermKind::BitwiseXor: return "xor";
        case ExpressionTermKind::Negate: return "neg";
        case ExpressionTermKind::BitwiseNot: return "not";
        case ExpressionTermKind::Abs: return "abs";
        case ExpressionTermKind::CmpEqual: return "eq";
        case ExpressionTermKind::CmpNotEqual: return "ne";
        case ExpressionTermKind::CmpGreaterOrEqual: return "ge";
        case ExpressionTermKind::CmpGreater: return "gt";
        case ExpressionTermKind::CmpLowerOrEqual: return "le";
        case ExpressionTermKind::CmpLower: return "lt";
        case ExpressionTermKind::CmpZero: return "zero";
        case ExpressionTermKind::CmpNotZero: return "nonzero";
        case ExpressionTermKind::LogicalAnd: return "land";
        case ExpressionTermKind::LogicalOr: return "lor";
        case ExpressionTermKind::Select: return "select";
        case ExpressionTermKind::MultiplyReal: return "mulf";
        case ExpressionTermKind::DivideReal: return "divf";
        case ExpressionTermKind::Sin: return "sin";
        case ExpressionTermKind::Cos: return "cos";
        case ExpressionTermKind::Tan: return "tan";
        case ExpressionTermKind::Min: return "min";
        case ExpressionTermKind::Max: return "max";
        }
        return "unknown";
    }
} // namespace sceneasm::common
