#include "expression_lowering.hpp"

#include <limits>

namespace sceneasm::hir
{
    namespace
    {
        constexpr std::int64_t kMinimum = std::numeric_limits<std::int32_t>::min();
        constexpr std::int64_t kMaximum = std::numeric_limits<std::int32_t>::max();

        std::int32_t truth(bool value)
        {
            // The VM represents true as all bits set.
            return value ? -1 : 0;
        }

        bool isDivision(ExpressionTermKind term)
        {
            return term == ExpressionTermKind::Divide
                || term == ExpressionTermKind::Modulo
                || term == ExpressionTermKind::DivideReal;
        }

        ExpressionTermKind comparisonTerm(BinaryOperator op)
        {
            switch (op)
            {
            case BinaryOperator::Equal: return ExpressionTermKind::CmpEqual;
            case BinaryOperator::NotEqual: return ExpressionTermKind::CmpNotEqual;
            case BinaryOperator::Less: return ExpressionTermKind::CmpLower;
            case BinaryOperator::LessEqual: return ExpressionTermKind::CmpLowerOrEqual;
            case BinaryOperator::Greater: return ExpressionTermKind::CmpGreater;
            default: return ExpressionTermKind::CmpGreaterOrEqual;
            }
        }

        std::string_view spelling(BinaryOperator op)
        {
            switch (op)
            {
            case BinaryOperator::IntegerDivide: return "div";
            case BinaryOperator::ShiftLeft: return "<<";
            case BinaryOperator::ShiftRight: return ">>";
            case BinaryOperator::BitwiseAnd: return "&";
            case BinaryOperator::BitwiseOr: return "|";
            case BinaryOperator::BitwiseXor: return "^";
            case BinaryOperator::LogicalAnd: return "&&";
            case BinaryOperator::LogicalOr: return "||";
            default: return "?";
            }
        }

        std::size_t intrinsicArity(Intrinsic intrinsic)
        {
            switch (intrinsic)
            {
            case Intrinsic::Min:
            case Intrinsic::Max:
                return 2;
            case Intrinsic::Select:
                return 3;
            default:
                return 1;
            }
        }
    } // namespace

    std::optional<NumberSpec> LoweredValue::asNumber() const
    {
        if (!valid)
        {
            return std::nullopt;
        }
        if (constant.has_value())
        {
            return NumberSpec::makeConstant(*constant);
        }
        if (terms.size() == 1 && terms.front().kind == ExpressionTermKind::Push)
        {
            return terms.front().operand;
        }
        return std::nullopt;
    }

    std::vector<ExpressionTerm> LoweredValue::toTerms() const
    {
        if (constant.has_value())
        {
            return {ExpressionTerm{ExpressionTermKind::Push, NumberSpec::makeConstant(*constant)}};
        }
        return terms;
    }

    ExpressionLowerer::ExpressionLowerer(DiagnosticBag& diagnostics)
        : m_diagnostics(diagnostics)
    {
    }

    LoweredValue ExpressionLowerer::invalid(SourceSpan span) const
    {
        LoweredValue value;
        value.valid = false;
        value.span = span;
        return value;
    }

    LoweredValue ExpressionLowerer::lower(const Expression& expression)
    {
        switch (expression.kind)
        {
        case ExpressionKind::Literal:
        {
            LoweredValue value;
            value.kind = expression.literal.kind;
            value.constant = expression.literal.value;
            value.span = expression.span;
            return value;
        }
        case ExpressionKind::Register:
        {
            LoweredValue value;
            value.terms.push_back(ExpressionTerm{ExpressionTermKind::Push, NumberSpec::makeRegister(expression.reg)});
            value.span = expression.span;
            return value;
        }
        case ExpressionKind::String:
            m_diagnostics.error("SASM-E2307", "A string cannot be used as a number.", expression.span);
            return invalid(expression.span);
        case ExpressionKind::CodeAddress:
            m_diagnostics.error("SASM-E2308", "Code address '" + expression.text + "' cannot be used as a number.", expression.span);
            return invalid(expression.span);
        case ExpressionKind::Unary:
            return lowerUnary(expression);
        case ExpressionKind::Binary:
            return lowerBinary(expression);
        case ExpressionKind::Call:
            return lowerCall(expression);
        case ExpressionKind::Error:
            break;
        }
        return invalid(expression.span);
    }

    LoweredValue ExpressionLowerer::lowerUnary(const Expression& expression)
    {
        LoweredValue operand = lower(expression.operands.front());
        if (!operand.valid)
        {
            return invalid(expression.span);
        }

        switch (expression.unaryOperator)
        {
        case UnaryOperator::Negate:
        {
            const ValueKind kind = operand.kind;
            return apply(ExpressionTermKind::Negate, {std::move(operand)}, kind, expression.span);
        }
        case UnaryOperator::BitwiseNot:
            if (!requireInteger(operand, "~"))
            {
                return invalid(expression.span);
            }
            return apply(ExpressionTermKind::BitwiseNot, {std::move(operand)}, ValueKind::Integer, expression.span);
        case UnaryOperator::LogicalNot:
            return apply(ExpressionTermKind::CmpZero, {std::move(operand)}, ValueKind::Integer, expression.span);
        }
        return invalid(expression.span);
    }

    LoweredValue ExpressionLowerer::lowerBinary(const Expression& expression)
    {
        LoweredValue left = lower(expression.operands[0]);
        LoweredValue right = lower(expression.operands[1]);
        if (!left.valid || !right.valid)
        {
            return invalid(expression.span);
        }

        const bool anyReal = left.kind == ValueKind::Real || right.kind == ValueKind::Real;
        const bool mixed = left.kind != right.kind;
        ExpressionTermKind term = ExpressionTermKind::Add;
        ValueKind kind = ValueKind::Integer;

        switch (expression.binaryOperator)
        {
        case BinaryOperator::Add:
        case BinaryOperator::Subtract:
        case BinaryOperator::Modulo:
            term = expression.binaryOperator == BinaryOperator::Add ? ExpressionTermKind::Add
                : expression.binaryOperator == BinaryOperator::Subtract ? ExpressionTermKind::Subtract
                : ExpressionTermKind::Modulo;
            if (anyReal)
            {
                left = promote(std::move(left));
                right = promote(std::move(right));
                kind = ValueKind::Real;
            }
            break;
        case BinaryOperator::Multiply:
            if (anyReal)
            {
                left = promote(std::move(left));
                right = promote(std::move(right));
                term = ExpressionTermKind::MultiplyReal;
                kind = ValueKind::Real;
            }
            else
            {
                term = ExpressionTermKind::Multiply;
            }
            break;
        case BinaryOperator::Divide:
            left = promote(std::move(left));
            right = promote(std::move(right));
            term = ExpressionTermKind::DivideReal;
            kind = ValueKind::Real;
            break;
        case BinaryOperator::IntegerDivide:
            if (!requireInteger(left, "div") || !requireInteger(right, "div"))
            {
                return invalid(expression.span);
            }
            term = ExpressionTermKind::Divide;
            break;
        case BinaryOperator::MultiplyReal:
        case BinaryOperator::DivideReal:
            if (mixed)
            {
                m_diagnostics.error("SASM-E2304",
                    std::string{"Operands of '"} + (expression.binaryOperator == BinaryOperator::MultiplyReal ? ".*" : "./")
                        + "' must have the same kind, found " + std::string{toString(left.kind)} + " and "
                        + std::string{toString(right.kind)} + ".",
                    expression.span);
                return invalid(expression.span);
            }
            term = expression.binaryOperator == BinaryOperator::MultiplyReal ? ExpressionTermKind::MultiplyReal
                                                                              : ExpressionTermKind::DivideReal;
            kind = left.kind;
            break;
        case BinaryOperator::ShiftLeft:
        case BinaryOperator::ShiftRight:
        case BinaryOperator::BitwiseAnd:
        case BinaryOperator::BitwiseOr:
        case BinaryOperator::BitwiseXor:
        case BinaryOperator::LogicalAnd:
        case BinaryOperator::LogicalOr:
            if (!requireInteger(left, spelling(expression.binaryOperator))
                || !requireInteger(right, spelling(expression.binaryOperator)))
            {
                return invalid(expression.span);
            }
            switch (expression.binaryOperator)
            {
            case BinaryOperator::ShiftLeft: term = ExpressionTermKind::ShiftLeft; break;
            case BinaryOperator::ShiftRight: term = ExpressionTermKind::ShiftRight; break;
            case BinaryOperator::BitwiseAnd: term = ExpressionTermKind::BitwiseAnd; break;
            case BinaryOperator::BitwiseOr: term = ExpressionTermKind::BitwiseOr; break;
            case BinaryOperator::BitwiseXor: term = ExpressionTermKind::BitwiseXor; break;
            case BinaryOperator::LogicalAnd: term = ExpressionTermKind::LogicalAnd; break;
            default: term = ExpressionTermKind::LogicalOr; break;
            }
            break;
        case BinaryOperator::Equal:
        case BinaryOperator::NotEqual:
        case BinaryOperator::Less:
        case BinaryOperator::LessEqual:
        case BinaryOperator::Greater:
        case BinaryOperator::GreaterEqual:
            if (mixed)
            {
                left = promote(std::move(left));
                right = promote(std::move(right));
            }
            term = comparisonTerm(expression.binaryOperator);
            break;
        }

        if (!left.valid || !right.valid)
        {
            return invalid(expression.span);
        }

        if (isDivision(term) && right.isConstant() && *right.constant == 0)
        {
            m_diagnostics.error("SASM-E2306", "Division or modulo by constant zero.", expression.operands[1].span);
            return invalid(expression.span);
        }

        return apply(term, {std::move(left), std::move(right)}, kind, expression.span);
    }

    LoweredValue ExpressionLowerer::lowerCall(const Expression& expression)
    {
        if (expression.operands.size() != intrinsicArity(expression.intrinsic))
        {
            m_diagnostics.error("SASM-E2309",
                "'" + expression.text + "' expects " + std::to_string(intrinsicArity(expression.intrinsic))
                    + " argument(s), found " + std::to_string(expression.operands.size()) + ".",
                expression.span);
            return invalid(expression.span);
        }

        std::vector<LoweredValue> arguments;
        arguments.reserve(expression.operands.size());
        for (const auto& operand : expression.operands)
        {
            arguments.push_back(lower(operand));
            if (!arguments.back().valid)
            {
                return invalid(expression.span);
            }
        }

        switch (expression.intrinsic)
        {
        case Intrinsic::Abs:
        {
            const ValueKind kind = arguments[0].kind;
            return apply(ExpressionTermKind::Abs, std::move(arguments), kind, expression.span);
        }
        case Intrinsic::NonZero:
            return apply(ExpressionTermKind::CmpNotZero, std::move(arguments), ValueKind::Integer, expression.span);
        case Intrinsic::Sin:
            return apply(ExpressionTermKind::Sin, std::move(arguments), ValueKind::Real, expression.span);
        case Intrinsic::Cos:
            return apply(ExpressionTermKind::Cos, std::move(arguments), ValueKind::Real, expression.span);
        case Intrinsic::Tan:
            return apply(ExpressionTermKind::Tan, std::move(arguments), ValueKind::Real, expression.span);
        case Intrinsic::Min:
        case Intrinsic::Max:
        {
            ValueKind kind = arguments[0].kind;
            if (arguments[0].kind != arguments[1].kind)
            {
                arguments[0] = promote(std::move(arguments[0]));
                arguments[1] = promote(std::move(arguments[1]));
                kind = ValueKind::Real;
            }
            const ExpressionTermKind term = expression.intrinsic == Intrinsic::Min ? ExpressionTermKind::Min : ExpressionTermKind::Max;
            return apply(term, std::move(arguments), kind, expression.span);
        }
        case Intrinsic::Select:
        {
            LoweredValue condition = std::move(arguments[0]);
            LoweredValue whenTrue = std::move(arguments[1]);
            LoweredValue whenFalse = std::move(arguments[2]);
            ValueKind kind = whenTrue.kind;
            if (whenTrue.kind != whenFalse.kind)
            {
                whenTrue = promote(std::move(whenTrue));
                whenFalse = promote(std::move(whenFalse));
                kind = ValueKind::Real;
            }
            // The VM pops the condition first, then the true value, then the false value.
            std::vector<LoweredValue> ordered;
            ordered.push_back(std::move(whenFalse));
            ordered.push_back(std::move(whenTrue));
            ordered.push_back(std::move(condition));
            return apply(ExpressionTermKind::Select, std::move(ordered), kind, expression.span);
        }
        }
        return invalid(expression.span);
    }

    LoweredValue ExpressionLowerer::promote(LoweredValue value)
    {
        if (!value.valid || value.kind == ValueKind::Real)
        {
            return value;
        }

        value.kind = ValueKind::Real;
        if (value.constant.has_value())
        {
            const std::int64_t scaled = static_cast<std::int64_t>(*value.constant) * common::kRealScale;
            if (scaled < kMinimum || scaled > kMaximum)
            {
                m_diagnostics.error("SASM-E2305", "Constant overflows 32 bits when converted to a real value.", value.span);
                return invalid(value.span);
            }
            value.constant = static_cast<std::int32_t>(scaled);
            return value;
        }

        value.terms.push_back(ExpressionTerm{ExpressionTermKind::Push, NumberSpec::makeConstant(common::kRealScale)});
        value.terms.push_back(ExpressionTerm{ExpressionTermKind::Multiply, {}});
        return value;
    }

    LoweredValue ExpressionLowerer::apply(ExpressionTermKind term, std::vector<LoweredValue> arguments, ValueKind kind, SourceSpan span)
    {
        bool allConstant = true;
        for (const auto& argument : arguments)
        {
            if (!argument.valid)
            {
                return invalid(span);
            }
            allConstant = allConstant && argument.constant.has_value();
        }

        // Trigonometry is evaluated by the VM only.
        const bool foldable = term != ExpressionTermKind::Sin && term != ExpressionTermKind::Cos && term != ExpressionTermKind::Tan;

        LoweredValue result;
        result.kind = kind;
        result.span = span;

        if (allConstant && foldable)
        {
            std::vector<std::int32_t> values;
            values.reserve(arguments.size());
            for (const auto& argument : arguments)
            {
                values.push_back(*argument.constant);
            }
            result.constant = fold(term, values, span);
            result.valid = result.constant.has_value();
            return result;
        }

        for (const auto& argument : arguments)
        {
            const auto terms = argument.toTerms();
            result.terms.insert(result.terms.end(), terms.begin(), terms.end());
        }
        result.terms.push_back(ExpressionTerm{term, {}});
        return result;
    }

    std::optional<std::int32_t> ExpressionLowerer::fold(ExpressionTermKind term, const std::vector<std::int32_t>& values, SourceSpan span)
    {
        const std::int64_t a = values[0];
        const std::int64_t b = values.size() > 1 ? values[1] : 0;
        std::int64_t result = 0;

        switch (term)
        {
        case ExpressionTermKind::Add: result = a + b; break;
        case ExpressionTermKind::Subtract: result = a - b; break;
        case ExpressionTermKind::Multiply: result = a * b; break;
        case ExpressionTermKind::Divide: result = a / b; break;
        case ExpressionTermKind::Modulo: result = a % b; break;
        case ExpressionTermKind::MultiplyReal: result = a * b / common::kRealScale; break;
        case ExpressionTermKind::DivideReal: result = a * common::kRealScale / b; break;
        case ExpressionTermKind::ShiftLeft:
        case ExpressionTermKind::ShiftRight:
            if (b < 0 || b > 31)
            {
                m_diagnostics.error("SASM-E2305", "Shift count " + std::to_string(b) + " is outside 0..31.", span);
                return std::nullopt;
            }
            // Left shifts go through the range check below like any other product.
            result = term == ExpressionTermKind::ShiftLeft
                ? a * (std::int64_t{1} << b)
                : static_cast<std::int64_t>(values[0] >> b);
            break;
        case ExpressionTermKind::BitwiseAnd: result = a & b; break;
        case ExpressionTermKind::BitwiseOr: result = a | b; break;
        case ExpressionTermKind::BitwiseXor: result = a ^ b; break;
        case ExpressionTermKind::Negate: result = -a; break;
        case ExpressionTermKind::BitwiseNot: result = ~a; break;
        case ExpressionTermKind::Abs: result = a < 0 ? -a : a; break;
        case ExpressionTermKind::CmpEqual: result = truth(a == b); break;
        case ExpressionTermKind::CmpNotEqual: result = truth(a != b); break;
        case ExpressionTermKind::CmpGreaterOrEqual: result = truth(a >= b); break;
        case ExpressionTermKind::CmpGreater: result = truth(a > b); break;
        case ExpressionTermKind::CmpLowerOrEqual: result = truth(a <= b); break;
        case ExpressionTermKind::CmpLower: result = truth(a < b); break;
        case ExpressionTermKind::CmpZero: result = truth(a == 0); break;
        case ExpressionTermKind::CmpNotZero: result = truth(a != 0); break;
        case ExpressionTermKind::LogicalAnd: result = truth(a != 0 && b != 0); break;
        case ExpressionTermKind::LogicalOr: result = truth(a != 0 || b != 0); break;
        case ExpressionTermKind::Min: result = a < b ? a : b; break;
        case ExpressionTermKind::Max: result = a > b ? a : b; break;
        case ExpressionTermKind::Select:
            // Push order is false value, true value, condition.
            result = values[2] != 0 ? values[1] : values[0];
            break;
        default:
            return std::nullopt;
        }

        if (result < kMinimum || result > kMaximum)
        {
            m_diagnostics.error("SASM-E2305", "Constant expression overflows 32 bits.", span);
            return std::nullopt;
        }
        return static_cast<std::int32_t>(result);
    }

    bool ExpressionLowerer::requireInteger(const LoweredValue& value, std::string_view op)
    {
        if (value.kind == ValueKind::Integer)
        {
            return true;
        }
        m_diagnostics.error("SASM-E2304", "Operator '" + std::string{op} + "' requires integer operands, found a real value.", value.span);
        return false;
    }

    std::optional<ConstantValue> evaluateConstant(const Expression& expression, DiagnosticBag& diagnostics)
    {
        ExpressionLowerer lowerer{diagnostics};
        const LoweredValue value = lowerer.lower(expression);
        if (!value.valid)
        {
            return std::nullopt;
        }
        if (!value.constant.has_value())
        {
            diagnostics.error("SASM-E2214", "Expression does not fold to a constant.", expression.span);
            return std::nullopt;
        }
        return ConstantValue{*value.constant, value.kind};
    }
} // namespace sceneasm::hir
