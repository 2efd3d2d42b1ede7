#pragma once

#include "module.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace sceneasm::hir
{
    using common::DiagnosticBag;
    using common::ExpressionTerm;
    using common::ExpressionTermKind;
    using common::NumberSpec;

    // Result of lowering one expression: a folded constant or an RPN computation.
    struct LoweredValue
    {
        ValueKind kind{ValueKind::Integer};
        bool valid{true};
        std::optional<std::int32_t> constant;
        std::vector<ExpressionTerm> terms;
        SourceSpan span{};

        [[nodiscard]] bool isConstant() const noexcept
        {
            return valid && constant.has_value();
        }

        // A constant or a lone register read; anything else needs `exp`.
        [[nodiscard]] std::optional<NumberSpec> asNumber() const;
        [[nodiscard]] std::vector<ExpressionTerm> toTerms() const;
    };

    class ExpressionLowerer
    {
    public:
        explicit ExpressionLowerer(DiagnosticBag& diagnostics);

        [[nodiscard]] LoweredValue lower(const Expression& expression);

    private:
        LoweredValue lowerUnary(const Expression& expression);
        LoweredValue lowerBinary(const Expression& expression);
        LoweredValue lowerCall(const Expression& expression);

        LoweredValue promote(LoweredValue value);
        LoweredValue apply(ExpressionTermKind term, std::vector<LoweredValue> arguments, ValueKind kind, SourceSpan span);
        std::optional<std::int32_t> fold(ExpressionTermKind term, const std::vector<std::int32_t>& values, SourceSpan span);
        bool requireInteger(const LoweredValue& value, std::string_view op);
        LoweredValue invalid(SourceSpan span) const;

    private:
        DiagnosticBag& m_diagnostics;
    };

    // Folds a constant-context expression; reports when the value depends on registers.
    [[nodiscard]] std::optional<ConstantValue> evaluateConstant(const Expression& expression, DiagnosticBag& diagnostics);
} // namespace sceneasm::hir
