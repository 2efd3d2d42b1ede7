#pragma once

#include "../common/diagnostic.hpp"
#include "../common/vm_elements.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sceneasm::hir
{
    using common::Diagnostic;
    using common::Register;
    using common::SourceSpan;

    enum class SymbolKind : std::uint8_t
    {
        Label,
        Function,
        Subroutine
    };

    struct Symbol
    {
        std::string name;
        SymbolKind kind{SymbolKind::Label};
        std::size_t parameterCount{0};
        SourceSpan span{};
    };

    enum class ValueKind : std::uint8_t
    {
        Integer,
        // Fixed point, scaled by common::kRealScale.
        Real
    };

    struct ConstantValue
    {
        std::int32_t value{0};
        ValueKind kind{ValueKind::Integer};
    };

    // Names visible from every unit. Frozen once collection finishes.
    class GlobalScope
    {
    public:
        // Returns the earlier declaration when the name is taken.
        const Symbol* declareSymbol(Symbol symbol);
        void defineValue(std::string name, ConstantValue value);
        void defineRegister(std::string name, Register reg);

        [[nodiscard]] const Symbol* findSymbol(std::string_view name) const;
        [[nodiscard]] std::optional<ConstantValue> findValue(std::string_view name) const;
        [[nodiscard]] std::optional<Register> findRegister(std::string_view name) const;

        [[nodiscard]] const std::vector<Symbol>& symbols() const noexcept
        {
            return m_symbols;
        }

        // Hash of everything a unit can observe through this scope; spans are left out.
        [[nodiscard]] std::uint64_t signature() const;

    private:
        std::vector<Symbol> m_symbols;
        std::unordered_map<std::string, std::size_t> m_symbolIndex;
        std::map<std::string, ConstantValue, std::less<>> m_values;
        std::map<std::string, Register, std::less<>> m_registers;
    };

    enum class ExpressionKind : std::uint8_t
    {
        Literal,
        String,
        Register,
        CodeAddress,
        Unary,
        Binary,
        Call,
        Error
    };

    enum class UnaryOperator : std::uint8_t
    {
        Negate,
        BitwiseNot,
        LogicalNot
    };

    enum class BinaryOperator : std::uint8_t
    {
        Add,
        Subtract,
        Multiply,
        Divide,
        IntegerDivide,
        Modulo,
        MultiplyReal,
        DivideReal,
        ShiftLeft,
        ShiftRight,
        BitwiseAnd,
        BitwiseOr,
        BitwiseXor,
        Equal,
        NotEqual,
        Less,
        LessEqual,
        Greater,
        GreaterEqual,
        LogicalAnd,
        LogicalOr
    };

    enum class Intrinsic : std::uint8_t
    {
        Abs,
        Sin,
        Cos,
        Tan,
        Min,
        Max,
        Select,
        NonZero
    };

    struct Expression
    {
        ExpressionKind kind{ExpressionKind::Error};
        ConstantValue literal{};
        std::string text;
        Register reg{};
        // Code addresses keep the callee shape for arity checks.
        SymbolKind symbolKind{SymbolKind::Label};
        std::size_t parameterCount{0};
        UnaryOperator unaryOperator{UnaryOperator::Negate};
        BinaryOperator binaryOperator{BinaryOperator::Add};
        Intrinsic intrinsic{Intrinsic::Abs};
        std::vector<Expression> operands;
        SourceSpan span{};
    };

    enum class OperandKind : std::uint8_t
    {
        Expression,
        Flag,
        Array,
        JumpTable
    };

    struct JumpTableCase
    {
        Expression key;
        Expression target;
        SourceSpan span{};
    };

    struct Operand
    {
        OperandKind kind{OperandKind::Expression};
        Expression expression;
        std::string flag;
        std::vector<Expression> elements;
        std::vector<JumpTableCase> cases;
        SourceSpan span{};
    };

    enum class StatementKind : std::uint8_t
    {
        Label,
        Instruction
    };

    struct Statement
    {
        StatementKind kind{StatementKind::Instruction};
        // Label name or instruction mnemonic.
        std::string name;
        std::vector<Operand> operands;
        SourceSpan span{};
    };

    enum class UnitKind : std::uint8_t
    {
        Script,
        Function,
        Subroutine
    };

    struct Unit
    {
        UnitKind kind{UnitKind::Script};
        std::string name;
        std::size_t parameterCount{0};
        // Saved by the prologue in this order, restored in reverse.
        std::vector<Register> preserved;
        std::vector<Statement> statements;
        SourceSpan span{};
    };

    [[nodiscard]] std::string_view toString(SymbolKind kind);
    [[nodiscard]] std::string_view toString(ValueKind kind);
} // namespace sceneasm::hir
