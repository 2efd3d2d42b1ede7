#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sceneasm::common
{
    inline constexpr std::uint16_t kArgumentRegisterBase = 0x1000;
    inline constexpr std::uint16_t kRegisterIndexLimit = 0x1000;
    // Arguments are addressed through the 4-bit argument form of a number operand.
    inline constexpr std::size_t kArgumentRegisterCount = 16;
    // Fixed-point scale used by the VM for real values.
    inline constexpr std::int32_t kRealScale = 1000;

    class Register
    {
    public:
        Register() = default;

        [[nodiscard]] static std::optional<Register> value(std::uint32_t index) noexcept;
        [[nodiscard]] static std::optional<Register> argument(std::uint32_t index) noexcept;
        [[nodiscard]] static std::optional<Register> fromRaw(std::uint16_t raw) noexcept;
        // Accepts the builtin spellings "$v<N>" and "$a<N>".
        [[nodiscard]] static std::optional<Register> parse(std::string_view text);

        [[nodiscard]] bool isArgument() const noexcept
        {
            return m_raw >= kArgumentRegisterBase;
        }

        [[nodiscard]] std::uint16_t index() const noexcept
        {
            return isArgument() ? static_cast<std::uint16_t>(m_raw - kArgumentRegisterBase) : m_raw;
        }

        [[nodiscard]] std::uint16_t raw() const noexcept
        {
            return m_raw;
        }

        [[nodiscard]] std::string toString() const;

        friend bool operator==(Register left, Register right) noexcept
        {
            return left.m_raw == right.m_raw;
        }

        friend bool operator!=(Register left, Register right) noexcept
        {
            return left.m_raw != right.m_raw;
        }

        friend bool operator<(Register left, Register right) noexcept
        {
            return left.m_raw < right.m_raw;
        }

    private:
        explicit Register(std::uint16_t raw) noexcept
            : m_raw(raw)
        {
        }

        std::uint16_t m_raw{0};
    };

    struct NumberSpec
    {
        enum class Kind : std::uint8_t
        {
            Constant,
            Register
        };

        Kind kind{Kind::Constant};
        std::int32_t constant{0};
        Register reg{};

        [[nodiscard]] static NumberSpec makeConstant(std::int32_t value) noexcept
        {
            NumberSpec spec;
            spec.kind = Kind::Constant;
            spec.constant = value;
            return spec;
        }

        [[nodiscard]] static NumberSpec makeRegister(Register value) noexcept
        {
            NumberSpec spec;
            spec.kind = Kind::Register;
            spec.reg = value;
            return spec;
        }

        [[nodiscard]] bool isConstant() const noexcept
        {
            return kind == Kind::Constant;
        }

        [[nodiscard]] std::string toString() const;

        friend bool operator==(const NumberSpec& left, const NumberSpec& right) noexcept
        {
            if (left.kind != right.kind)
            {
                return false;
            }
            return left.isConstant() ? left.constant == right.constant : left.reg == right.reg;
        }

        friend bool operator!=(const NumberSpec& left, const NumberSpec& right) noexcept
        {
            return !(left == right);
        }
    };

    // Term codes of the VM's reverse-polish expression encoding.
    enum class ExpressionTermKind : std::uint8_t
    {
        Push = 0x00,
        Add = 0x01,
        Subtract = 0x02,
        Multiply = 0x03,
        Divide = 0x04,
        Modulo = 0x05,
        ShiftLeft = 0x06,
        ShiftRight = 0x07,
        BitwiseAnd = 0x08,
        BitwiseOr = 0x09,
        BitwiseXor = 0x0a,
        Negate = 0x0b,
        BitwiseNot = 0x0c,
        Abs = 0x0d,
        CmpEqual = 0x0e,
        CmpNotEqual = 0x0f,
        CmpGreaterOrEqual = 0x10,
        CmpGreater = 0x11,
        CmpLowerOrEqual = 0x12,
        CmpLower = 0x13,
        CmpZero = 0x14,
        CmpNotZero = 0x15,
        LogicalAnd = 0x16,
        LogicalOr = 0x17,
        Select = 0x18,
        MultiplyReal = 0x19,
        DivideReal = 0x1a,
        Sin = 0x1b,
        Cos = 0x1c,
        Tan = 0x1d,
        Min = 0x1e,
        Max = 0x1f
    };

    inline constexpr std::uint8_t kExpressionTerminator = 0xff;

    struct ExpressionTerm
    {
        ExpressionTermKind kind{ExpressionTermKind::Push};
        NumberSpec operand{};

        friend bool operator==(const ExpressionTerm& left, const ExpressionTerm& right) noexcept
        {
            if (left.kind != right.kind)
            {
                return false;
            }
            return left.kind != ExpressionTermKind::Push || left.operand == right.operand;
        }
    };

    [[nodiscard]] bool isValidTermCode(std::uint8_t code) noexcept;
    // Number of stack values a term consumes; Push consumes none.
    [[nodiscard]] std::size_t termArity(ExpressionTermKind kind) noexcept;
    [[nodiscard]] std::string_view toString(ExpressionTermKind kind);
} // namespace sceneasm::common
