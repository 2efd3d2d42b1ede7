#include "decoder.hpp"

#include "../middle_ir/opcodes.hpp"

#include <algorithm>
#include <cstdio>

namespace sceneasm::disasm
{
    namespace
    {
        using common::ExpressionTerm;
        using common::ExpressionTermKind;
        using common::Register;
        using mir::Opcode;
        using mir::Operand;
        using mir::OperandKind;
        using mir::OperandSpec;

        constexpr std::uint8_t kSelectOpcode = 0x8d;
        constexpr std::size_t kBitmaskSlots = 8;
        constexpr std::size_t kPaddedNumberWidth = 4;
        constexpr std::uint8_t kHighestCondition = static_cast<std::uint8_t>(mir::Condition::BitSet);

        std::int32_t signExtend(std::uint32_t value, int bits)
        {
            const std::uint32_t sign = 1u << (bits - 1);
            return static_cast<std::int32_t>((value ^ sign) - sign);
        }

        std::string hexByte(std::uint8_t value)
        {
            char buffer[8];
            std::snprintf(buffer, sizeof(buffer), "0x%02x", static_cast<unsigned>(value));
            return buffer;
        }

        // Bounds-checked reader; the first failure sticks and later reads are no-ops.
        class Cursor
        {
        public:
            Cursor(const std::vector<std::uint8_t>& code, std::size_t offset)
                : m_code(code)
                , m_offset(offset)
            {
            }

            [[nodiscard]] std::size_t offset() const noexcept
            {
                return m_offset;
            }

            [[nodiscard]] bool failed() const noexcept
            {
                return m_failure.has_value();
            }

            std::optional<DecodeFailure>& failure() noexcept
            {
                return m_failure;
            }

            void fail(std::string code, std::string message, std::size_t at)
            {
                if (!m_failure.has_value())
                {
                    m_failure = DecodeFailure{std::move(code), std::move(message), at};
                }
            }

            std::uint8_t u8()
            {
                if (failed())
                {
                    return 0;
                }
                if (m_offset >= m_code.size())
                {
                    fail("SASM-W5001", "Instruction is truncated at the end of the block.", m_offset);
                    return 0;
                }
                return m_code[m_offset++];
            }

            std::uint32_t littleEndian(int width)
            {
                std::uint32_t value = 0;
                for (int index = 0; index < width; ++index)
                {
                    value |= static_cast<std::uint32_t>(u8()) << (index * 8);
                }
                return value;
            }

            std::uint32_t bigEndian(int width)
            {
                std::uint32_t value = 0;
                for (int index = 0; index < width; ++index)
                {
                    value = (value << 8) | u8();
                }
                return value;
            }

            NumberSpec number()
            {
                const std::size_t start = m_offset;
                const std::uint8_t first = u8();
                if (failed())
                {
                    return {};
                }
                if ((first & 0x80) == 0)
                {
                    return NumberSpec::makeConstant(signExtend(first & 0x7fu, 7));
                }

                const std::uint32_t high = first & 0x0fu;
                switch ((first >> 4) & 0x07)
                {
                case 0: return NumberSpec::makeConstant(signExtend((high << 8) | bigEndian(1), 12));
                case 1: return NumberSpec::makeConstant(signExtend((high << 16) | bigEndian(2), 20));
                case 2: return NumberSpec::makeConstant(signExtend((high << 24) | bigEndian(3), 28));
                case 3: return NumberSpec::makeRegister(*Register::value(high));
                case 4: return NumberSpec::makeRegister(*Register::value((high << 8) | bigEndian(1)));
                case 5: return NumberSpec::makeRegister(*Register::argument(high));
                default:
                    fail("SASM-W5003", "Invalid number operand form " + hexByte(first) + ".", start);
                    return {};
                }
            }

            Register reg()
            {
                const std::size_t start = m_offset;
                const auto raw = static_cast<std::uint16_t>(littleEndian(2));
                if (failed())
                {
                    return {};
                }
                const auto result = Register::fromRaw(raw);
                if (!result.has_value())
                {
                    fail("SASM-W5004", "Invalid register number " + std::to_string(raw) + ".", start);
                    return {};
                }
                return *result;
            }

        private:
            const std::vector<std::uint8_t>& m_code;
            std::size_t m_offset;
            std::optional<DecodeFailure> m_failure;
        };

        class InstructionDecoder
        {
        public:
            InstructionDecoder(const std::vector<std::uint8_t>& code, std::size_t offset)
                : m_cursor(code, offset)
                , m_start(offset)
            {
            }

            DecodeResult run()
            {
                DecodeResult result;
                decode(result.instruction);
                result.size = m_cursor.offset() - m_start;
                result.failure = std::move(m_cursor.failure());
                return result;
            }

        private:
            void decode(mir::Instruction& instruction)
            {
                const std::uint8_t opcode = m_cursor.u8();
                if (m_cursor.failed())
                {
                    return;
                }
                if (opcode == kSelectOpcode)
                {
                    m_cursor.fail("SASM-W5006", "Opcode 0x8d (SELECT) is not supported.", m_start);
                    return;
                }

                instruction.opcode = static_cast<Opcode>(opcode);
                const mir::OpcodeInfo* info = mir::findByOpcode(instruction.opcode);
                if (info == nullptr)
                {
                    m_cursor.fail("SASM-W5002", "Unknown opcode " + hexByte(opcode) + ".", m_start);
                    return;
                }

                switch (info->layout)
                {
                case mir::OperandLayout::TypedOptional:
                    decodeTyped(instruction);
                    break;
                case mir::OperandLayout::Conditional:
                    decodeConditional(instruction);
                    break;
                case mir::OperandLayout::Plain:
                    for (const auto& spec : info->operands)
                    {
                        instruction.operands.push_back(decodeOperand(spec));
                    }
                    break;
                }
            }

            void decodeTyped(mir::Instruction& instruction)
            {
                instruction.subtype = m_cursor.u8();
                const mir::OpcodeInfo* info = mir::findByOpcode(instruction.opcode, instruction.subtype);
                if (m_cursor.failed())
                {
                    return;
                }
                if (info == nullptr)
                {
                    m_cursor.fail("SASM-W5002",
                        "Unknown operation type " + hexByte(instruction.subtype) + " for opcode "
                            + hexByte(static_cast<std::uint8_t>(instruction.opcode)) + ".",
                        m_start);
                    return;
                }

                instruction.operands.push_back(mir::makeRegisterOperand(m_cursor.reg()));
                if ((instruction.subtype & mir::kExplicitOperandBit) != 0)
                {
                    instruction.operands.push_back(mir::makeNumberOperand(m_cursor.number()));
                }
                for (std::size_t index = 2; index < info->operands.size(); ++index)
                {
                    instruction.operands.push_back(mir::makeNumberOperand(m_cursor.number()));
                }
            }

            void decodeConditional(mir::Instruction& instruction)
            {
                instruction.subtype = m_cursor.u8();
                if (!m_cursor.failed() && (instruction.subtype & ~mir::kNegatedConditionBit) > kHighestCondition)
                {
                    m_cursor.fail("SASM-W5002", "Unknown jump condition " + hexByte(instruction.subtype) + ".", m_start);
                    return;
                }
                instruction.operands.push_back(mir::makeNumberOperand(m_cursor.number()));
                instruction.operands.push_back(mir::makeNumberOperand(m_cursor.number()));
                instruction.operands.push_back(decodeOperand(OperandSpec{OperandKind::Target}));
            }

            Operand decodeOperand(const OperandSpec& spec)
            {
                Operand operand;
                operand.kind = spec.kind;
                switch (spec.kind)
                {
                case OperandKind::Number:
                    operand.number = m_cursor.number();
                    break;
                case OperandKind::Register:
                    operand.reg = m_cursor.reg();
                    break;
                case OperandKind::Byte:
                case OperandKind::Flag:
                    operand.value = m_cursor.u8();
                    break;
                case OperandKind::MessageId:
                    operand.value = m_cursor.littleEndian(3);
                    break;
                case OperandKind::String:
                {
                    const std::uint32_t length = m_cursor.littleEndian(2);
                    for (std::uint32_t index = 0; index < length && !m_cursor.failed(); ++index)
                    {
                        operand.text.push_back(static_cast<char>(m_cursor.u8()));
                    }
                    // The stored length counts the terminator.
                    if (!operand.text.empty() && operand.text.back() == '\0')
                    {
                        operand.text.pop_back();
                    }
                    break;
                }
                case OperandKind::NumberList:
                {
                    const std::uint8_t count = m_cursor.u8();
                    for (std::uint8_t index = 0; index < count && !m_cursor.failed(); ++index)
                    {
                        operand.numbers.push_back(m_cursor.number());
                    }
                    break;
                }
                case OperandKind::RegisterList:
                {
                    const std::uint8_t count = m_cursor.u8();
                    for (std::uint8_t index = 0; index < count && !m_cursor.failed(); ++index)
                    {
                        operand.registers.push_back(m_cursor.reg());
                    }
                    break;
                }
                case OperandKind::BitmaskNumbers:
                {
                    const std::uint8_t mask = m_cursor.u8();
                    for (std::size_t slot = 0; slot < kBitmaskSlots; ++slot)
                    {
                        operand.numbers.push_back((mask & (1u << slot)) != 0 ? m_cursor.number() : NumberSpec::makeConstant(0));
                    }
                    break;
                }
                case OperandKind::Target:
                {
                    mir::CodeTarget target;
                    target.address = m_cursor.littleEndian(4);
                    operand.targets.push_back(target);
                    break;
                }
                case OperandKind::TargetTable:
                {
                    const std::uint32_t count = m_cursor.littleEndian(2);
                    for (std::uint32_t key = 0; key < count && !m_cursor.failed(); ++key)
                    {
                        mir::CodeTarget target;
                        target.address = m_cursor.littleEndian(4);
                        operand.keys.push_back(static_cast<std::int32_t>(key));
                        operand.targets.push_back(target);
                    }
                    break;
                }
                case OperandKind::PaddedNumberTable:
                {
                    const std::uint32_t count = m_cursor.littleEndian(2);
                    for (std::uint32_t index = 0; index < count && !m_cursor.failed(); ++index)
                    {
                        const std::size_t start = m_cursor.offset();
                        operand.numbers.push_back(m_cursor.number());
                        while (!m_cursor.failed() && m_cursor.offset() - start < kPaddedNumberWidth)
                        {
                            m_cursor.u8();
                        }
                    }
                    break;
                }
                case OperandKind::Expression:
                    operand.terms = decodeExpression();
                    break;
                case OperandKind::ByteList:
                    break;
                }
                return operand;
            }

            std::vector<ExpressionTerm> decodeExpression()
            {
                std::vector<ExpressionTerm> terms;
                const std::size_t start = m_cursor.offset();
                std::size_t depth = 0;
                while (!m_cursor.failed())
                {
                    const std::uint8_t code = m_cursor.u8();
                    if (m_cursor.failed() || code == common::kExpressionTerminator)
                    {
                        break;
                    }
                    if (!common::isValidTermCode(code))
                    {
                        m_cursor.fail("SASM-W5005", "Unknown expression term " + hexByte(code) + ".", m_cursor.offset() - 1);
                        break;
                    }

                    ExpressionTerm term;
                    term.kind = static_cast<ExpressionTermKind>(code);
                    if (term.kind == ExpressionTermKind::Push)
                    {
                        term.operand = m_cursor.number();
                    }

                    const std::size_t arity = common::termArity(term.kind);
                    if (depth < arity)
                    {
                        m_cursor.fail("SASM-W5005", "Expression pops more values than it pushed.", start);
                        break;
                    }
                    depth = depth - arity + 1;
                    terms.push_back(term);
                }

                if (!m_cursor.failed() && depth != 1)
                {
                    m_cursor.fail("SASM-W5005", "Expression must leave exactly one value.", start);
                }
                return terms;
            }

        private:
            Cursor m_cursor;
            std::size_t m_start;
        };
    } // namespace

    DecodeResult decodeInstruction(const std::vector<std::uint8_t>& code, std::size_t offset)
    {
        InstructionDecoder decoder{code, offset};
        return decoder.run();
    }

    std::optional<NumberSpec> decodeNumberSpec(const std::vector<std::uint8_t>& code, std::size_t& offset)
    {
        Cursor cursor{code, offset};
        const NumberSpec number = cursor.number();
        if (cursor.failed())
        {
            return std::nullopt;
        }
        offset = cursor.offset();
        return number;
    }
} // namespace sceneasm::disasm
