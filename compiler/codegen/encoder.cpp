#include "encoder.hpp"

#include "../middle_ir/opcodes.hpp"

#include <algorithm>
#include <map>

namespace sceneasm::codegen
{
    namespace
    {
        using common::DiagnosticBag;
        using common::ExpressionTermKind;
        using mir::Instruction;
        using mir::Opcode;
        using mir::Operand;
        using mir::OperandKind;

        constexpr std::size_t kMaximumStringBytes = 0xfffe;
        constexpr std::size_t kPaddedNumberWidth = 4;

        bool fits(std::int32_t value, int bits)
        {
            const std::int32_t limit = 1 << (bits - 1);
            return value >= -limit && value < limit;
        }

        class UnitEncoder
        {
        public:
            explicit UnitEncoder(const mir::Unit& unit)
                : m_unit(unit)
            {
            }

            EncodedUnit run()
            {
                EncodedUnit encoded;
                encoded.name = m_unit.name;

                std::vector<std::uint32_t> offsets;
                offsets.reserve(m_unit.instructions.size() + 1);
                for (const auto& instruction : m_unit.instructions)
                {
                    offsets.push_back(static_cast<std::uint32_t>(m_writer.size()));
                    encodeInstruction(instruction);
                }
                offsets.push_back(static_cast<std::uint32_t>(m_writer.size()));

                for (const auto& label : m_unit.labels)
                {
                    const std::size_t index = std::min(label.instructionIndex, m_unit.instructions.size());
                    encoded.labels.push_back(EncodedLabel{label.name, offsets[index], label.span});
                }

                offsets.pop_back();
                encoded.instructionOffsets = std::move(offsets);
                encoded.bytes = m_writer.take();
                encoded.relocations = std::move(m_relocations);
                encoded.diagnostics = m_diagnostics.take();
                return encoded;
            }

        private:
            void encodeInstruction(const Instruction& instruction)
            {
                const mir::OpcodeInfo* info = mir::findForInstruction(instruction);
                // SELECT is listed by the VM but refused in both directions.
                if (info == nullptr || instruction.opcode == Opcode::Select)
                {
                    m_diagnostics.error("SASM-E4005", "Opcode has no encoding in this VM.", instruction.span);
                    return;
                }

                if (instruction.opcode != Opcode::RawData)
                {
                    m_writer.writeU8(static_cast<std::uint8_t>(instruction.opcode));
                }
                if (info->layout != mir::OperandLayout::Plain)
                {
                    m_writer.writeU8(instruction.subtype);
                }

                for (const auto& operand : instruction.operands)
                {
                    encodeOperand(operand);
                }
            }

            void encodeOperand(const Operand& operand)
            {
                switch (operand.kind)
                {
                case OperandKind::Number:
                    writeNumber(operand.number, operand.span);
                    break;
                case OperandKind::Register:
                    m_writer.writeU16(operand.reg.raw());
                    break;
                case OperandKind::Byte:
                case OperandKind::Flag:
                    m_writer.writeU8(static_cast<std::uint8_t>(operand.value));
                    break;
                case OperandKind::MessageId:
                    m_writer.writeU24(operand.value);
                    break;
                case OperandKind::String:
                    writeString(operand);
                    break;
                case OperandKind::NumberList:
                    m_writer.writeU8(static_cast<std::uint8_t>(operand.numbers.size()));
                    for (const auto& number : operand.numbers)
                    {
                        writeNumber(number, operand.span);
                    }
                    break;
                case OperandKind::RegisterList:
                    m_writer.writeU8(static_cast<std::uint8_t>(operand.registers.size()));
                    for (const auto reg : operand.registers)
                    {
                        m_writer.writeU16(reg.raw());
                    }
                    break;
                case OperandKind::BitmaskNumbers:
                    writeBitmask(operand);
                    break;
                case OperandKind::Target:
                    for (const auto& target : operand.targets)
                    {
                        writeTarget(target);
                    }
                    break;
                case OperandKind::TargetTable:
                    writeTargetTable(operand);
                    break;
                case OperandKind::PaddedNumberTable:
                    m_writer.writeU16(static_cast<std::uint16_t>(operand.numbers.size()));
                    for (const auto& number : operand.numbers)
                    {
                        const std::size_t before = m_writer.size();
                        writeNumber(number, operand.span);
                        m_writer.writeZeros(kPaddedNumberWidth - std::min(kPaddedNumberWidth, m_writer.size() - before));
                    }
                    break;
                case OperandKind::Expression:
                    for (const auto& term : operand.terms)
                    {
                        m_writer.writeU8(static_cast<std::uint8_t>(term.kind));
                        if (term.kind == ExpressionTermKind::Push)
                        {
                            writeNumber(term.operand, operand.span);
                        }
                    }
                    m_writer.writeU8(common::kExpressionTerminator);
                    break;
                case OperandKind::ByteList:
                    m_writer.writeBytes(operand.bytes);
                    break;
                }
            }

            void writeNumber(const NumberSpec& number, SourceSpan span)
            {
                if (const auto bytes = encodeNumberSpec(number))
                {
                    m_writer.writeBytes(*bytes);
                    return;
                }

                if (number.isConstant())
                {
                    m_diagnostics.error("SASM-E4001",
                        "Constant " + std::to_string(number.constant) + " does not fit in a 28-bit number operand.", span);
                }
                else
                {
                    m_diagnostics.error("SASM-E4002",
                        "Register " + number.reg.toString() + " cannot be encoded in a number operand.", span);
                }
                m_writer.writeU8(0);
            }

            void writeString(const Operand& operand)
            {
                if (operand.text.size() > kMaximumStringBytes)
                {
                    m_diagnostics.error("SASM-E4004",
                        "String of " + std::to_string(operand.text.size()) + " bytes is too long to encode.", operand.span);
                    return;
                }
                m_writer.writeU16(static_cast<std::uint16_t>(operand.text.size() + 1));
                for (const char ch : operand.text)
                {
                    m_writer.writeU8(static_cast<std::uint8_t>(ch));
                }
                m_writer.writeU8(0);
            }

            void writeBitmask(const Operand& operand)
            {
                std::uint8_t mask = 0;
                for (std::size_t slot = 0; slot < operand.numbers.size() && slot < 8; ++slot)
                {
                    if (operand.numbers[slot] != NumberSpec::makeConstant(0))
                    {
                        mask = static_cast<std::uint8_t>(mask | (1u << slot));
                    }
                }

                m_writer.writeU8(mask);
                for (std::size_t slot = 0; slot < operand.numbers.size() && slot < 8; ++slot)
                {
                    if ((mask & (1u << slot)) != 0)
                    {
                        writeNumber(operand.numbers[slot], operand.span);
                    }
                }
            }

            void writeTarget(const mir::CodeTarget& target)
            {
                if (target.isSymbolic())
                {
                    Relocation relocation;
                    relocation.kind = Relocation::Kind::Symbol;
                    relocation.offset = m_writer.size();
                    relocation.symbol = target.symbol;
                    relocation.span = target.span;
                    m_relocations.push_back(std::move(relocation));
                    m_writer.writeU32(0);
                    return;
                }
                m_writer.writeU32(target.address);
            }

            void writeTargetTable(const Operand& operand)
            {
                // Dense table indexed by key; the first case for a key wins.
                std::map<std::int32_t, const mir::CodeTarget*> cases;
                for (std::size_t index = 0; index < operand.targets.size() && index < operand.keys.size(); ++index)
                {
                    const std::int32_t key = operand.keys[index];
                    if (!cases.emplace(key, &operand.targets[index]).second)
                    {
                        m_diagnostics.warning("SASM-W4003",
                            "Case " + std::to_string(key) + " is already handled; this entry is ignored.",
                            operand.targets[index].span);
                    }
                }

                const std::size_t count = cases.empty() ? 0 : static_cast<std::size_t>(cases.rbegin()->first) + 1;
                m_writer.writeU16(static_cast<std::uint16_t>(count));

                // Missing keys fall through to the next instruction.
                const std::uint32_t fallthrough = static_cast<std::uint32_t>(m_writer.size() + count * 4);
                for (std::size_t key = 0; key < count; ++key)
                {
                    const auto found = cases.find(static_cast<std::int32_t>(key));
                    if (found != cases.end())
                    {
                        writeTarget(*found->second);
                        continue;
                    }

                    Relocation relocation;
                    relocation.kind = Relocation::Kind::UnitOffset;
                    relocation.offset = m_writer.size();
                    relocation.unitOffset = fallthrough;
                    relocation.span = operand.span;
                    m_relocations.push_back(std::move(relocation));
                    m_writer.writeU32(0);
                }
            }

        private:
            const mir::Unit& m_unit;
            ByteWriter m_writer;
            std::vector<Relocation> m_relocations;
            DiagnosticBag m_diagnostics;
        };
    } // namespace

    std::optional<std::vector<std::uint8_t>> encodeNumberSpec(const NumberSpec& number)
    {
        if (!number.isConstant())
        {
            const std::uint16_t index = number.reg.index();
            if (number.reg.isArgument())
            {
                if (index > 0xf)
                {
                    return std::nullopt;
                }
                return std::vector<std::uint8_t>{static_cast<std::uint8_t>(0xd0 | index)};
            }
            if (index <= 0xf)
            {
                return std::vector<std::uint8_t>{static_cast<std::uint8_t>(0xb0 | index)};
            }
            return std::vector<std::uint8_t>{
                static_cast<std::uint8_t>(0xc0 | ((index >> 8) & 0xf)),
                static_cast<std::uint8_t>(index & 0xff)};
        }

        const std::int32_t value = number.constant;
        const std::uint32_t bits = static_cast<std::uint32_t>(value);
        if (fits(value, 7))
        {
            return std::vector<std::uint8_t>{static_cast<std::uint8_t>(bits & 0x7f)};
        }
        if (fits(value, 12))
        {
            return std::vector<std::uint8_t>{
                static_cast<std::uint8_t>(0x80 | ((bits >> 8) & 0xf)),
                static_cast<std::uint8_t>(bits & 0xff)};
        }
        if (fits(value, 20))
        {
            return std::vector<std::uint8_t>{
                static_cast<std::uint8_t>(0x90 | ((bits >> 16) & 0xf)),
                static_cast<std::uint8_t>((bits >> 8) & 0xff),
                static_cast<std::uint8_t>(bits & 0xff)};
        }
        if (fits(value, 28))
        {
            return std::vector<std::uint8_t>{
                static_cast<std::uint8_t>(0xa0 | ((bits >> 24) & 0xf)),
                static_cast<std::uint8_t>((bits >> 16) & 0xff),
                static_cast<std::uint8_t>((bits >> 8) & 0xff),
                static_cast<std::uint8_t>(bits & 0xff)};
        }
        return std::nullopt;
    }

    EncodedUnit encodeUnit(const mir::Unit& unit)
    {
        UnitEncoder encoder{unit};
        return encoder.run();
    }
} // namespace sceneasm::codegen
