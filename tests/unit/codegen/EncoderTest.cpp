#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "encoder.hpp"
#include "builder.hpp"
#include "opcodes.hpp"

namespace sceneasm::codegen
{
namespace
{
    using Bytes = std::vector<std::uint8_t>;

    std::optional<Bytes> constant(std::int32_t value)
    {
        return encodeNumberSpec(NumberSpec::makeConstant(value));
    }

    TEST(EncoderTest, PicksTheShortestConstantForm)
    {
        EXPECT_EQ(constant(0), std::optional<Bytes>(Bytes{0x00}));
        EXPECT_EQ(constant(63), std::optional<Bytes>(Bytes{0x3f}));
        EXPECT_EQ(constant(-1), std::optional<Bytes>(Bytes{0x7f}));
        EXPECT_EQ(constant(-64), std::optional<Bytes>(Bytes{0x40}));
        EXPECT_EQ(constant(64), std::optional<Bytes>(Bytes{0x80, 0x40}));
        EXPECT_EQ(constant(2047), std::optional<Bytes>(Bytes{0x87, 0xff}));
        EXPECT_EQ(constant(-2048), std::optional<Bytes>(Bytes{0x88, 0x00}));
        EXPECT_EQ(constant(2048), std::optional<Bytes>(Bytes{0x90, 0x08, 0x00}));
        EXPECT_EQ(constant(7503), std::optional<Bytes>(Bytes{0x90, 0x1d, 0x4f}));
        EXPECT_EQ(constant(0x7ffffff), std::optional<Bytes>(Bytes{0xa7, 0xff, 0xff, 0xff}));
    }

    TEST(EncoderTest, RejectsConstantsWiderThan28Bits)
    {
        EXPECT_FALSE(constant(0x8000000).has_value());
        EXPECT_FALSE(constant(-0x8000001).has_value());
    }

    TEST(EncoderTest, EncodesRegisterReferences)
    {
        const auto low = encodeNumberSpec(NumberSpec::makeRegister(*common::Register::value(5)));
        EXPECT_EQ(low, std::optional<Bytes>(Bytes{0xb5}));

        const auto wide = encodeNumberSpec(NumberSpec::makeRegister(*common::Register::value(0x12c)));
        EXPECT_EQ(wide, std::optional<Bytes>(Bytes{0xc1, 0x2c}));

        const auto argument = encodeNumberSpec(NumberSpec::makeRegister(*common::Register::argument(3)));
        EXPECT_EQ(argument, std::optional<Bytes>(Bytes{0xd3}));

        EXPECT_FALSE(encodeNumberSpec(NumberSpec::makeRegister(*common::Register::argument(16))).has_value());
    }

    TEST(EncoderTest, RecordsLabelsAndRelocations)
    {
        mir::Unit unit;
        unit.name = "START";
        mir::Builder builder{unit};
        builder.placeLabel("START");
        mir::Instruction& jump = builder.appendInstruction(mir::Opcode::Jump);
        jump.operands.push_back(mir::makeTargetOperand(mir::CodeTarget{"ELSEWHERE", 0, {}}));
        builder.placeLabel("AFTER");
        builder.appendInstruction(mir::Opcode::Retsub);

        const EncodedUnit encoded = encodeUnit(unit);
        EXPECT_TRUE(encoded.diagnostics.empty());
        EXPECT_EQ(encoded.bytes, (Bytes{0x47, 0x00, 0x00, 0x00, 0x00, 0x49}));
        EXPECT_EQ(encoded.instructionOffsets, (std::vector<std::uint32_t>{0, 5}));

        ASSERT_EQ(encoded.labels.size(), 2u);
        EXPECT_EQ(encoded.labels[1].name, "AFTER");
        EXPECT_EQ(encoded.labels[1].offset, 5u);

        ASSERT_EQ(encoded.relocations.size(), 1u);
        EXPECT_EQ(encoded.relocations[0].kind, Relocation::Kind::Symbol);
        EXPECT_EQ(encoded.relocations[0].offset, 1u);
        EXPECT_EQ(encoded.relocations[0].symbol, "ELSEWHERE");
    }

    TEST(EncoderTest, PadsGetTableEntries)
    {
        mir::Unit unit;
        mir::Builder builder{unit};
        mir::Instruction& table = builder.appendInstruction(mir::Opcode::GetTable);
        table.operands.push_back(mir::makeRegisterOperand(*common::Register::value(0)));
        table.operands.push_back(mir::makeNumberOperand(NumberSpec::makeConstant(1)));
        mir::Operand entries;
        entries.kind = mir::OperandKind::PaddedNumberTable;
        entries.numbers = {NumberSpec::makeConstant(1), NumberSpec::makeConstant(300)};
        table.operands.push_back(entries);

        const EncodedUnit encoded = encodeUnit(unit);
        const Bytes expected{
            0x44, 0x00, 0x00, 0x01, 0x02, 0x00,
            0x01, 0x00, 0x00, 0x00,
            0x81, 0x2c, 0x00, 0x00};
        EXPECT_EQ(encoded.bytes, expected);
    }

    TEST(EncoderTest, WritesBitmaskOfNonZeroSlots)
    {
        mir::Unit unit;
        mir::Builder builder{unit};
        mir::Instruction& wipe = builder.appendInstruction(static_cast<mir::Opcode>(0x8e));
        for (std::int32_t value = 1; value <= 3; ++value)
        {
            wipe.operands.push_back(mir::makeNumberOperand(NumberSpec::makeConstant(value)));
        }
        mir::Operand mask;
        mask.kind = mir::OperandKind::BitmaskNumbers;
        mask.numbers.assign(8, NumberSpec::makeConstant(0));
        mask.numbers[1] = NumberSpec::makeConstant(5);
        mask.numbers[3] = NumberSpec::makeRegister(*common::Register::value(1));
        wipe.operands.push_back(mask);

        const EncodedUnit encoded = encodeUnit(unit);
        EXPECT_EQ(encoded.bytes, (Bytes{0x8e, 0x01, 0x02, 0x03, 0x0a, 0x05, 0xb1}));
    }

    TEST(EncoderTest, ReportsUnencodableOperands)
    {
        mir::Unit unit;
        mir::Builder builder{unit};
        mir::Instruction& move = builder.appendInstruction(mir::Opcode::BinaryOperation);
        move.operands.push_back(mir::makeRegisterOperand(*common::Register::value(0)));
        move.operands.push_back(mir::makeNumberOperand(NumberSpec::makeConstant(0x10000000)));
        builder.appendInstruction(mir::Opcode::Select);

        const EncodedUnit encoded = encodeUnit(unit);
        ASSERT_EQ(encoded.diagnostics.size(), 2u);
        EXPECT_EQ(encoded.diagnostics[0].code, "SASM-E4001");
        EXPECT_EQ(encoded.diagnostics[1].code, "SASM-E4005");
    }
} // namespace
} // namespace sceneasm::codegen
