#include <gtest/gtest.h>

#include <vector>

#include "decoder.hpp"
#include "opcodes.hpp"

namespace sceneasm::disasm
{
namespace
{
    using Bytes = std::vector<std::uint8_t>;
    using common::Register;

    const Bytes kGreatestCommonDivisor{
        0x46, 0x01, 0xd1, 0x00, 0x0e, 0x00, 0x00, 0x00,
        0x41, 0x00, 0x01, 0x00, 0xd0,
        0x50,
        0x42, 0x00, 0x10, 0x00, 0xd0, 0x00, 0xd1, 0x05, 0xff,
        0x4f, 0x00, 0x00, 0x00, 0x00, 0x02, 0xd1, 0xd0,
        0x50};

    TEST(DecoderTest, DecodesEveryNumberForm)
    {
        const Bytes code{0x3f, 0x7f, 0x88, 0x00, 0x90, 0x1d, 0x4f, 0xa7, 0xff, 0xff, 0xff, 0xb5, 0xc1, 0x2c, 0xd3};
        std::size_t offset = 0;

        EXPECT_EQ(decodeNumberSpec(code, offset), NumberSpec::makeConstant(63));
        EXPECT_EQ(decodeNumberSpec(code, offset), NumberSpec::makeConstant(-1));
        EXPECT_EQ(decodeNumberSpec(code, offset), NumberSpec::makeConstant(-2048));
        EXPECT_EQ(decodeNumberSpec(code, offset), NumberSpec::makeConstant(7503));
        EXPECT_EQ(decodeNumberSpec(code, offset), NumberSpec::makeConstant(0x7ffffff));
        EXPECT_EQ(decodeNumberSpec(code, offset), NumberSpec::makeRegister(*Register::value(5)));
        EXPECT_EQ(decodeNumberSpec(code, offset), NumberSpec::makeRegister(*Register::value(300)));
        EXPECT_EQ(decodeNumberSpec(code, offset), NumberSpec::makeRegister(*Register::argument(3)));
        EXPECT_EQ(offset, code.size());
    }

    TEST(DecoderTest, RejectsInvalidAndTruncatedNumbers)
    {
        const Bytes invalid{0xe0};
        std::size_t offset = 0;
        EXPECT_FALSE(decodeNumberSpec(invalid, offset).has_value());
        EXPECT_EQ(offset, 0u);

        const Bytes truncated{0x90, 0x01};
        EXPECT_FALSE(decodeNumberSpec(truncated, offset).has_value());
        EXPECT_EQ(offset, 0u);
    }

    TEST(DecoderTest, DecodesConditionalJump)
    {
        const DecodeResult result = decodeInstruction(kGreatestCommonDivisor, 0);
        ASSERT_TRUE(result.succeeded());
        EXPECT_EQ(result.size, 8u);

        const mir::Instruction& jump = result.instruction;
        EXPECT_EQ(jump.opcode, mir::Opcode::JumpConditional);
        EXPECT_EQ(jump.subtype, static_cast<std::uint8_t>(mir::Condition::NotEqual));
        ASSERT_EQ(jump.operands.size(), 3u);
        EXPECT_EQ(jump.operands[0].number, NumberSpec::makeRegister(*Register::argument(1)));
        EXPECT_EQ(jump.operands[1].number, NumberSpec::makeConstant(0));
        EXPECT_EQ(jump.operands[2].targets.front().address, 14u);
    }

    TEST(DecoderTest, WalksAWholeFunction)
    {
        std::vector<mir::Opcode> opcodes;
        std::size_t offset = 0;
        while (offset < kGreatestCommonDivisor.size())
        {
            const DecodeResult result = decodeInstruction(kGreatestCommonDivisor, offset);
            ASSERT_TRUE(result.succeeded()) << "offset " << offset;
            opcodes.push_back(result.instruction.opcode);
            offset += result.size;
        }

        const std::vector<mir::Opcode> expected{mir::Opcode::JumpConditional, mir::Opcode::BinaryOperation,
            mir::Opcode::Return, mir::Opcode::Expression, mir::Opcode::Call, mir::Opcode::Return};
        EXPECT_EQ(opcodes, expected);
    }

    TEST(DecoderTest, DecodesExpressionTerms)
    {
        const DecodeResult result = decodeInstruction(kGreatestCommonDivisor, 14);
        ASSERT_TRUE(result.succeeded());
        EXPECT_EQ(result.size, 9u);

        const auto& terms = result.instruction.operands[1].terms;
        ASSERT_EQ(terms.size(), 3u);
        EXPECT_EQ(terms[0].operand, NumberSpec::makeRegister(*Register::argument(0)));
        EXPECT_EQ(terms[1].operand, NumberSpec::makeRegister(*Register::argument(1)));
        EXPECT_EQ(terms[2].kind, common::ExpressionTermKind::Modulo);
    }

    TEST(DecoderTest, DecodesMessageText)
    {
        const Bytes code{0x86, 0x4f, 0x1d, 0x00, 0x00, 0x03, 0x00, 'H', 'i', 0x00};
        const DecodeResult result = decodeInstruction(code, 0);
        ASSERT_TRUE(result.succeeded());
        EXPECT_EQ(result.size, code.size());
        ASSERT_EQ(result.instruction.operands.size(), 3u);
        EXPECT_EQ(result.instruction.operands[0].value, 7503u);
        EXPECT_EQ(result.instruction.operands[1].value, 0u);
        EXPECT_EQ(result.instruction.operands[2].text, "Hi");
    }

    TEST(DecoderTest, ReportsUnknownOpcodes)
    {
        const DecodeResult result = decodeInstruction(Bytes{0x50, 0x01}, 1);
        ASSERT_FALSE(result.succeeded());
        EXPECT_EQ(result.failure->code, "SASM-W5002");
        EXPECT_EQ(result.failure->offset, 1u);
    }

    TEST(DecoderTest, RefusesSelect)
    {
        const DecodeResult result = decodeInstruction(Bytes{0x8d, 0x00}, 0);
        ASSERT_FALSE(result.succeeded());
        EXPECT_EQ(result.failure->code, "SASM-W5006");
    }

    TEST(DecoderTest, ReportsTruncation)
    {
        const DecodeResult result = decodeInstruction(Bytes{0x47, 0x00, 0x00}, 0);
        ASSERT_FALSE(result.succeeded());
        EXPECT_EQ(result.failure->code, "SASM-W5001");
        EXPECT_EQ(result.failure->offset, 3u);
    }

    TEST(DecoderTest, ReportsUnbalancedExpressions)
    {
        const DecodeResult underflow = decodeInstruction(Bytes{0x42, 0x00, 0x00, 0x00, 0x01, 0x01, 0xff}, 0);
        ASSERT_FALSE(underflow.succeeded());
        EXPECT_EQ(underflow.failure->code, "SASM-W5005");

        const DecodeResult unknown = decodeInstruction(Bytes{0x42, 0x00, 0x00, 0x40, 0xff}, 0);
        ASSERT_FALSE(unknown.succeeded());
        EXPECT_EQ(unknown.failure->code, "SASM-W5005");
        EXPECT_EQ(unknown.failure->offset, 3u);
    }

    TEST(DecoderTest, ReportsUnknownConditions)
    {
        const DecodeResult result = decodeInstruction(Bytes{0x46, 0x09, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}, 0);
        ASSERT_FALSE(result.succeeded());
        EXPECT_EQ(result.failure->code, "SASM-W5002");
    }
} // namespace
} // namespace sceneasm::disasm
