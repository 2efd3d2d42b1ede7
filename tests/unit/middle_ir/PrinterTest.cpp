#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "builder.hpp"
#include "opcodes.hpp"
#include "printer.hpp"

namespace sceneasm::mir
{
namespace
{
    using common::ExpressionTermKind;

    ExpressionTerm push(NumberSpec operand)
    {
        return ExpressionTerm{ExpressionTermKind::Push, operand};
    }

    ExpressionTerm op(ExpressionTermKind kind)
    {
        return ExpressionTerm{kind, {}};
    }

    TEST(PrinterTest, FormatsNestedExpressions)
    {
        const std::vector<ExpressionTerm> terms{
            push(NumberSpec::makeRegister(*Register::value(0))),
            push(NumberSpec::makeConstant(1)),
            op(ExpressionTermKind::Add),
            push(NumberSpec::makeConstant(2)),
            op(ExpressionTermKind::Multiply),
        };

        const auto text = formatExpression(terms);
        ASSERT_TRUE(text.has_value());
        EXPECT_EQ(*text, "($v0 + 1) * 2");
    }

    TEST(PrinterTest, FormatsIntrinsicsInSourceOrder)
    {
        const std::vector<ExpressionTerm> select{
            push(NumberSpec::makeConstant(20)),
            push(NumberSpec::makeConstant(10)),
            push(NumberSpec::makeRegister(*Register::argument(0))),
            op(ExpressionTermKind::Select),
        };
        EXPECT_EQ(formatExpression(select), std::optional<std::string>{"select($a0, 10, 20)"});

        const std::vector<ExpressionTerm> minimum{
            push(NumberSpec::makeConstant(1)),
            push(NumberSpec::makeConstant(2)),
            op(ExpressionTermKind::Min),
        };
        EXPECT_EQ(formatExpression(minimum), std::optional<std::string>{"min(1, 2)"});
    }

    TEST(PrinterTest, RejectsUnbalancedTermLists)
    {
        EXPECT_FALSE(formatExpression({op(ExpressionTermKind::Add)}).has_value());
        EXPECT_FALSE(formatExpression({push(NumberSpec::makeConstant(1)), push(NumberSpec::makeConstant(2))}).has_value());
    }

    TEST(PrinterTest, PlacesFlagsAfterPositionalOperands)
    {
        Instruction message;
        message.opcode = Opcode::MessageSet;
        message.operands.push_back(makeByteOperand(OperandKind::MessageId, 7503));
        message.operands.push_back(makeByteOperand(OperandKind::Flag, 0));
        Operand text;
        text.kind = OperandKind::String;
        text.text = "Say \"hi\"";
        message.operands.push_back(text);

        EXPECT_EQ(formatInstruction(message), "MSGSET 7503, \"Say \\\"hi\\\"\", nowait");

        message.operands[1].value = 1;
        EXPECT_EQ(formatInstruction(message), "MSGSET 7503, \"Say \\\"hi\\\"\"");
    }

    TEST(PrinterTest, FormatsConditionalJumps)
    {
        Instruction jump;
        jump.opcode = Opcode::JumpConditional;
        jump.subtype = static_cast<std::uint8_t>(Condition::BitSet) | kNegatedConditionBit;
        jump.operands.push_back(makeNumberOperand(NumberSpec::makeRegister(*Register::value(4))));
        jump.operands.push_back(makeNumberOperand(NumberSpec::makeConstant(3)));
        jump.operands.push_back(makeTargetOperand(CodeTarget{{}, 0x1f, {}}));

        EXPECT_EQ(formatInstruction(jump), "jc !($v4 & (1 << 3)), 0x1f");
    }

    TEST(PrinterTest, FormatsRawBytesAndBitmasks)
    {
        Instruction raw;
        raw.opcode = Opcode::RawData;
        Operand bytes;
        bytes.kind = OperandKind::ByteList;
        bytes.bytes = {0x01, 0xff};
        raw.operands.push_back(bytes);
        EXPECT_EQ(formatInstruction(raw), "db 0x01, 0xff");

        Operand mask;
        mask.kind = OperandKind::BitmaskNumbers;
        mask.numbers.assign(8, NumberSpec::makeConstant(0));
        mask.numbers[0] = NumberSpec::makeConstant(1);
        mask.numbers[1] = NumberSpec::makeRegister(*Register::value(2));

        Instruction wipe;
        wipe.opcode = static_cast<Opcode>(0x8e);
        wipe.operands.push_back(makeNumberOperand(NumberSpec::makeConstant(1)));
        wipe.operands.push_back(makeNumberOperand(NumberSpec::makeConstant(2)));
        wipe.operands.push_back(makeNumberOperand(NumberSpec::makeConstant(3)));
        wipe.operands.push_back(mask);
        EXPECT_EQ(formatInstruction(wipe), "WIPE 1, 2, 3, [1, $v2]");
    }

    TEST(PrinterTest, PrintsUnitsWithLabels)
    {
        Unit unit;
        unit.kind = UnitKind::Subroutine;
        unit.name = "SUB";

        Builder builder{unit};
        builder.placeLabel("SUB");
        Instruction& jump = builder.appendInstruction(Opcode::Jump);
        jump.operands.push_back(makeTargetOperand(CodeTarget{"DONE", 0, {}}));
        builder.placeLabel("DONE");
        builder.appendInstruction(Opcode::Retsub);
        EXPECT_EQ(builder.instructionCount(), 2u);

        std::ostringstream stream;
        print(unit, stream);
        EXPECT_EQ(stream.str(),
            "subroutine SUB\n"
            "  SUB:\n"
            "    j DONE\n"
            "  DONE:\n"
            "    retsub\n");
    }
} // namespace
} // namespace sceneasm::mir
