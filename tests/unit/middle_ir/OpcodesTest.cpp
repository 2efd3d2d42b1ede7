#include <gtest/gtest.h>

#include <cctype>
#include <set>
#include <string>

#include "opcodes.hpp"

namespace sceneasm::mir
{
namespace
{
    TEST(OpcodesTest, FindsMnemonicsIgnoringCase)
    {
        const OpcodeInfo* upper = findByMnemonic("MSGSET");
        const OpcodeInfo* lower = findByMnemonic("msgset");
        ASSERT_NE(upper, nullptr);
        EXPECT_EQ(upper, lower);
        EXPECT_EQ(upper->opcode, Opcode::MessageSet);
        EXPECT_EQ(findByMnemonic("frobnicate"), nullptr);
    }

    TEST(OpcodesTest, MnemonicsAreUnique)
    {
        std::set<std::string> seen;
        for (const auto& info : opcodeTable())
        {
            std::string folded{info.mnemonic};
            for (auto& ch : folded)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            EXPECT_TRUE(seen.insert(folded).second) << "duplicate mnemonic " << info.mnemonic;
        }
    }

    TEST(OpcodesTest, SelectsTypedEntriesBySubtype)
    {
        const OpcodeInfo* add = findByOpcode(Opcode::BinaryOperation, 2 | kExplicitOperandBit);
        ASSERT_NE(add, nullptr);
        EXPECT_EQ(add->mnemonic, "add");
        EXPECT_EQ(add->layout, OperandLayout::TypedOptional);

        const OpcodeInfo* abs = findByOpcode(Opcode::UnaryOperation, 3);
        ASSERT_NE(abs, nullptr);
        EXPECT_EQ(abs->mnemonic, "abs");

        EXPECT_EQ(findByOpcode(Opcode::BinaryOperation, 0x7f), nullptr);
    }

    TEST(OpcodesTest, DescribesFlagOperands)
    {
        const OpcodeInfo* message = findByMnemonic("MSGSET");
        ASSERT_NE(message, nullptr);
        ASSERT_EQ(message->operands.size(), 3u);
        EXPECT_EQ(message->operands[1].kind, OperandKind::Flag);
        EXPECT_EQ(message->operands[1].flagName, "nowait");
        EXPECT_EQ(message->operands[1].flagDefault, 1);

        const OpcodeInfo* wait = findByMnemonic("WAIT");
        ASSERT_NE(wait, nullptr);
        EXPECT_EQ(wait->operands[0].flagName, "interruptable");
        EXPECT_EQ(wait->operands[0].flagDefault, 0);
    }

    TEST(OpcodesTest, ConditionalJumpHasItsOwnLayout)
    {
        const OpcodeInfo* jump = findByMnemonic("jc");
        ASSERT_NE(jump, nullptr);
        EXPECT_EQ(jump->opcode, Opcode::JumpConditional);
        EXPECT_EQ(jump->layout, OperandLayout::Conditional);
        EXPECT_EQ(conditionOperator(Condition::GreaterOrEqual), ">=");
    }

    TEST(OpcodesTest, RawDataIsNotAMachineOpcode)
    {
        const OpcodeInfo* raw = findByMnemonic("db");
        ASSERT_NE(raw, nullptr);
        EXPECT_EQ(raw->opcode, Opcode::RawData);
    }

    TEST(OpcodesTest, ReportsControlFlowEnds)
    {
        EXPECT_TRUE(endsControlFlow(Opcode::Jump));
        EXPECT_TRUE(endsControlFlow(Opcode::Return));
        EXPECT_TRUE(endsControlFlow(Opcode::Retsub));
        EXPECT_FALSE(endsControlFlow(Opcode::JumpConditional));
        EXPECT_FALSE(endsControlFlow(Opcode::Call));
    }
} // namespace
} // namespace sceneasm::mir
