#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "disassembler.hpp"
#include "compilation_session.hpp"

namespace
{
    std::vector<std::uint8_t> assembleOrFail(const std::string& source, std::uint32_t baseAddress = 0)
    {
        sceneasm::pipeline::AssemblyOptions options;
        options.baseAddress = baseAddress;
        options.jobs = 1;
        const auto result = sceneasm::pipeline::assemble(source, options);
        EXPECT_TRUE(result.succeeded()) << "Assembly failed for:\n" << source;
        return result.code;
    }
}

namespace sceneasm::disasm
{
namespace
{
    using Bytes = std::vector<std::uint8_t>;

    TEST(DisassemblerTest, RecursiveFunctionReassemblesToTheSameBytes)
    {
        const std::string source =
            "function GCD($a, $b)\n"
            "    jc $b != 0, _RECUR\n"
            "    mov $v1, $a\n"
            "    return\n"
            "_RECUR:\n"
            "    exp $a, $a mod $b\n"
            "    call GCD, $b, $a\n"
            "endfun\n";

        const Bytes code = assembleOrFail(source);
        ASSERT_EQ(code.size(), 32u);

        const DisassemblyResult result = disassemble(code);
        EXPECT_TRUE(result.diagnostics.empty());
        EXPECT_EQ(result.instructionCount, 6u);
        EXPECT_EQ(result.rawByteCount, 0u);
        EXPECT_EQ(result.text.rfind("// base 0x00000000, entry 0x00000000\nENTRY:\n", 0), 0u);
        EXPECT_NE(result.text.find("L_0000000e:\n"), std::string::npos);

        EXPECT_EQ(assembleOrFail(result.text), code);
    }

    TEST(DisassemblerTest, JumpTableReassemblesToTheSameBytes)
    {
        const std::string source =
            "START:\n"
            "    jt $v0, { 0 => SNR_0, 1 => SNR_1 }\n"
            "    EXIT 0, 0\n"
            "SNR_0:\n"
            "    EXIT 0, 0\n"
            "SNR_1:\n"
            "    EXIT 0, 0\n";

        const Bytes code = assembleOrFail(source, 0x4000);
        const DisassemblyResult result = disassemble(code, DisassemblyOptions{0x4000, std::nullopt});
        EXPECT_TRUE(result.diagnostics.empty());
        EXPECT_EQ(result.rawByteCount, 0u);
        EXPECT_NE(result.text.find("L_0000400f:\n"), std::string::npos);
        EXPECT_NE(result.text.find("L_00004012:\n"), std::string::npos);

        EXPECT_EQ(assembleOrFail(result.text, 0x4000), code);
    }

    TEST(DisassemblerTest, KeepsMessageTextAndFlags)
    {
        const std::string source =
            "START:\n"
            "    MSGSET 7503, \"Say \\\"hi\\\"\", nowait\n"
            "    MSGSET 7504, \"Bye\"\n";

        const Bytes code = assembleOrFail(source);
        const DisassemblyResult result = disassemble(code);
        EXPECT_EQ(result.instructionCount, 2u);
        EXPECT_NE(result.text.find("MSGSET 7503, \"Say \\\"hi\\\"\", nowait\n"), std::string::npos);
        EXPECT_NE(result.text.find("MSGSET 7504, \"Bye\"\n"), std::string::npos);

        EXPECT_EQ(assembleOrFail(result.text), code);
    }

    TEST(DisassemblerTest, PlacesEntryLabelAwayFromTheBase)
    {
        const Bytes code{0x49, 0x49, 0x49, 0x49};
        const DisassemblyResult result = disassemble(code, DisassemblyOptions{0x1000, 0x1003});

        EXPECT_EQ(result.text,
            "// base 0x00001000, entry 0x00001003\n"
            "L_00001000:\n"
            "    retsub\n"
            "    retsub\n"
            "    retsub\n"
            "ENTRY:\n"
            "    retsub\n");
        EXPECT_EQ(result.instructionCount, 4u);
    }

    TEST(DisassemblerTest, EmitsUndecodableBytesAsData)
    {
        const Bytes code{0x01, 0x02, 0x50};
        const DisassemblyResult result = disassemble(code);

        EXPECT_EQ(result.text,
            "// base 0x00000000, entry 0x00000000\n"
            "ENTRY:\n"
            "    db 0x01, 0x02\n"
            "    return\n");
        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.diagnostics.front().code, "SASM-W5002");
        EXPECT_EQ(result.rawByteCount, 2u);
        EXPECT_EQ(result.instructionCount, 1u);

        EXPECT_EQ(assembleOrFail(result.text), code);
    }

    TEST(DisassemblerTest, WarnsOncePerUndecodableRun)
    {
        const Bytes code{0x01, 0x02, 0x49, 0x03, 0x04};
        const DisassemblyResult result = disassemble(code);
        EXPECT_EQ(result.diagnostics.size(), 2u);
        EXPECT_EQ(result.rawByteCount, 4u);
    }

    TEST(DisassemblerTest, SplitsLongDataRuns)
    {
        const Bytes code(20, 0x01);
        const DisassemblyResult result = disassemble(code);

        const std::string sixteen =
            "    db 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01\n";
        EXPECT_EQ(result.text, "// base 0x00000000, entry 0x00000000\nENTRY:\n" + sixteen + "    db 0x01, 0x01, 0x01, 0x01\n");
        EXPECT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.rawByteCount, 20u);
    }

    TEST(DisassemblerTest, KeepsNonCanonicalEncodingsAsAnnotatedData)
    {
        // mov $v0, 1 with the constant in the 12-bit form.
        const Bytes code{0x41, 0x00, 0x00, 0x00, 0x80, 0x01};
        const DisassemblyResult result = disassemble(code);

        EXPECT_EQ(result.text,
            "// base 0x00000000, entry 0x00000000\n"
            "ENTRY:\n"
            "    db 0x41, 0x00, 0x00, 0x00, 0x80, 0x01 // mov $v0, 1\n");
        EXPECT_TRUE(result.diagnostics.empty());
        EXPECT_EQ(result.instructionCount, 0u);
        EXPECT_EQ(result.rawByteCount, 6u);

        EXPECT_EQ(assembleOrFail(result.text), code);
    }

    TEST(DisassemblerTest, EmptyBlockStillHasAnEntry)
    {
        const DisassemblyResult result = disassemble(Bytes{});
        EXPECT_EQ(result.text, "// base 0x00000000, entry 0x00000000\nENTRY:\n");
        EXPECT_EQ(result.instructionCount, 0u);
    }

    TEST(DisassemblerTest, NamesLabelsAfterTheirAddress)
    {
        EXPECT_EQ(labelName(0), "L_00000000");
        EXPECT_EQ(labelName(0x1f), "L_0000001f");
        EXPECT_EQ(labelName(0xdeadbeef), "L_deadbeef");
    }
} // namespace
} // namespace sceneasm::disasm
