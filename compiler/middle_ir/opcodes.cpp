#include "opcodes.hpp"

#include <algorithm>
#include <cctype>

namespace sceneasm::mir
{
    namespace
    {
        constexpr OperandSpec kNumber{OperandKind::Number};
        constexpr OperandSpec kRegister{OperandKind::Register};
        constexpr OperandSpec kByte{OperandKind::Byte};
        constexpr OperandSpec kString{OperandKind::String};
        constexpr OperandSpec kNumberList{OperandKind::NumberList};
        constexpr OperandSpec kBitmask{OperandKind::BitmaskNumbers};
        constexpr OperandSpec kTarget{OperandKind::Target};

        std::vector<OperandSpec> numbers(std::size_t count)
        {
            return std::vector<OperandSpec>(count, kNumber);
        }

        OpcodeInfo command(std::uint8_t opcode, std::string_view mnemonic, std::vector<OperandSpec> operands)
        {
            OpcodeInfo info;
            info.opcode = static_cast<Opcode>(opcode);
            info.mnemonic = mnemonic;
            info.operands = std::move(operands);
            return info;
        }

        OpcodeInfo typed(Opcode opcode, std::string_view mnemonic, std::uint8_t subtype, std::vector<OperandSpec> operands)
        {
            OpcodeInfo info;
            info.opcode = opcode;
            info.mnemonic = mnemonic;
            info.layout = OperandLayout::TypedOptional;
            info.subtype = subtype;
            info.operands = std::move(operands);
            return info;
        }

        std::vector<OpcodeInfo> buildTable()
        {
            std::vector<OpcodeInfo> table;

            const std::string_view unaryNames[] = {"zero", "not16", "neg", "abs"};
            for (std::uint8_t index = 0; index < std::size(unaryNames); ++index)
            {
                table.push_back(typed(Opcode::UnaryOperation, unaryNames[index], index, {kRegister, kNumber}));
            }

            const std::string_view binaryNames[] = {
                "mov", "bzero", "add", "sub", "mul", "div", "mod", "and", "or",
                "xor", "shl", "shr", "mulf", "divf", "atan2", "setbit", "clearbit", "bitscan"};
            for (std::uint8_t index = 0; index < std::size(binaryNames); ++index)
            {
                table.push_back(typed(Opcode::BinaryOperation, binaryNames[index], index, {kRegister, kNumber, kNumber}));
            }

            table.push_back(command(0x42, "exp", {kRegister, {OperandKind::Expression}}));
            table.push_back(command(0x44, "gt", {kRegister, kNumber, {OperandKind::PaddedNumberTable}}));

            OpcodeInfo conditional = command(0x46, "jc", {kNumber, kNumber, kTarget});
            conditional.layout = OperandLayout::Conditional;
            table.push_back(std::move(conditional));

            table.push_back(command(0x47, "j", {kTarget}));
            table.push_back(command(0x48, "gosub", {kTarget}));
            table.push_back(command(0x49, "retsub", {}));
            table.push_back(command(0x4a, "jt", {kNumber, {OperandKind::TargetTable}}));
            table.push_back(command(0x4c, "rnd", {kRegister, kNumber, kNumber}));
            table.push_back(command(0x4d, "push", {kNumberList}));
            table.push_back(command(0x4e, "pop", {{OperandKind::RegisterList}}));
            table.push_back(command(0x4f, "call", {kTarget, kNumberList}));
            table.push_back(command(0x50, "return", {}));

            table.push_back(command(0x00, "EXIT", {kByte, kNumber}));
            table.push_back(command(0x81, "SGET", {kRegister, kNumber}));
            table.push_back(command(0x82, "SSET", numbers(2)));
            table.push_back(command(0x83, "WAIT", {{OperandKind::Flag, "interruptable", 0}, kNumber}));
            table.push_back(command(0x85, "MSGINIT", numbers(1)));
            table.push_back(command(0x86, "MSGSET", {{OperandKind::MessageId}, {OperandKind::Flag, "nowait", 1}, kString}));
            table.push_back(command(0x87, "MSGWAIT", numbers(1)));
            table.push_back(command(0x88, "MSGSIGNAL", {}));
            table.push_back(command(0x89, "MSGSYNC", numbers(2)));
            table.push_back(command(0x8a, "MSGCLOSE", {{OperandKind::Flag, "nowait", 1}}));
            table.push_back(command(0x8e, "WIPE", {kNumber, kNumber, kNumber, kBitmask}));
            table.push_back(command(0x8f, "WIPEWAIT", {}));
            table.push_back(command(0x90, "BGMPLAY", numbers(4)));
            table.push_back(command(0x91, "BGMSTOP", numbers(1)));
            table.push_back(command(0x92, "BGMVOL", numbers(2)));
            table.push_back(command(0x93, "BGMWAIT", numbers(1)));
            table.push_back(command(0x94, "BGMSYNC", numbers(1)));
            table.push_back(command(0x95, "SEPLAY", numbers(7)));
            table.push_back(command(0x96, "SESTOP", numbers(2)));
            table.push_back(command(0x97, "SESTOPALL", numbers(1)));
            table.push_back(command(0x98, "SEVOL", numbers(3)));
            table.push_back(command(0x99, "SEPAN", numbers(3)));
            table.push_back(command(0x9a, "SEWAIT", numbers(2)));
            table.push_back(command(0x9b, "SEONCE", numbers(5)));
            table.push_back(command(0x9c, "VOICEPLAY", {kString, kNumber, kNumber}));
            table.push_back(command(0x9d, "VOICESTOP", {}));
            table.push_back(command(0x9e, "VOICEWAIT", numbers(1)));
            table.push_back(command(0x9f, "SYSSE", numbers(2)));
            table.push_back(command(0xa0, "SAVEINFO", {kNumber, kString}));
            table.push_back(command(0xa1, "AUTOSAVE", {}));
            table.push_back(command(0xa2, "EVBEGIN", numbers(1)));
            table.push_back(command(0xa3, "EVEND", {}));
            table.push_back(command(0xa4, "RESUMESET", {}));
            table.push_back(command(0xa5, "RESUME", {}));
            table.push_back(command(0xa6, "SYSCALL", numbers(2)));
            table.push_back(command(0xb0, "TROPHY", numbers(1)));
            table.push_back(command(0xb1, "UNLOCK", {kByte, kNumberList}));
            table.push_back(command(0xc0, "LAYERINIT", numbers(1)));
            table.push_back(command(0xc1, "LAYERLOAD", {kNumber, kNumber, kNumber, kBitmask}));
            table.push_back(command(0xc2, "LAYERUNLOAD", numbers(2)));
            table.push_back(command(0xc3, "LAYERCTRL", {kNumber, kNumber, kBitmask}));
            table.push_back(command(0xc4, "LAYERWAIT", {kNumber, kNumberList}));
            table.push_back(command(0xc5, "LAYERSWAP", numbers(2)));
            table.push_back(command(0xc6, "LAYERSELECT", numbers(2)));
            table.push_back(command(0xc7, "MOVIEWAIT", numbers(2)));
            table.push_back(command(0xc9, "TRANSSET", {kNumber, kNumber, kNumber, kBitmask}));
            table.push_back(command(0xca, "TRANSWAIT", numbers(1)));
            table.push_back(command(0xcb, "PAGEBACK", {}));
            table.push_back(command(0xcc, "PLANESELECT", numbers(1)));
            table.push_back(command(0xcd, "PLANECLEAR", {}));
            table.push_back(command(0xce, "MASKLOAD", numbers(3)));
            table.push_back(command(0xcf, "MASKUNLOAD", {}));
            table.push_back(command(0xe0, "CHARS", numbers(2)));
            table.push_back(command(0xe1, "TIPSGET", {kNumberList}));
            table.push_back(command(0xe2, "QUIZ", {kRegister, kNumber}));
            table.push_back(command(0xe3, "SHOWCHARS", {}));
            table.push_back(command(0xe4, "NOTIFYSET", numbers(1)));
            table.push_back(command(0xff, "DEBUGOUT", {kString, kNumberList}));

            OpcodeInfo raw;
            raw.opcode = Opcode::RawData;
            raw.mnemonic = "db";
            raw.operands = {{OperandKind::ByteList}};
            table.push_back(std::move(raw));

            return table;
        }

        bool equalsIgnoreCase(std::string_view left, std::string_view right)
        {
            return left.size() == right.size()
                && std::equal(left.begin(), left.end(), right.begin(), [](char a, char b) {
                       return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
                   });
        }
    } // namespace

    const std::vector<OpcodeInfo>& opcodeTable()
    {
        static const std::vector<OpcodeInfo> table = buildTable();
        return table;
    }

    const OpcodeInfo* findByMnemonic(std::string_view mnemonic)
    {
        for (const auto& info : opcodeTable())
        {
            if (equalsIgnoreCase(info.mnemonic, mnemonic))
            {
                return &info;
            }
        }
        return nullptr;
    }

    const OpcodeInfo* findByOpcode(Opcode opcode, std::uint8_t subtype)
    {
        const std::uint8_t operation = static_cast<std::uint8_t>(subtype & ~kExplicitOperandBit);
        for (const auto& info : opcodeTable())
        {
            if (info.opcode != opcode)
            {
                continue;
            }
            if (info.layout != OperandLayout::TypedOptional || info.subtype == operation)
            {
                return &info;
            }
        }
        return nullptr;
    }

    const OpcodeInfo* findForInstruction(const Instruction& instruction)
    {
        return findByOpcode(instruction.opcode, instruction.subtype);
    }

    bool endsControlFlow(Opcode opcode) noexcept
    {
        return opcode == Opcode::Jump || opcode == Opcode::Return || opcode == Opcode::Retsub;
    }

    std::string_view conditionOperator(Condition condition)
    {
        switch (condition)
        {
        case Condition::Equal: return "==";
        case Condition::NotEqual: return "!=";
        case Condition::GreaterOrEqual: return ">=";
        case Condition::Greater: return ">";
        case Condition::LowerOrEqual: return "<=";
        case Condition::Lower: return "<";
        case Condition::AndNotZero: return "&";
        case Condition::BitSet: return "&";
        }
        return "==";
    }
} // namespace sceneasm::mir
