#pragma once

#include "decoder.hpp"
#include "../common/diagnostic.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sceneasm::disasm
{
    using common::Diagnostic;

    struct DisassemblyOptions
    {
        std::uint32_t baseAddress{0};
        // Defaults to the base address.
        std::optional<std::uint32_t> entryAddress;
    };

    struct DisassemblyResult
    {
        std::string text;
        std::vector<Diagnostic> diagnostics;
        std::size_t instructionCount{0};
        // Bytes emitted through `db` because they could not be reproduced as instructions.
        std::size_t rawByteCount{0};
    };

    // Turns a code block back into assembly that reassembles to the same bytes.
    class Disassembler
    {
    public:
        Disassembler(const std::vector<std::uint8_t>& code, DisassemblyOptions options);

        [[nodiscard]] DisassemblyResult run();

    private:
        struct Entry
        {
            std::size_t offset{0};
            std::size_t size{0};
            std::optional<mir::Instruction> instruction;
        };

        void sweep();
        void collectLabels();
        void symbolize(mir::Instruction& instruction) const;
        [[nodiscard]] bool reproduces(const Entry& entry, const std::string& text) const;
        void emitRaw(std::size_t offset, std::size_t size, const std::string& annotation);
        void flushRaw();
        [[nodiscard]] std::uint32_t addressOf(std::size_t offset) const noexcept;

    private:
        const std::vector<std::uint8_t>& m_code;
        DisassemblyOptions m_options;
        std::vector<Entry> m_entries;
        std::map<std::size_t, std::string> m_labels;
        common::DiagnosticBag m_diagnostics;
        std::string m_text;
        std::vector<std::uint8_t> m_pendingRaw;
        std::size_t m_instructionCount{0};
        std::size_t m_rawByteCount{0};
    };

    [[nodiscard]] DisassemblyResult disassemble(const std::vector<std::uint8_t>& code, const DisassemblyOptions& options = {});

    // Name given to an address that a label is placed at.
    [[nodiscard]] std::string labelName(std::uint32_t address);
} // namespace sceneasm::disasm
