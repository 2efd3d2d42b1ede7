#include "disassembler.hpp"

#include "../codegen/code_generator.hpp"
#include "../frontend/parser.hpp"
#include "../high_level_ir/resolver.hpp"
#include "../middle_ir/lowering.hpp"
#include "../middle_ir/printer.hpp"

#include <algorithm>
#include <cstdio>
#include <set>

namespace sceneasm::disasm
{
    namespace
    {
        constexpr std::size_t kBytesPerLine = 16;
        constexpr std::string_view kProbeLabel = "__probe";

        bool hasControlCharacters(std::string_view text)
        {
            return std::any_of(text.begin(), text.end(), [](char ch) {
                const auto byte = static_cast<unsigned char>(ch);
                return byte < 0x20 || byte == 0x7f;
            });
        }

        std::string formatBytes(const std::uint8_t* bytes, std::size_t count)
        {
            std::string text = "    db";
            char buffer[8];
            for (std::size_t index = 0; index < count; ++index)
            {
                std::snprintf(buffer, sizeof(buffer), "0x%02x", static_cast<unsigned>(bytes[index]));
                text += index == 0 ? " " : ", ";
                text += buffer;
            }
            return text;
        }

        common::SourceSpan byteSpan(std::size_t offset)
        {
            const auto column = static_cast<std::uint32_t>(offset + 1);
            const auto position = static_cast<std::uint32_t>(offset);
            return {{1, column, position}, {1, column + 1, position + 1}};
        }
    } // namespace

    Disassembler::Disassembler(const std::vector<std::uint8_t>& code, DisassemblyOptions options)
        : m_code(code)
        , m_options(options)
    {
    }

    std::uint32_t Disassembler::addressOf(std::size_t offset) const noexcept
    {
        return m_options.baseAddress + static_cast<std::uint32_t>(offset);
    }

    void Disassembler::sweep()
    {
        bool inUndecodableRun = false;
        std::size_t offset = 0;
        while (offset < m_code.size())
        {
            DecodeResult decoded = decodeInstruction(m_code, offset);
            if (decoded.succeeded())
            {
                m_entries.push_back(Entry{offset, decoded.size, std::move(decoded.instruction)});
                offset += decoded.size;
                inUndecodableRun = false;
                continue;
            }

            // One warning per run of bytes that do not decode.
            if (!inUndecodableRun)
            {
                m_diagnostics.warning(decoded.failure->code, decoded.failure->message, byteSpan(decoded.failure->offset));
            }
            inUndecodableRun = true;
            m_entries.push_back(Entry{offset, 1, std::nullopt});
            ++offset;
        }
    }

    void Disassembler::collectLabels()
    {
        std::set<std::size_t> starts;
        for (const auto& entry : m_entries)
        {
            starts.insert(entry.offset);
        }

        const std::uint32_t entryAddress = m_options.entryAddress.value_or(m_options.baseAddress);
        m_labels[0] = labelName(m_options.baseAddress);

        const auto locate = [&](std::uint32_t address) -> std::optional<std::size_t> {
            if (address < m_options.baseAddress)
            {
                return std::nullopt;
            }
            const std::size_t offset = address - m_options.baseAddress;
            if (starts.count(offset) == 0)
            {
                return std::nullopt;
            }
            return offset;
        };

        if (const auto offset = locate(entryAddress))
        {
            m_labels[*offset] = std::string{codegen::kEntrySymbol};
        }
        else if (entryAddress == m_options.baseAddress)
        {
            m_labels[0] = std::string{codegen::kEntrySymbol};
        }

        for (const auto& entry : m_entries)
        {
            if (!entry.instruction.has_value())
            {
                continue;
            }
            for (const auto& operand : entry.instruction->operands)
            {
                for (const auto& target : operand.targets)
                {
                    if (const auto offset = locate(target.address))
                    {
                        m_labels.emplace(*offset, labelName(target.address));
                    }
                }
            }
        }
    }

    void Disassembler::symbolize(mir::Instruction& instruction) const
    {
        for (auto& operand : instruction.operands)
        {
            for (auto& target : operand.targets)
            {
                if (target.address < m_options.baseAddress)
                {
                    continue;
                }
                const auto found = m_labels.find(target.address - m_options.baseAddress);
                if (found != m_labels.end())
                {
                    target.symbol = found->second;
                }
            }
        }
    }

    bool Disassembler::reproduces(const Entry& entry, const std::string& text) const
    {
        const std::string source = std::string{kProbeLabel} + ":\n    " + text + "\n";
        const auto parsed = frontend::parseSource(source);
        if (parsed.root == nullptr || common::hasErrors(parsed.diagnostics))
        {
            return false;
        }

        hir::GlobalScope scope;
        scope.declareSymbol(hir::Symbol{std::string{kProbeLabel}, hir::SymbolKind::Label, 0, {}});
        for (const auto& [offset, name] : m_labels)
        {
            scope.declareSymbol(hir::Symbol{name, hir::SymbolKind::Label, 0, {}});
        }

        hir::Resolver resolver{scope, *parsed.root};
        const auto units = resolver.resolve();
        if (common::hasErrors(resolver.diagnostics()) || units.size() != 1)
        {
            return false;
        }

        const auto lowered = mir::lowerFromHir(units.front());
        if (common::hasErrors(lowered.diagnostics))
        {
            return false;
        }

        const codegen::EncodedUnit encoded = codegen::encodeUnit(lowered.unit);
        codegen::CodeGenerator generator{addressOf(entry.offset)};
        generator.addUnit(encoded);
        for (const auto& [offset, name] : m_labels)
        {
            generator.defineSymbol(name, addressOf(offset));
        }

        const codegen::LinkedProgram program = generator.link();
        if (!program.diagnostics.empty() || program.code.size() != entry.size)
        {
            return false;
        }
        const auto first = m_code.begin() + static_cast<std::ptrdiff_t>(entry.offset);
        return std::equal(program.code.begin(), program.code.end(), first);
    }

    void Disassembler::flushRaw()
    {
        if (m_pendingRaw.empty())
        {
            return;
        }
        m_text += formatBytes(m_pendingRaw.data(), m_pendingRaw.size()) + "\n";
        m_rawByteCount += m_pendingRaw.size();
        m_pendingRaw.clear();
    }

    void Disassembler::emitRaw(std::size_t offset, std::size_t size, const std::string& annotation)
    {
        flushRaw();
        for (std::size_t chunk = 0; chunk < size; chunk += kBytesPerLine)
        {
            const std::size_t count = std::min(kBytesPerLine, size - chunk);
            m_text += formatBytes(m_code.data() + offset + chunk, count);
            if (chunk == 0 && !annotation.empty())
            {
                m_text += " // " + annotation;
            }
            m_text += "\n";
        }
        m_rawByteCount += size;
    }

    DisassemblyResult Disassembler::run()
    {
        sweep();
        collectLabels();

        char header[96];
        std::snprintf(header, sizeof(header), "// base 0x%08x, entry 0x%08x\n",
            static_cast<unsigned>(m_options.baseAddress),
            static_cast<unsigned>(m_options.entryAddress.value_or(m_options.baseAddress)));
        m_text += header;

        if (m_entries.empty())
        {
            m_text += m_labels[0] + ":\n";
        }

        for (const auto& entry : m_entries)
        {
            const auto label = m_labels.find(entry.offset);
            if (label != m_labels.end())
            {
                flushRaw();
                m_text += label->second + ":\n";
            }

            if (!entry.instruction.has_value())
            {
                m_pendingRaw.push_back(m_code[entry.offset]);
                if (m_pendingRaw.size() == kBytesPerLine)
                {
                    flushRaw();
                }
                continue;
            }

            mir::Instruction instruction = *entry.instruction;
            symbolize(instruction);
            const std::string text = mir::formatInstruction(instruction);
            if (reproduces(entry, text))
            {
                flushRaw();
                m_text += "    " + text + "\n";
                ++m_instructionCount;
                continue;
            }

            emitRaw(entry.offset, entry.size, hasControlCharacters(text) ? std::string{} : text);
        }
        flushRaw();

        DisassemblyResult result;
        result.text = std::move(m_text);
        result.diagnostics = m_diagnostics.take();
        result.instructionCount = m_instructionCount;
        result.rawByteCount = m_rawByteCount;
        return result;
    }

    DisassemblyResult disassemble(const std::vector<std::uint8_t>& code, const DisassemblyOptions& options)
    {
        Disassembler disassembler{code, options};
        return disassembler.run();
    }

    std::string labelName(std::uint32_t address)
    {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "L_%08x", static_cast<unsigned>(address));
        return buffer;
    }
} // namespace sceneasm::disasm
