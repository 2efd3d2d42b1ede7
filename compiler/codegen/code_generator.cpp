#include "code_generator.hpp"

#include <limits>

namespace sceneasm::codegen
{
    CodeGenerator::CodeGenerator(std::uint32_t baseAddress)
        : m_baseAddress(baseAddress)
    {
    }

    void CodeGenerator::addUnit(const EncodedUnit& unit, SourceLocation origin)
    {
        m_units.push_back(Placement{&unit, origin});
    }

    void CodeGenerator::defineSymbol(std::string name, std::uint32_t address)
    {
        m_external.emplace(std::move(name), address);
    }

    LinkedProgram CodeGenerator::link() const
    {
        common::DiagnosticBag diagnostics;
        LinkedProgram program;
        program.baseAddress = m_baseAddress;
        program.entryAddress = m_baseAddress;

        std::vector<std::uint32_t> starts;
        starts.reserve(m_units.size());
        std::uint64_t cursor = m_baseAddress;
        for (const auto& placement : m_units)
        {
            const EncodedUnit& unit = *placement.unit;
            diagnostics.append(unit.diagnostics, placement.origin);

            if (cursor + unit.bytes.size() > std::numeric_limits<std::uint32_t>::max())
            {
                const common::SourceSpan span = unit.labels.empty() ? common::SourceSpan{} : unit.labels.front().span;
                diagnostics.error("SASM-E4007", "Unit '" + unit.name + "' does not fit in the 32-bit address space.",
                    common::rebase(span, placement.origin));
                program.diagnostics = diagnostics.take();
                return program;
            }

            starts.push_back(static_cast<std::uint32_t>(cursor));
            for (const auto& label : unit.labels)
            {
                // Duplicates were reported during resolution; the first definition wins.
                program.symbols.emplace(label.name, static_cast<std::uint32_t>(cursor + label.offset));
            }
            program.code.insert(program.code.end(), unit.bytes.begin(), unit.bytes.end());
            cursor += unit.bytes.size();
        }

        for (const auto& [name, address] : m_external)
        {
            program.symbols.emplace(name, address);
        }

        for (std::size_t index = 0; index < m_units.size(); ++index)
        {
            const Placement& placement = m_units[index];
            const std::uint32_t start = starts[index];
            const std::size_t codeOffset = start - m_baseAddress;

            for (const auto& relocation : placement.unit->relocations)
            {
                std::uint32_t address = start + relocation.unitOffset;
                if (relocation.kind == Relocation::Kind::Symbol)
                {
                    const auto found = program.symbols.find(relocation.symbol);
                    if (found == program.symbols.end())
                    {
                        diagnostics.error("SASM-E4006", "Symbol '" + relocation.symbol + "' has no address.",
                            common::rebase(relocation.span, placement.origin));
                        continue;
                    }
                    address = found->second;
                }

                if (!patchU32(program.code, codeOffset + relocation.offset, address))
                {
                    diagnostics.error("SASM-E4006", "Relocation lies outside unit '" + placement.unit->name + "'.",
                        common::rebase(relocation.span, placement.origin));
                }
            }
        }

        const auto entry = program.symbols.find(std::string{kEntrySymbol});
        if (entry != program.symbols.end())
        {
            program.entryAddress = entry->second;
        }

        program.diagnostics = diagnostics.take();
        return program;
    }

    LinkedProgram generate(const std::vector<mir::Unit>& units, std::uint32_t baseAddress)
    {
        std::vector<EncodedUnit> encoded;
        encoded.reserve(units.size());
        for (const auto& unit : units)
        {
            encoded.push_back(encodeUnit(unit));
        }

        CodeGenerator generator{baseAddress};
        for (const auto& unit : encoded)
        {
            generator.addUnit(unit);
        }
        return generator.link();
    }
} // namespace sceneasm::codegen
