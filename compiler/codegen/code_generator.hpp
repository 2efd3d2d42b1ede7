#pragma once

#include "encoder.hpp"

#include <map>
#include <string>
#include <vector>

namespace sceneasm::codegen
{
    using common::SourceLocation;

    inline constexpr std::string_view kEntrySymbol = "ENTRY";

    struct LinkedProgram
    {
        std::vector<std::uint8_t> code;
        std::uint32_t baseAddress{0};
        std::uint32_t entryAddress{0};
        std::map<std::string, std::uint32_t> symbols;
        std::vector<Diagnostic> diagnostics;
    };

    // Lays encoded units out in the order they are added and patches every code address.
    class CodeGenerator
    {
    public:
        explicit CodeGenerator(std::uint32_t baseAddress = 0);

        // Origin rebases the unit's relocation spans into file coordinates.
        void addUnit(const EncodedUnit& unit, SourceLocation origin = {});
        // Symbols that live outside the added units; unit labels take precedence.
        void defineSymbol(std::string name, std::uint32_t address);

        [[nodiscard]] LinkedProgram link() const;

    private:
        struct Placement
        {
            const EncodedUnit* unit{nullptr};
            SourceLocation origin{};
        };

        std::uint32_t m_baseAddress;
        std::vector<Placement> m_units;
        std::map<std::string, std::uint32_t> m_external;
    };

    // Encodes and links a whole program in one go.
    [[nodiscard]] LinkedProgram generate(const std::vector<mir::Unit>& units, std::uint32_t baseAddress = 0);
} // namespace sceneasm::codegen
