#pragma once

#include "token.hpp"

#include <string_view>
#include <vector>

namespace sceneasm::frontend
{
    struct SourceSegment
    {
        std::string_view text;
        SourceLocation origin{};
    };

    // Cuts a source file into top-level item segments (a function, a subroutine, a
    // definition, or a label with the instructions after it) without lexing it.
    // Concatenating the segments gives back the source unchanged.
    [[nodiscard]] std::vector<SourceSegment> splitUnits(std::string_view source);
} // namespace sceneasm::frontend
