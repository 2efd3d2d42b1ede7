#pragma once

#include "../common/diagnostic.hpp"
#include "../middle_ir/module.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sceneasm::pipeline
{
    using common::Diagnostic;

    struct MirListing
    {
        std::vector<mir::Unit> units;
        // Ordered by source position.
        std::vector<Diagnostic> diagnostics;

        [[nodiscard]] bool succeeded() const noexcept
        {
            return !common::hasErrors(diagnostics);
        }
    };

    // Runs every stage up to instruction selection, without encoding or layout.
    [[nodiscard]] MirListing lowerToMir(std::string_view source);

    // Each unit as the MIR printer shows it, followed by a `hash <name> 0x...` line
    // carrying its canonical hash.
    [[nodiscard]] std::string formatMirListing(const MirListing& listing);
} // namespace sceneasm::pipeline
