#pragma once

#include "module.hpp"
#include "../high_level_ir/module.hpp"

#include <vector>

namespace sceneasm::mir
{
    struct LoweringResult
    {
        Unit unit;
        std::vector<common::Diagnostic> diagnostics;
    };

    // Selects opcodes and operand encodings for one resolved unit. Function prologue and
    // epilogue and the implicit subroutine tail are added here. Spans stay as the
    // resolver produced them.
    [[nodiscard]] LoweringResult lowerFromHir(const hir::Unit& unit);
} // namespace sceneasm::mir
