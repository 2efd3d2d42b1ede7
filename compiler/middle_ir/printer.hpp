#pragma once

#include "module.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace sceneasm::mir
{
    // Canonical source spelling of one instruction, as the assembler accepts it back.
    [[nodiscard]] std::string formatInstruction(const Instruction& instruction);
    [[nodiscard]] std::string formatTarget(const CodeTarget& target);
    // Infix rendering of an RPN term list; nullopt when the terms do not leave exactly one value.
    [[nodiscard]] std::optional<std::string> formatExpression(const std::vector<ExpressionTerm>& terms);

    void print(const Unit& unit, std::ostream& stream);
} // namespace sceneasm::mir
