#include "canonical.hpp"

#include "printer.hpp"
#include "../common/hashing.hpp"

#include <sstream>

namespace sceneasm::mir
{
    std::string canonicalPrint(const Unit& unit)
    {
        std::ostringstream stream;
        stream << "unit " << static_cast<int>(unit.kind) << ' ' << unit.name << '\n';
        for (const auto& label : unit.labels)
        {
            stream << "label " << label.name << " @" << label.instructionIndex << '\n';
        }
        for (std::size_t index = 0; index < unit.instructions.size(); ++index)
        {
            const Instruction& inst = unit.instructions[index];
            stream << "inst " << index << ' ' << static_cast<int>(inst.opcode) << ':' << static_cast<int>(inst.subtype)
                   << ' ' << formatInstruction(inst) << '\n';
        }
        return stream.str();
    }

    std::uint64_t canonicalHash(const Unit& unit)
    {
        return common::contentHash(canonicalPrint(unit));
    }
} // namespace sceneasm::mir
