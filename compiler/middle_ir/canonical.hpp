#pragma once

#include "module.hpp"

#include <cstdint>
#include <string>

namespace sceneasm::mir
{
    std::string canonicalPrint(const Unit& unit);
    std::uint64_t canonicalHash(const Unit& unit);
} // namespace sceneasm::mir
