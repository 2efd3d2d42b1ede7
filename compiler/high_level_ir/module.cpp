#include "module.hpp"

#include "../common/hashing.hpp"

namespace sceneasm::hir
{
    const Symbol* GlobalScope::declareSymbol(Symbol symbol)
    {
        const auto existing = m_symbolIndex.find(symbol.name);
        if (existing != m_symbolIndex.end())
        {
            return &m_symbols[existing->second];
        }

        m_symbolIndex.emplace(symbol.name, m_symbols.size());
        m_symbols.push_back(std::move(symbol));
        return nullptr;
    }

    void GlobalScope::defineValue(std::string name, ConstantValue value)
    {
        m_values.emplace(std::move(name), value);
    }

    void GlobalScope::defineRegister(std::string name, Register reg)
    {
        m_registers.emplace(std::move(name), reg);
    }

    const Symbol* GlobalScope::findSymbol(std::string_view name) const
    {
        const auto found = m_symbolIndex.find(std::string{name});
        return found == m_symbolIndex.end() ? nullptr : &m_symbols[found->second];
    }

    std::optional<ConstantValue> GlobalScope::findValue(std::string_view name) const
    {
        const auto found = m_values.find(name);
        if (found == m_values.end())
        {
            return std::nullopt;
        }
        return found->second;
    }

    std::optional<Register> GlobalScope::findRegister(std::string_view name) const
    {
        const auto found = m_registers.find(name);
        if (found == m_registers.end())
        {
            return std::nullopt;
        }
        return found->second;
    }

    std::uint64_t GlobalScope::signature() const
    {
        std::uint64_t hash = common::contentHash("scope");
        for (const auto& symbol : m_symbols)
        {
            hash = common::combineHash(hash, symbol.name);
            hash = common::combineHash(hash, static_cast<std::uint64_t>(symbol.kind));
            hash = common::combineHash(hash, static_cast<std::uint64_t>(symbol.parameterCount));
        }
        for (const auto& [name, value] : m_values)
        {
            hash = common::combineHash(hash, name);
            hash = common::combineHash(hash, static_cast<std::uint64_t>(static_cast<std::uint32_t>(value.value)));
            hash = common::combineHash(hash, static_cast<std::uint64_t>(value.kind));
        }
        for (const auto& [name, reg] : m_registers)
        {
            hash = common::combineHash(hash, name);
            hash = common::combineHash(hash, static_cast<std::uint64_t>(reg.raw()));
        }
        return hash;
    }

    std::string_view toString(SymbolKind kind)
    {
        switch (kind)
        {
        case SymbolKind::Label: return "label";
        case SymbolKind::Function: return "function";
        case SymbolKind::Subroutine: return "subroutine";
        }
        return "symbol";
    }

    std::string_view toString(ValueKind kind)
    {
        switch (kind)
        {
        case ValueKind::Integer: return "integer";
        case ValueKind::Real: return "real";
        }
        return "value";
    }
} // namespace sceneasm::hir
