#include "PrefixResolver.hpp"

namespace PQS {

namespace {

bool isPrefixable(const Symbol& symbol) {
    if (const auto* unit = std::get_if<Unit>(&symbol)) return unit->prefixable();
    if (const auto* lambda = std::get_if<LambdaUnit>(&symbol)) return lambda->prefixable();
    return false;
}

} // anonymous namespace

bool PrefixResolver::split(const std::string& name, const Prefix*& prefix,
                           std::string& base) const {
    // 1-character prefixes first, then "da"
    for (std::size_t arity = 1; arity <= 2; ++arity) {
        if (name.size() <= arity) break;

        const Prefix* candidate = findPrefix(name.substr(0, arity));
        if (!candidate) continue;

        std::string rest = name.substr(arity);
        const SymbolTable::Entry* entry = table_.find(rest);
        if (entry && isPrefixable(entry->value)) {
            prefix = candidate;
            base = rest;
            return true;
        }
    }
    return false;
}

std::optional<Symbol> PrefixResolver::resolve(const std::string& name) const {
    if (const SymbolTable::Entry* entry = table_.find(name)) {
        return entry->value;
    }

    const Prefix* prefix = nullptr;
    std::string base;
    if (!split(name, prefix, base)) {
        return std::nullopt;
    }

    const Symbol& base_symbol = table_.find(base)->value;
    double factor = prefix->factor();

    if (const auto* lambda = std::get_if<LambdaUnit>(&base_symbol)) {
        return Symbol(lambda->scaled(factor, name));
    }

    const Unit& unit = std::get<Unit>(base_symbol);
    Quantity scaled(factor * unit.value(), unit.dimension());
    return Symbol(Unit(name, scaled, false));
}

} // namespace PQS
