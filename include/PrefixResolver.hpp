#ifndef PREFIX_RESOLVER_HPP
#define PREFIX_RESOLVER_HPP

#include "SymbolTable.hpp"
#include "Prefixes.hpp"
#include <optional>
#include <string>

namespace PQS {

/**
 * @brief Name lookup with automatic SI prefixes
 *
 * An exactly registered name always wins. Otherwise the name is split into
 * an SI prefix and a registered prefixable base, trying single-character
 * prefixes before "da". Synthesized units are built on every call and are
 * not prefixable themselves; the table is never modified.
 */
class PrefixResolver {
public:
    explicit PrefixResolver(const SymbolTable& table) : table_(table) {}

    /**
     * @brief Exact symbol or synthesized prefixed unit
     * @return std::nullopt when neither exists
     */
    std::optional<Symbol> resolve(const std::string& name) const;

    /**
     * @brief Split a name into prefix and prefixable base
     * @return false if no split applies
     */
    bool split(const std::string& name, const Prefix*& prefix, std::string& base) const;

private:
    const SymbolTable& table_;
};

} // namespace PQS

#endif // PREFIX_RESOLVER_HPP
