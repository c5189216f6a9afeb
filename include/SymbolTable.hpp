#ifndef SYMBOL_TABLE_HPP
#define SYMBOL_TABLE_HPP

#include "PQS.hpp"
#include "Quantity.hpp"
#include "LambdaUnit.hpp"
#include <variant>
#include <string>
#include <vector>
#include <map>
#include <cstddef>

namespace PQS {

/// Tagged value stored under a name
using Symbol = std::variant<Constant, Unit, LambdaUnit>;

SymbolKind kindOf(const Symbol& symbol);
std::string kindName(SymbolKind kind);

/**
 * @brief Dimension of any symbol
 */
const ExponentVector& dimensionOf(const Symbol& symbol);

/**
 * @brief Constant or Unit as a plain quantity
 * @throws UnitError for a lambda unit
 */
const Quantity& quantityOf(const Symbol& symbol);

/**
 * @brief Ordered, read-only table of constants and units
 *
 * Built once by DefinitionParser and shared as
 * std::shared_ptr<const SymbolTable>. Besides the symbols it holds the
 * coherent relations: one exponent vector per unit that was defined as a
 * pure product of other units (N = kg*m/s**2 gives kg*m*s-2*N-1), each
 * evaluating to unity.
 */
class SymbolTable {
public:
    struct Entry {
        std::string name;
        Symbol value;
        std::string section;    // divider the statement appeared under
        std::string note;       // free text after ';'
        std::string locator;    // source:line
        std::size_t order = 0;  // position in definition order

        SymbolKind kind() const { return kindOf(value); }
    };

    SymbolTable() = default;

    /**
     * @brief Exact lookup, no prefix resolution
     * @return Pointer to the entry or nullptr
     */
    const Entry* find(const std::string& name) const;
    bool contains(const std::string& name) const { return index_.count(name) > 0; }

    /// Entries in definition order
    const std::vector<Entry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::vector<ExponentVector>& coherentRelations() const { return relations_; }

    /// Section names in order of first appearance
    std::vector<std::string> sections() const;

private:
    friend class DefinitionParser;

    /**
     * @brief Insert or replace a symbol
     *
     * A redefinition keeps the entry's original position and drops the
     * coherent relation that defined the old value.
     * @return true if an existing entry was replaced
     */
    bool bind(Entry entry);
    void addRelation(const ExponentVector& relation);

    std::vector<Entry> entries_;
    std::map<std::string, std::size_t> index_;
    std::vector<ExponentVector> relations_;
};

} // namespace PQS

#endif // SYMBOL_TABLE_HPP
