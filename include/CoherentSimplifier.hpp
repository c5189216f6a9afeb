#ifndef COHERENT_SIMPLIFIER_HPP
#define COHERENT_SIMPLIFIER_HPP

#include "SymbolTable.hpp"
#include "PrefixResolver.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PQS {

/**
 * @brief Chooses the display unit of a quantity
 *
 * Two strategies:
 * - simplify(): rewrite an existing display vector with the coherent
 *   relations of the table so that the sum of absolute exponents drops
 *   (kg*m2/s2 -> J).
 * - coherentUnitFor(): build a display vector from scratch for a bare
 *   dimension, combining coherent units with as few symbols as possible.
 */
class CoherentSimplifier {
public:
    struct Settings {
        int level = 2;          // depth of non-improving substitutions explored
        int max_terms = 3;      // largest combination tried before falling back
    };

    explicit CoherentSimplifier(const SymbolTable& table);
    CoherentSimplifier(const SymbolTable& table, const Settings& settings);

    /**
     * @brief Minimize a display vector using the coherent relations
     */
    ExponentVector simplify(const ExponentVector& display) const;

    /**
     * @brief Coherent unit combination reproducing a dimension
     *
     * Starts from the base units of the dimension. A combination replaces
     * them only when it needs fewer symbols and no larger sum of absolute
     * exponents; a single unit may replace a single base unit. Among
     * combinations of one size: smallest sum of absolute exponents, then
     * fewest negative exponents, then fewest base units, then earliest
     * definitions. So L/T2 stays m s-2, L*M/T gives N s and T-1 gives Hz.
     */
    ExponentVector coherentUnitFor(const ExponentVector& dimension) const;

    /**
     * @brief Display vector used to render a quantity
     *
     * The quantity's own display unit is kept (simplified) when its units
     * resolve and reproduce the dimension; otherwise one is searched.
     */
    ExponentVector displayFor(const Quantity& quantity) const;

    /**
     * @brief Dimension implied by a display vector
     * @return std::nullopt if a symbol cannot be resolved, or a lambda unit
     *         appears in anything but a lone first power
     */
    std::optional<ExponentVector> dimensionOfDisplay(const ExponentVector& display) const;

    /// Base unit chosen for each base dimension symbol
    const std::map<std::string, std::string>& baseUnits() const { return base_units_; }

    /**
     * @brief Whether a unit's value equals the product of the base units'
     *        values raised to its dimension
     */
    bool isCoherent(const Quantity& unit) const;

    const Settings& settings() const { return settings_; }

private:
    struct Candidate {
        const Unit* unit;
        std::size_t order;
        bool base;              // chosen as the unit of a base dimension
    };

    const SymbolTable& table_;
    PrefixResolver resolver_;
    Settings settings_;
    std::map<std::string, std::string> base_units_;
    std::map<std::string, double> base_values_;
    std::vector<Candidate> coherent_units_;

    void classifyUnits();
    ExponentVector simplify(const ExponentVector& display, int level) const;
    ExponentVector baseDecomposition(const ExponentVector& dimension) const;
};

} // namespace PQS

#endif // COHERENT_SIMPLIFIER_HPP
