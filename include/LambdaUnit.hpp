#ifndef LAMBDA_UNIT_HPP
#define LAMBDA_UNIT_HPP

#include "Quantity.hpp"
#include <functional>
#include <string>

namespace PQS {

/**
 * @brief Unit defined by a forward/inverse function pair
 *
 * Covers offset units (degC, degF) and nonlinear units (dB, Np). A lambda
 * unit only converts between numbers and quantities:
 * - toQuantity(n) corresponds to "n * unit"
 * - toNumber(q) corresponds to "q / unit"
 * It cannot be combined with other units by multiplication or division.
 */
class LambdaUnit {
public:
    using Forward = std::function<Quantity(double)>;
    using Inverse = std::function<double(const Quantity&)>;

    LambdaUnit() = default;

    /**
     * @brief Create a lambda unit
     * @param forward Number to quantity
     * @param inverse Quantity to number
     * @param dimension Dimension of forward's result
     * @param symbol Name used as display unit
     * @param prefixable Whether SI prefixes may be applied
     */
    LambdaUnit(Forward forward, Inverse inverse, const ExponentVector& dimension,
               const std::string& symbol = "", bool prefixable = false);

    /**
     * @brief Quantity of n units
     *
     * The result carries this unit as its display unit.
     */
    Quantity toQuantity(double number) const;

    /**
     * @brief Number of units in a quantity
     * @throws IncompatibleUnitError if the dimension differs
     */
    double toNumber(const Quantity& quantity) const;

    /**
     * @brief Power of a lambda unit
     *
     * Only 1 (the unit itself) and -1 (reciprocal) are meaningful; the
     * reciprocal exists only for dimensionless lambda units.
     * @throws UnitError for any other exponent
     */
    LambdaUnit power(const Rational& exponent) const;

    /**
     * @brief Prefixed variant: forward(factor * n), inverse(q) / factor
     */
    LambdaUnit scaled(double factor, const std::string& symbol) const;

    /// Same functions under another name and prefixability
    LambdaUnit renamed(const std::string& symbol, bool prefixable) const;

    const ExponentVector& dimension() const { return dimension_; }
    const std::string& symbol() const { return symbol_; }
    bool prefixable() const { return prefixable_; }
    ExponentVector displayUnit() const { return ExponentVector::single(symbol_); }

private:
    Forward forward_;
    Inverse inverse_;
    ExponentVector dimension_;
    std::string symbol_;
    bool prefixable_ = false;
};

} // namespace PQS

#endif // LAMBDA_UNIT_HPP
