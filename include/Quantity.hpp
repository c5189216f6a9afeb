#ifndef QUANTITY_HPP
#define QUANTITY_HPP

#include "ExponentVector.hpp"
#include <string>
#include <ostream>

namespace PQS {

/**
 * @brief Numeric value with a physical dimension and a display unit
 *
 * The value is stored in the units of the active unit system (the one
 * defined by the base constants). The dimension vector decides which
 * operations are legal; the display vector only records how the quantity
 * should be shown and never affects the value.
 */
class Quantity {
public:
    Quantity(double value = 0.0, const ExponentVector& dimension = ExponentVector(),
             const ExponentVector& display = ExponentVector());

    double value() const { return value_; }
    const ExponentVector& dimension() const { return dimension_; }
    const ExponentVector& displayUnit() const { return display_; }

    bool isDimensionless() const { return dimension_.empty(); }

    /**
     * @brief Plain number of a dimensionless quantity
     * @throws DimensionError if the quantity has a dimension
     */
    double toNumber() const;

    /// Same value and dimension, different display unit
    Quantity withDisplayUnit(const ExponentVector& display) const;

    // =========================================================================
    // Arithmetic
    // =========================================================================

    /**
     * @brief Sum of two quantities of equal dimension
     * @throws DimensionError if the dimensions differ
     */
    Quantity add(const Quantity& other) const;
    Quantity subtract(const Quantity& other) const;

    Quantity multiply(const Quantity& other) const;
    Quantity divide(const Quantity& other) const;
    Quantity multiply(double factor) const;
    Quantity divide(double divisor) const;

    /**
     * @brief Raise to a rational power
     * @throws FractionalPowerOfNegativeError for a negative value and
     *         non-integer exponent
     */
    Quantity power(const Rational& exponent) const;

    Quantity negate() const;
    Quantity abs() const;

    /**
     * @brief Three-way comparison (-1, 0, 1)
     * @throws DimensionError if the dimensions differ
     */
    int compare(const Quantity& other) const;

    /// Equality of value and dimension; display units are ignored
    bool equals(const Quantity& other) const { return compare(other) == 0; }

    /**
     * @brief Number of `unit` contained in this quantity
     * @throws IncompatibleUnitError if the dimensions differ
     */
    double convertTo(const Quantity& unit) const;

    Quantity operator+(const Quantity& other) const { return add(other); }
    Quantity operator-(const Quantity& other) const { return subtract(other); }
    Quantity operator*(const Quantity& other) const { return multiply(other); }
    Quantity operator/(const Quantity& other) const { return divide(other); }
    Quantity operator*(double factor) const { return multiply(factor); }
    Quantity operator/(double divisor) const { return divide(divisor); }
    Quantity operator-() const { return negate(); }

    bool operator==(const Quantity& other) const { return compare(other) == 0; }
    bool operator!=(const Quantity& other) const { return compare(other) != 0; }
    bool operator<(const Quantity& other) const { return compare(other) < 0; }
    bool operator<=(const Quantity& other) const { return compare(other) <= 0; }
    bool operator>(const Quantity& other) const { return compare(other) > 0; }
    bool operator>=(const Quantity& other) const { return compare(other) >= 0; }

    /// Debug representation: value, dimension and display unit
    std::string toString() const;

protected:
    double value_;
    ExponentVector dimension_;
    ExponentVector display_;
};

Quantity operator*(double factor, const Quantity& q);
Quantity operator/(double numerator, const Quantity& q);
std::ostream& operator<<(std::ostream& os, const Quantity& q);

/**
 * @brief Named unit, optionally eligible for SI prefixes
 *
 * The display unit of a Unit is its own symbol.
 */
class Unit : public Quantity {
public:
    Unit() = default;
    Unit(const std::string& symbol, const Quantity& quantity, bool prefixable);

    const std::string& symbol() const { return symbol_; }
    bool prefixable() const { return prefixable_; }

private:
    std::string symbol_;
    bool prefixable_ = false;
};

/**
 * @brief Named physical constant; never prefixable, never a display unit
 */
class Constant : public Quantity {
public:
    Constant() = default;
    Constant(const std::string& symbol, const Quantity& quantity)
        : Quantity(quantity), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

} // namespace PQS

#endif // QUANTITY_HPP
