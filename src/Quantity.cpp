#include "Quantity.hpp"
#include "Errors.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace PQS {

Quantity::Quantity(double value, const ExponentVector& dimension, const ExponentVector& display)
    : value_(value), dimension_(dimension), display_(display) {}

double Quantity::toNumber() const {
    if (!isDimensionless()) {
        throw DimensionError("Quantity with dimension " + dimension_.toString() +
                             " is not a plain number");
    }
    return value_;
}

Quantity Quantity::withDisplayUnit(const ExponentVector& display) const {
    return Quantity(value_, dimension_, display);
}

// =============================================================================
// Arithmetic
// =============================================================================

Quantity Quantity::add(const Quantity& other) const {
    if (dimension_ != other.dimension_) {
        throw DimensionError("Cannot add quantities of dimension " + dimension_.toString() +
                             " and " + other.dimension_.toString());
    }
    return Quantity(value_ + other.value_, dimension_, display_);
}

Quantity Quantity::subtract(const Quantity& other) const {
    if (dimension_ != other.dimension_) {
        throw DimensionError("Cannot subtract quantities of dimension " + dimension_.toString() +
                             " and " + other.dimension_.toString());
    }
    return Quantity(value_ - other.value_, dimension_, display_);
}

Quantity Quantity::multiply(const Quantity& other) const {
    return Quantity(value_ * other.value_,
                    dimension_.multiply(other.dimension_),
                    display_.multiply(other.display_));
}

Quantity Quantity::divide(const Quantity& other) const {
    return Quantity(value_ / other.value_,
                    dimension_.divide(other.dimension_),
                    display_.divide(other.display_));
}

Quantity Quantity::multiply(double factor) const {
    return Quantity(value_ * factor, dimension_, display_);
}

Quantity Quantity::divide(double divisor) const {
    return Quantity(value_ / divisor, dimension_, display_);
}

Quantity Quantity::power(const Rational& exponent) const {
    if (value_ < 0.0 && exponent.denominator() != 1) {
        std::stringstream ss;
        ss << "Cannot raise negative value " << value_ << " to the power "
           << exponentToString(exponent);
        throw FractionalPowerOfNegativeError(ss.str());
    }
    double p = static_cast<double>(exponent.numerator()) / exponent.denominator();
    return Quantity(std::pow(value_, p), dimension_.power(exponent), display_.power(exponent));
}

Quantity Quantity::negate() const {
    return Quantity(-value_, dimension_, display_);
}

Quantity Quantity::abs() const {
    return Quantity(std::abs(value_), dimension_, display_);
}

int Quantity::compare(const Quantity& other) const {
    if (dimension_ != other.dimension_) {
        throw DimensionError("Cannot compare quantities of dimension " + dimension_.toString() +
                             " and " + other.dimension_.toString());
    }
    if (value_ < other.value_) return -1;
    if (value_ > other.value_) return 1;
    return 0;
}

double Quantity::convertTo(const Quantity& unit) const {
    if (dimension_ != unit.dimension_) {
        throw IncompatibleUnitError("Cannot express dimension " + dimension_.toString() +
                                    " in a unit of dimension " + unit.dimension_.toString());
    }
    return value_ / unit.value_;
}

std::string Quantity::toString() const {
    std::stringstream ss;
    ss << std::setprecision(15) << value_ << " [" << dimension_.toString() << "]";
    if (!display_.empty()) ss << " (" << display_.toString() << ")";
    return ss.str();
}

Quantity operator*(double factor, const Quantity& q) {
    return q.multiply(factor);
}

Quantity operator/(double numerator, const Quantity& q) {
    return Quantity(numerator).divide(q);
}

std::ostream& operator<<(std::ostream& os, const Quantity& q) {
    return os << q.toString();
}

// =============================================================================
// Unit Implementation
// =============================================================================

Unit::Unit(const std::string& symbol, const Quantity& quantity, bool prefixable)
    : Quantity(quantity.value(), quantity.dimension(), ExponentVector::single(symbol)),
      symbol_(symbol), prefixable_(prefixable) {}

} // namespace PQS
