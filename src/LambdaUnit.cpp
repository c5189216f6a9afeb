#include "LambdaUnit.hpp"
#include "Errors.hpp"
#include <utility>

namespace PQS {

LambdaUnit::LambdaUnit(Forward forward, Inverse inverse, const ExponentVector& dimension,
                       const std::string& symbol, bool prefixable)
    : forward_(std::move(forward)), inverse_(std::move(inverse)),
      dimension_(dimension), symbol_(symbol), prefixable_(prefixable) {
    if (!forward_ || !inverse_) {
        throw UnitError("Lambda unit '" + symbol + "' needs both a forward and an inverse function");
    }
}

Quantity LambdaUnit::toQuantity(double number) const {
    Quantity q = forward_(number);
    if (q.dimension() != dimension_) {
        throw DimensionError("Lambda unit '" + symbol_ + "' produced dimension " +
                             q.dimension().toString() + " instead of " + dimension_.toString());
    }
    if (symbol_.empty()) return q;
    return q.withDisplayUnit(displayUnit());
}

double LambdaUnit::toNumber(const Quantity& quantity) const {
    if (quantity.dimension() != dimension_) {
        throw IncompatibleUnitError("Cannot express dimension " + quantity.dimension().toString() +
                                    " in lambda unit '" + symbol_ + "' of dimension " +
                                    dimension_.toString());
    }
    return inverse_(quantity);
}

LambdaUnit LambdaUnit::power(const Rational& exponent) const {
    if (exponent == 1) return *this;
    if (exponent == -1) {
        if (!dimension_.empty()) {
            throw UnitError("Only dimensionless lambda units have a reciprocal, '" +
                            symbol_ + "' has dimension " + dimension_.toString());
        }
        Forward forward = forward_;
        Inverse inverse = inverse_;
        return LambdaUnit(
            [inverse](double n) { return Quantity(inverse(Quantity(n))); },
            [forward](const Quantity& q) { return forward(q.toNumber()).toNumber(); },
            dimension_, symbol_.empty() ? symbol_ : symbol_ + "_inv", false);
    }
    throw UnitError("Lambda unit '" + symbol_ + "' can only be raised to the power 1 or -1, not " +
                    exponentToString(exponent));
}

LambdaUnit LambdaUnit::scaled(double factor, const std::string& symbol) const {
    Forward forward = forward_;
    Inverse inverse = inverse_;
    return LambdaUnit(
        [forward, factor](double n) { return forward(factor * n); },
        [inverse, factor](const Quantity& q) { return inverse(q) / factor; },
        dimension_, symbol, false);
}

LambdaUnit LambdaUnit::renamed(const std::string& symbol, bool prefixable) const {
    LambdaUnit copy(*this);
    copy.symbol_ = symbol;
    copy.prefixable_ = prefixable;
    return copy;
}

} // namespace PQS
