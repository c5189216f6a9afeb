#ifndef EXPONENT_VECTOR_HPP
#define EXPONENT_VECTOR_HPP

#include <boost/rational.hpp>
#include <string>
#include <map>
#include <vector>
#include <utility>
#include <initializer_list>
#include <cstddef>

namespace PQS {

/// Exact exponent of a dimension or unit symbol
using Rational = boost::rational<int>;

/**
 * @brief Immutable mapping from symbol to nonzero rational exponent
 *
 * Used both for physical dimensions (L, M, T, ...) and for display units
 * (m, kg, J, ...). Zero exponents are never stored, so two vectors are
 * equal exactly when they hold the same (symbol, exponent) pairs.
 */
class ExponentVector {
public:
    using Map = std::map<std::string, Rational>;
    using Term = std::pair<std::string, Rational>;

    ExponentVector() = default;
    ExponentVector(std::initializer_list<Term> terms);
    explicit ExponentVector(const Map& entries);

    /**
     * @brief Vector holding a single symbol
     */
    static ExponentVector single(const std::string& symbol, Rational exponent = 1);

    /**
     * @brief Parse compact product notation
     *
     * Accepts factors such as "m2", "s-1", "m(1/2)", "kg1.5" joined by
     * '*' and '/', parenthesized groups and "1" for unity. Digits after
     * an underscore belong to the symbol: "a_0", "mu_0".
     * @throws ParseError on malformed text or a zero exponent
     */
    static ExponentVector fromString(const std::string& text);

    // =========================================================================
    // Algebra
    // =========================================================================

    ExponentVector multiply(const ExponentVector& other) const;
    ExponentVector divide(const ExponentVector& other) const;
    ExponentVector power(const Rational& exponent) const;
    ExponentVector inverse() const;

    ExponentVector operator*(const ExponentVector& other) const { return multiply(other); }
    ExponentVector operator/(const ExponentVector& other) const { return divide(other); }

    bool equals(const ExponentVector& other) const { return entries_ == other.entries_; }
    bool operator==(const ExponentVector& other) const { return equals(other); }
    bool operator!=(const ExponentVector& other) const { return !equals(other); }

    // =========================================================================
    // Access
    // =========================================================================

    /// Exponent of a symbol, zero when absent
    Rational exponent(const std::string& symbol) const;
    bool contains(const std::string& symbol) const { return entries_.count(symbol) > 0; }
    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }
    const Map& entries() const { return entries_; }

    /// Symbols in canonical order
    std::vector<std::string> symbols() const;

    /**
     * @brief Terms ordered by descending exponent magnitude, then alphabetically
     */
    std::vector<Term> terms() const;

    /// Sum of absolute exponents
    Rational l1Norm() const;

    std::size_t hash() const;

    /**
     * @brief Deterministic text form, e.g. "L2*T-2*M"; "1" when empty
     */
    std::string toString() const;

private:
    Map entries_;

    void insert(const std::string& symbol, const Rational& exponent);
};

/// Render an exponent as "2", "-1" or "(1/2)"
std::string exponentToString(const Rational& exponent);

/**
 * @brief Find p/q equal to value (within 1e-12) with q <= max_denominator
 * @return false if no such fraction exists
 */
bool approximateRational(double value, Rational& result, int max_denominator = 1000);

/**
 * @brief Rational arithmetic that stays within int
 * @throws UnitError when a numerator or denominator would overflow
 */
Rational checkedAdd(const Rational& a, const Rational& b);
Rational checkedMultiply(const Rational& a, const Rational& b);
Rational checkedDivide(const Rational& a, const Rational& b);

struct ExponentVectorHash {
    std::size_t operator()(const ExponentVector& v) const { return v.hash(); }
};

} // namespace PQS

#endif // EXPONENT_VECTOR_HPP
