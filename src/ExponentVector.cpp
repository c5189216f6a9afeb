#include "ExponentVector.hpp"
#include "Errors.hpp"
#include <boost/functional/hash.hpp>
#include <algorithm>
#include <sstream>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <numeric>

namespace PQS {

// =============================================================================
// Construction
// =============================================================================

ExponentVector::ExponentVector(std::initializer_list<Term> terms) {
    for (const auto& term : terms) {
        insert(term.first, term.second);
    }
}

ExponentVector::ExponentVector(const Map& entries) {
    for (const auto& term : entries) {
        insert(term.first, term.second);
    }
}

ExponentVector ExponentVector::single(const std::string& symbol, Rational exponent) {
    ExponentVector v;
    v.insert(symbol, exponent);
    return v;
}

void ExponentVector::insert(const std::string& symbol, const Rational& exponent) {
    Rational total = exponent;
    auto it = entries_.find(symbol);
    if (it != entries_.end()) {
        total = checkedAdd(total, it->second);
    }
    if (total == 0) {
        if (it != entries_.end()) entries_.erase(it);
    } else {
        entries_[symbol] = total;
    }
}

// =============================================================================
// Algebra
// =============================================================================

ExponentVector ExponentVector::multiply(const ExponentVector& other) const {
    ExponentVector result(*this);
    for (const auto& term : other.entries_) {
        result.insert(term.first, term.second);
    }
    return result;
}

ExponentVector ExponentVector::divide(const ExponentVector& other) const {
    ExponentVector result(*this);
    for (const auto& term : other.entries_) {
        result.insert(term.first, -term.second);
    }
    return result;
}

ExponentVector ExponentVector::power(const Rational& exponent) const {
    ExponentVector result;
    if (exponent == 0) return result;
    for (const auto& term : entries_) {
        result.entries_[term.first] = checkedMultiply(term.second, exponent);
    }
    return result;
}

ExponentVector ExponentVector::inverse() const {
    return power(Rational(-1));
}

// =============================================================================
// Access
// =============================================================================

Rational ExponentVector::exponent(const std::string& symbol) const {
    auto it = entries_.find(symbol);
    return it == entries_.end() ? Rational(0) : it->second;
}

std::vector<std::string> ExponentVector::symbols() const {
    std::vector<std::string> result;
    for (const auto& term : terms()) {
        result.push_back(term.first);
    }
    return result;
}

std::vector<ExponentVector::Term> ExponentVector::terms() const {
    std::vector<Term> result(entries_.begin(), entries_.end());
    // std::map already gives alphabetical order; stable sort keeps it for ties
    std::stable_sort(result.begin(), result.end(), [](const Term& a, const Term& b) {
        return boost::abs(a.second) > boost::abs(b.second);
    });
    return result;
}

Rational ExponentVector::l1Norm() const {
    Rational total(0);
    for (const auto& term : entries_) {
        total = checkedAdd(total, boost::abs(term.second));
    }
    return total;
}

std::size_t ExponentVector::hash() const {
    std::size_t seed = 0;
    for (const auto& term : entries_) {
        boost::hash_combine(seed, term.first);
        boost::hash_combine(seed, term.second.numerator());
        boost::hash_combine(seed, term.second.denominator());
    }
    return seed;
}

std::string ExponentVector::toString() const {
    if (entries_.empty()) return "1";

    std::stringstream ss;
    bool first = true;
    for (const auto& term : terms()) {
        if (!first) ss << "*";
        if (term.second == 1) {
            ss << term.first;
        } else if (std::isdigit(static_cast<unsigned char>(term.first.back()))) {
            // a_0 squared must not read back as a_02
            ss << "(" << term.first << ")" << exponentToString(term.second);
        } else {
            ss << term.first << exponentToString(term.second);
        }
        first = false;
    }
    return ss.str();
}

std::string exponentToString(const Rational& exponent) {
    std::stringstream ss;
    if (exponent.denominator() == 1) {
        ss << exponent.numerator();
    } else {
        ss << "(" << exponent.numerator() << "/" << exponent.denominator() << ")";
    }
    return ss.str();
}

bool approximateRational(double value, Rational& result, int max_denominator) {
    if (!std::isfinite(value)) return false;
    for (int q = 1; q <= max_denominator; ++q) {
        double p = std::round(value * q);
        if (std::abs(p) > 1e9) return false;
        if (std::abs(p / q - value) <= 1e-12 * std::max(1.0, std::abs(value))) {
            result = Rational(static_cast<int>(p), q);
            return true;
        }
    }
    return false;
}

// =============================================================================
// Checked Arithmetic
// =============================================================================

namespace {

Rational reduced(long long num, long long den) {
    long long g = std::gcd(num, den);
    if (g != 0) {
        num /= g;
        den /= g;
    }
    if (den < 0) {
        num = -num;
        den = -den;
    }
    const long long limit = std::numeric_limits<int>::max();
    if (num > limit || num < -limit || den > limit) {
        std::stringstream ss;
        ss << "Exponent " << num << "/" << den << " is out of range";
        throw UnitError(ss.str());
    }
    return Rational(static_cast<int>(num), static_cast<int>(den));
}

} // anonymous namespace

Rational checkedAdd(const Rational& a, const Rational& b) {
    long long num = static_cast<long long>(a.numerator()) * b.denominator() +
                    static_cast<long long>(b.numerator()) * a.denominator();
    long long den = static_cast<long long>(a.denominator()) * b.denominator();
    return reduced(num, den);
}

Rational checkedMultiply(const Rational& a, const Rational& b) {
    long long num = static_cast<long long>(a.numerator()) * b.numerator();
    long long den = static_cast<long long>(a.denominator()) * b.denominator();
    return reduced(num, den);
}

Rational checkedDivide(const Rational& a, const Rational& b) {
    if (b == 0) throw UnitError("Division of an exponent by zero");
    long long num = static_cast<long long>(a.numerator()) * b.denominator();
    long long den = static_cast<long long>(a.denominator()) * b.numerator();
    return reduced(num, den);
}

// =============================================================================
// Parsing
// =============================================================================

namespace {

/**
 * @brief Recursive descent parser for compact product notation
 */
class ProductParser {
public:
    explicit ProductParser(const std::string& text) : text_(text), pos_(0), depth_(0) {}

    ExponentVector parse() {
        skipSpace();
        if (pos_ >= text_.size()) return ExponentVector();
        ExponentVector result = parseProduct();
        skipSpace();
        if (pos_ != text_.size()) {
            fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        }
        return result;
    }

private:
    static constexpr std::size_t MAX_DEPTH = 256;

    const std::string& text_;
    std::size_t pos_;
    std::size_t depth_;

    void skipSpace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            pos_++;
        }
    }

    bool peek(char c) {
        skipSpace();
        return pos_ < text_.size() && text_[pos_] == c;
    }

    [[noreturn]] void fail(const std::string& reason) const {
        throw ParseError("Invalid unit string '" + text_ + "': " + reason);
    }

    ExponentVector parseProduct() {
        ExponentVector result = parseFactor();
        while (true) {
            if (peek('*')) {
                pos_++;
                result = result.multiply(parseFactor());
            } else if (peek('/')) {
                pos_++;
                result = result.divide(parseFactor());
            } else {
                break;
            }
        }
        return result;
    }

    ExponentVector parseFactor() {
        skipSpace();
        if (pos_ >= text_.size()) fail("missing factor");

        ExponentVector base;
        char c = text_[pos_];
        if (c == '(') {
            if (++depth_ > MAX_DEPTH) fail("too many nested groups");
            pos_++;
            base = parseProduct();
            if (!peek(')')) fail("missing ')'");
            pos_++;
            depth_--;
        } else if (c == '1') {
            pos_++;
            return ExponentVector();
        } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            std::size_t start = pos_;
            while (pos_ < text_.size()) {
                if (std::isalpha(static_cast<unsigned char>(text_[pos_]))) {
                    pos_++;
                } else if (text_[pos_] == '_') {
                    // g_0, mu_0: digits after an underscore are part of the name
                    pos_++;
                    while (pos_ < text_.size() &&
                           std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                        pos_++;
                    }
                } else {
                    break;
                }
            }
            base = ExponentVector::single(text_.substr(start, pos_ - start));
        } else {
            fail("unexpected '" + std::string(1, c) + "'");
        }

        Rational exponent(1);
        if (parseExponent(exponent)) {
            if (exponent == 0) fail("zero exponent");
            return base.power(exponent);
        }
        return base;
    }

    // Exponent directly follows its base: m2, s-1, m(1/2), kg1.5
    bool parseExponent(Rational& exponent) {
        if (pos_ >= text_.size()) return false;
        char c = text_[pos_];

        if (c == '(' && isFraction()) {
            pos_++;
            int num = parseInteger();
            if (pos_ >= text_.size() || text_[pos_] != '/') fail("expected '/' in exponent");
            pos_++;
            int den = parseInteger();
            if (pos_ >= text_.size() || text_[pos_] != ')') fail("expected ')' in exponent");
            pos_++;
            if (den == 0) fail("zero denominator");
            exponent = Rational(num, den);
            return true;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.') {
            std::size_t start = pos_;
            if (c == '-' || c == '+') pos_++;
            while (pos_ < text_.size() &&
                   (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
                pos_++;
            }
            std::string token = text_.substr(start, pos_ - start);
            if (token == "-" || token == "+" || token == ".") fail("bad exponent");
            double value = std::strtod(token.c_str(), nullptr);
            if (!approximateRational(value, exponent)) fail("exponent " + token + " is not rational");
            return true;
        }
        return false;
    }

    bool isFraction() const {
        // "(int/int)" as opposed to a parenthesized group
        std::size_t i = pos_ + 1;
        if (i < text_.size() && (text_[i] == '-' || text_[i] == '+')) i++;
        bool digits = false;
        while (i < text_.size() && std::isdigit(static_cast<unsigned char>(text_[i]))) {
            i++;
            digits = true;
        }
        return digits && i < text_.size() && text_[i] == '/';
    }

    int parseInteger() {
        std::size_t start = pos_;
        if (pos_ < text_.size() && (text_[pos_] == '-' || text_[pos_] == '+')) pos_++;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            pos_++;
        }
        std::string token = text_.substr(start, pos_ - start);
        if (token.empty() || token == "-" || token == "+") fail("expected integer");
        long long value = std::strtoll(token.c_str(), nullptr, 10);
        if (token.size() > 11 || std::abs(value) > std::numeric_limits<int>::max()) {
            fail("exponent " + token + " is out of range");
        }
        return static_cast<int>(value);
    }
};

} // anonymous namespace

ExponentVector ExponentVector::fromString(const std::string& text) {
    ProductParser parser(text);
    return parser.parse();
}

} // namespace PQS
