#include "CoherentSimplifier.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace PQS {

namespace {

// Relative tolerance for deciding that a unit carries no scale factor
constexpr double COHERENCE_TOLERANCE = 1e-9;

/**
 * @brief Solve sum_i x_i * dims[i] == target exactly
 * @return false unless a unique solution with all x_i nonzero integers exists
 *         and the elimination stays within int exponents
 */
bool solveExponents(const std::vector<const ExponentVector*>& dims,
                    const ExponentVector& target, std::vector<Rational>& x) {
    std::set<std::string> symbols;
    for (const auto& term : target.entries()) symbols.insert(term.first);
    for (const auto* d : dims) {
        for (const auto& term : d->entries()) symbols.insert(term.first);
    }

    const std::size_t k = dims.size();
    std::vector<std::vector<Rational>> a;
    for (const auto& s : symbols) {
        std::vector<Rational> row(k + 1);
        for (std::size_t j = 0; j < k; ++j) row[j] = dims[j]->exponent(s);
        row[k] = target.exponent(s);
        a.push_back(row);
    }

    std::size_t row = 0;
    for (std::size_t col = 0; col < k; ++col) {
        std::size_t pivot = row;
        while (pivot < a.size() && a[pivot][col] == 0) pivot++;
        if (pivot == a.size()) return false;
        std::swap(a[row], a[pivot]);

        try {
            Rational p = a[row][col];
            for (auto& v : a[row]) v = checkedDivide(v, p);
            for (std::size_t r = 0; r < a.size(); ++r) {
                if (r == row || a[r][col] == 0) continue;
                Rational f = a[r][col];
                for (std::size_t c = col; c <= k; ++c) {
                    a[r][c] = checkedAdd(a[r][c], -checkedMultiply(f, a[row][c]));
                }
            }
        } catch (const UnitError&) {
            return false;
        }
        row++;
    }

    for (std::size_t r = row; r < a.size(); ++r) {
        if (a[r][k] != 0) return false;
    }

    x.assign(k, Rational(0));
    for (std::size_t j = 0; j < k; ++j) {
        x[j] = a[j][k];
        // Gy(1/2) is not a useful display for a velocity
        if (x[j] == 0 || x[j].denominator() != 1) return false;
    }
    return true;
}

// Ranking of combinations with the same number of symbols
struct Score {
    Rational l1;
    std::size_t negative_count = 0;
    std::size_t base_count = 0;
    std::vector<std::size_t> orders;

    bool operator<(const Score& other) const {
        if (l1 != other.l1) return l1 < other.l1;
        if (negative_count != other.negative_count) return negative_count < other.negative_count;
        if (base_count != other.base_count) return base_count < other.base_count;
        return orders < other.orders;
    }
};

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

CoherentSimplifier::CoherentSimplifier(const SymbolTable& table)
    : CoherentSimplifier(table, Settings()) {}

CoherentSimplifier::CoherentSimplifier(const SymbolTable& table, const Settings& settings)
    : table_(table), resolver_(table), settings_(settings) {
    classifyUnits();
}

void CoherentSimplifier::classifyUnits() {
    // The first unit registered with exactly one base dimension defines it
    for (const auto& entry : table_.entries()) {
        const auto* unit = std::get_if<Unit>(&entry.value);
        if (!unit || unit->dimension().size() != 1) continue;

        const auto& term = *unit->dimension().entries().begin();
        if (term.second != 1 || base_units_.count(term.first)) continue;

        base_units_[term.first] = entry.name;
        base_values_[term.first] = unit->value();
    }

    std::set<std::string> base_symbols;
    for (const auto& base : base_units_) base_symbols.insert(base.second);

    for (const auto& entry : table_.entries()) {
        const auto* unit = std::get_if<Unit>(&entry.value);
        if (!unit || unit->dimension().empty() || !isCoherent(*unit)) continue;

        Candidate candidate;
        candidate.unit = unit;
        candidate.order = entry.order;
        candidate.base = base_symbols.count(entry.name) > 0;
        coherent_units_.push_back(candidate);
    }

    std::sort(coherent_units_.begin(), coherent_units_.end(),
              [](const Candidate& a, const Candidate& b) { return a.order < b.order; });
}

bool CoherentSimplifier::isCoherent(const Quantity& unit) const {
    double expected = 1.0;
    for (const auto& term : unit.dimension().entries()) {
        auto it = base_values_.find(term.first);
        if (it == base_values_.end()) return false;
        const Rational& e = term.second;
        expected *= std::pow(it->second, static_cast<double>(e.numerator()) / e.denominator());
    }
    return std::abs(unit.value() / expected - 1.0) <= COHERENCE_TOLERANCE;
}

// =============================================================================
// Relation-based Simplification
// =============================================================================

ExponentVector CoherentSimplifier::simplify(const ExponentVector& display) const {
    return simplify(display, settings_.level);
}

ExponentVector CoherentSimplifier::simplify(const ExponentVector& display, int level) const {
    ExponentVector unit = display;
    if (level <= 0 || unit.l1Norm() <= 1) return unit;

    bool simpler = true;
    while (simpler) {
        simpler = false;
        for (const auto& identity : table_.coherentRelations()) {
            std::vector<std::string> common;
            for (const auto& term : identity.entries()) {
                if (unit.contains(term.first)) common.push_back(term.first);
            }
            // Need at least half of the relation's symbols in common
            if (2 * common.size() + 1 < identity.size()) continue;

            for (const auto& factor : common) {
                Rational f = checkedDivide(unit.exponent(factor), identity.exponent(factor));
                if (f.denominator() != 1) continue;

                ExponentVector candidate = unit.divide(identity.power(f));
                if (level > 1) candidate = simplify(candidate, level - 1);
                if (candidate.l1Norm() < unit.l1Norm()) {
                    unit = candidate;
                    simpler = true;
                    break;
                }
            }
        }
    }
    return unit;
}

// =============================================================================
// Dimension-based Search
// =============================================================================

ExponentVector CoherentSimplifier::baseDecomposition(const ExponentVector& dimension) const {
    ExponentVector::Map result;
    for (const auto& term : dimension.entries()) {
        auto it = base_units_.find(term.first);
        result[it == base_units_.end() ? term.first : it->second] = term.second;
    }
    return ExponentVector(result);
}

ExponentVector CoherentSimplifier::coherentUnitFor(const ExponentVector& dimension) const {
    if (dimension.empty()) return ExponentVector();

    // A combination must beat the base units: fewer symbols, no larger norm.
    // A single unit may still replace a single base unit (Hz for s-1).
    const ExponentVector decomposition = baseDecomposition(dimension);
    const Rational decomposition_l1 = decomposition.l1Norm();
    const std::size_t most_terms = std::max<std::size_t>(decomposition.size() - 1, 1);

    // Units made only of the target's base dimensions
    std::vector<const Candidate*> pool;
    for (const auto& candidate : coherent_units_) {
        bool subset = true;
        for (const auto& term : candidate.unit->dimension().entries()) {
            if (!dimension.contains(term.first)) {
                subset = false;
                break;
            }
        }
        if (subset) pool.push_back(&candidate);
    }

    const std::size_t max_terms = std::min(
        static_cast<std::size_t>(std::max(settings_.max_terms, 0)), most_terms);

    for (std::size_t k = 1; k <= std::min(max_terms, pool.size()); ++k) {
        bool found = false;
        Score best;
        ExponentVector best_display;

        std::vector<std::size_t> idx(k);
        for (std::size_t i = 0; i < k; ++i) idx[i] = i;

        while (true) {
            std::vector<const ExponentVector*> dims;
            for (std::size_t i : idx) dims.push_back(&pool[i]->unit->dimension());

            std::vector<Rational> x;
            if (solveExponents(dims, dimension, x)) {
                Score score;
                ExponentVector::Map display;
                for (std::size_t i = 0; i < k; ++i) {
                    const Candidate* c = pool[idx[i]];
                    if (c->base) score.base_count++;
                    if (x[i] < 0) score.negative_count++;
                    score.l1 = checkedAdd(score.l1, boost::abs(x[i]));
                    score.orders.push_back(c->order);
                    display[c->unit->symbol()] = x[i];
                }
                if (score.l1 <= decomposition_l1 && (!found || score < best)) {
                    found = true;
                    best = score;
                    best_display = ExponentVector(display);
                }
            }

            // Next combination of k indices out of pool.size()
            std::size_t i = k;
            while (i > 0 && idx[i - 1] == pool.size() - k + (i - 1)) i--;
            if (i == 0) break;
            idx[i - 1]++;
            for (std::size_t j = i; j < k; ++j) idx[j] = idx[j - 1] + 1;
        }

        if (found) return best_display;
    }

    return decomposition;
}

std::optional<ExponentVector> CoherentSimplifier::dimensionOfDisplay(
    const ExponentVector& display) const {
    ExponentVector dimension;
    for (const auto& term : display.entries()) {
        std::optional<Symbol> symbol = resolver_.resolve(term.first);
        if (!symbol) return std::nullopt;

        if (const auto* lambda = std::get_if<LambdaUnit>(&*symbol)) {
            if (display.size() != 1 || term.second != 1) return std::nullopt;
            return lambda->dimension();
        }
        dimension = dimension.multiply(dimensionOf(*symbol).power(term.second));
    }
    return dimension;
}

ExponentVector CoherentSimplifier::displayFor(const Quantity& quantity) const {
    const ExponentVector& display = quantity.displayUnit();
    if (!display.empty()) {
        std::optional<ExponentVector> dimension = dimensionOfDisplay(display);
        if (dimension && *dimension == quantity.dimension()) {
            return simplify(display);
        }
    }
    return coherentUnitFor(quantity.dimension());
}

} // namespace PQS
