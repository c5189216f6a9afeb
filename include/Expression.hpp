#ifndef EXPRESSION_HPP
#define EXPRESSION_HPP

#include "Quantity.hpp"
#include "LambdaUnit.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <map>
#include <cstddef>

namespace PQS {

// =============================================================================
// Expression Tree
// =============================================================================

/**
 * @brief Node of a parsed definition expression
 *
 * The tree only holds literals, names, arithmetic, calls to allow-listed
 * functions and single-parameter lambdas; nothing else can be expressed.
 */
struct ExprNode {
    enum class Kind {
        NUMBER,     // 1.5e3
        STRING,     // 'L/T'
        NAME,       // m, pi
        UNARY,      // text = "-" or "+"
        BINARY,     // text = "+", "-", "*", "/", "**"
        CALL,       // text = function name, children = arguments
        LAMBDA      // text = parameter, children[0] = body
    };

    Kind kind = Kind::NUMBER;
    double number = 0.0;
    std::string text;
    std::vector<std::shared_ptr<const ExprNode>> children;
    std::size_t depth = 1;      // height of the subtree rooted here
};

using ExprPtr = std::shared_ptr<const ExprNode>;

// =============================================================================
// Values
// =============================================================================

struct Closure;

/**
 * @brief Result of evaluating an expression
 *
 * UNIT marks a quantity obtained purely from products and powers of units;
 * such a result defines a coherent relation when bound as a unit.
 */
struct Value {
    enum class Kind {
        NUMBER,
        QUANTITY,
        UNIT,
        LAMBDA_UNIT,
        STRING,
        FUNCTION,
        CLOSURE
    };

    Kind kind = Kind::NUMBER;
    double number = 0.0;
    Quantity quantity;
    std::shared_ptr<const LambdaUnit> lambda_unit;
    std::string text;
    std::shared_ptr<const Closure> closure;

    static Value makeNumber(double n);
    static Value makeQuantity(const Quantity& q);
    static Value makeUnit(const Quantity& q);
    static Value makeLambdaUnit(const LambdaUnit& unit);
    static Value makeString(const std::string& s);
    static Value makeFunction(const std::string& name);
    static Value makeClosure(std::shared_ptr<const Closure> closure);

    bool isNumeric() const {
        return kind == Kind::NUMBER || kind == Kind::QUANTITY || kind == Kind::UNIT;
    }

    /// NUMBER, QUANTITY or UNIT as a quantity
    Quantity asQuantity() const;

    std::string typeName() const;
};

/**
 * @brief Lambda literal with the names it referenced bound at creation
 */
struct Closure {
    std::string parameter;
    ExprPtr body;
    std::map<std::string, Value> captured;
};

/**
 * @brief Source of bound names during evaluation
 */
class Environment {
public:
    virtual ~Environment() = default;
    virtual std::optional<Value> resolve(const std::string& name) const = 0;
};

// =============================================================================
// Parser
// =============================================================================

class ExpressionParser {
public:
    /**
     * @brief Parse a complete expression
     * @throws ParseError on syntax errors or calls to names outside the allow-list
     */
    static ExprPtr parse(const std::string& text, const std::string& locator = "");

    /**
     * @brief Parse "expression[, True|False]"
     * @param[out] flag Set when the prefixable flag is present
     */
    static ExprPtr parseDefinition(const std::string& text, std::optional<bool>& flag,
                                   const std::string& locator = "");
};

// =============================================================================
// Evaluator
// =============================================================================

/**
 * @brief Evaluates expression trees against an environment
 *
 * Names resolve to the allow-list first (pi, exp, log, log10, sqrt,
 * Quantity, LambdaUnit), then to the environment.
 */
class Evaluator {
public:
    explicit Evaluator(const Environment& env) : env_(env) {}

    /**
     * @throws UndefinedSymbolError for unbound names
     * @throws DimensionError, UnitError for invalid arithmetic
     */
    Value evaluate(const ExprPtr& node) const;

    /// Names that definitions may not rebind
    static const std::vector<std::string>& reservedNames();
    static bool isReserved(const std::string& name);
    static bool isCallable(const std::string& name);

    /// Apply a closure or allow-listed function to one argument
    static Value call(const Value& function, const Value& argument);

private:
    const Environment& env_;

    Value evaluateName(const std::string& name) const;
    Value evaluateUnary(const ExprNode& node) const;
    Value evaluateBinary(const ExprNode& node) const;
    Value evaluateCall(const ExprNode& node) const;
    Value evaluateLambda(const ExprNode& node) const;
    Value evaluatePower(const Value& base, const ExprPtr& exponent_node) const;
    bool exactRational(const ExprPtr& node, Rational& result) const;

    static Value add(const Value& a, const Value& b, bool subtract);
    static Value multiply(const Value& a, const Value& b, bool divide);
};

} // namespace PQS

#endif // EXPRESSION_HPP
