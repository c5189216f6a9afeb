#include "Expression.hpp"
#include "Errors.hpp"
#include <boost/math/constants/constants.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <set>
#include <sstream>

namespace PQS {

// =============================================================================
// Value Implementation
// =============================================================================

Value Value::makeNumber(double n) {
    Value v;
    v.kind = Kind::NUMBER;
    v.number = n;
    v.quantity = Quantity(n);
    return v;
}

Value Value::makeQuantity(const Quantity& q) {
    Value v;
    v.kind = Kind::QUANTITY;
    v.number = q.value();
    v.quantity = q;
    return v;
}

Value Value::makeUnit(const Quantity& q) {
    Value v = makeQuantity(q);
    v.kind = Kind::UNIT;
    return v;
}

Value Value::makeLambdaUnit(const LambdaUnit& unit) {
    Value v;
    v.kind = Kind::LAMBDA_UNIT;
    v.lambda_unit = std::make_shared<const LambdaUnit>(unit);
    return v;
}

Value Value::makeString(const std::string& s) {
    Value v;
    v.kind = Kind::STRING;
    v.text = s;
    return v;
}

Value Value::makeFunction(const std::string& name) {
    Value v;
    v.kind = Kind::FUNCTION;
    v.text = name;
    return v;
}

Value Value::makeClosure(std::shared_ptr<const Closure> closure) {
    Value v;
    v.kind = Kind::CLOSURE;
    v.closure = std::move(closure);
    return v;
}

Quantity Value::asQuantity() const {
    if (kind == Kind::NUMBER) return Quantity(number);
    if (kind == Kind::QUANTITY || kind == Kind::UNIT) return quantity;
    throw UnitError("Expected a number or quantity, got " + typeName());
}

std::string Value::typeName() const {
    switch (kind) {
        case Kind::NUMBER: return "number";
        case Kind::QUANTITY: return "quantity";
        case Kind::UNIT: return "unit";
        case Kind::LAMBDA_UNIT: return "lambda unit";
        case Kind::STRING: return "string";
        case Kind::FUNCTION: return "function '" + text + "'";
        case Kind::CLOSURE: return "lambda";
    }
    return "unknown";
}

// =============================================================================
// Tokenizer
// =============================================================================

namespace {

struct Token {
    enum class Type { NUMBER, NAME, STRING, OP, END };
    Type type = Type::END;
    std::string text;
    double number = 0.0;
    std::size_t pos = 0;
};

std::vector<Token> tokenize(const std::string& text, const std::string& locator) {
    std::vector<Token> tokens;
    std::size_t i = 0;

    while (i < text.size()) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            i++;
            continue;
        }

        Token tok;
        tok.pos = i;

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && i + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[i + 1])))) {
            const char* begin = text.c_str() + i;
            char* end = nullptr;
            tok.number = std::strtod(begin, &end);
            std::size_t length = static_cast<std::size_t>(end - begin);
            tok.type = Token::Type::NUMBER;
            tok.text = text.substr(i, length);
            i += length;
        } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            std::size_t start = i;
            while (i < text.size() &&
                   (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '_')) {
                i++;
            }
            tok.type = Token::Type::NAME;
            tok.text = text.substr(start, i - start);
        } else if (c == '\'' || c == '"') {
            std::size_t close = text.find(c, i + 1);
            if (close == std::string::npos) {
                throw ParseError("Unterminated string in '" + text + "'", locator);
            }
            tok.type = Token::Type::STRING;
            tok.text = text.substr(i + 1, close - i - 1);
            i = close + 1;
        } else if (text.compare(i, 2, "**") == 0 || text.compare(i, 2, "=>") == 0) {
            tok.type = Token::Type::OP;
            tok.text = text.substr(i, 2);
            i += 2;
        } else if (std::string("+-*/(),").find(c) != std::string::npos) {
            tok.type = Token::Type::OP;
            tok.text = std::string(1, c);
            i++;
        } else {
            throw ParseError("Unexpected character '" + std::string(1, c) + "' in '" + text + "'",
                             locator);
        }
        tokens.push_back(tok);
    }

    Token end;
    end.type = Token::Type::END;
    end.pos = text.size();
    tokens.push_back(end);
    return tokens;
}

// =============================================================================
// Recursive Descent Parser
// =============================================================================

class Parser {
public:
    /// Deepest nesting accepted, both while parsing and in the resulting tree
    static constexpr std::size_t MAX_DEPTH = 256;

    Parser(const std::string& text, const std::string& locator)
        : text_(text), locator_(locator), tokens_(tokenize(text, locator)), pos_(0), depth_(0) {}

    ExprPtr parseExpression() {
        DepthGuard guard(*this);
        // Lambda literal: name => body
        if (current().type == Token::Type::NAME && peek(1).type == Token::Type::OP &&
            peek(1).text == "=>") {
            auto node = std::make_shared<ExprNode>();
            node->kind = ExprNode::Kind::LAMBDA;
            node->text = current().text;
            pos_ += 2;
            attach(*node, parseExpression());
            return node;
        }
        return parseAdditive();
    }

    bool accept(const std::string& op) {
        if (current().type == Token::Type::OP && current().text == op) {
            pos_++;
            return true;
        }
        return false;
    }

    const Token& current() const { return tokens_[pos_]; }

    void advance() { pos_++; }

    bool atEnd() const { return current().type == Token::Type::END; }

    [[noreturn]] void fail(const std::string& reason) const {
        std::stringstream ss;
        ss << reason << " at column " << (current().pos + 1) << " of '" << text_ << "'";
        throw ParseError(ss.str(), locator_);
    }

private:
    const std::string& text_;
    std::string locator_;
    std::vector<Token> tokens_;
    std::size_t pos_;
    std::size_t depth_;

    struct DepthGuard {
        explicit DepthGuard(Parser& p) : parser(p) {
            if (++parser.depth_ > MAX_DEPTH) {
                --parser.depth_;
                parser.fail("Expression nested too deeply");
            }
        }
        ~DepthGuard() { --parser.depth_; }
        Parser& parser;
    };

    // Left-associative chains grow the tree without recursing here
    void attach(ExprNode& node, ExprPtr child) {
        node.depth = std::max(node.depth, child->depth + 1);
        if (node.depth > MAX_DEPTH) fail("Expression nested too deeply");
        node.children.push_back(std::move(child));
    }

    const Token& peek(std::size_t offset) const {
        std::size_t i = std::min(pos_ + offset, tokens_.size() - 1);
        return tokens_[i];
    }

    ExprPtr binary(const std::string& op, ExprPtr lhs, ExprPtr rhs) {
        auto node = std::make_shared<ExprNode>();
        node->kind = ExprNode::Kind::BINARY;
        node->text = op;
        attach(*node, std::move(lhs));
        attach(*node, std::move(rhs));
        return node;
    }

    ExprPtr parseAdditive() {
        ExprPtr lhs = parseTerm();
        while (true) {
            if (accept("+")) {
                lhs = binary("+", lhs, parseTerm());
            } else if (accept("-")) {
                lhs = binary("-", lhs, parseTerm());
            } else {
                return lhs;
            }
        }
    }

    ExprPtr parseTerm() {
        ExprPtr lhs = parseUnary();
        while (true) {
            if (accept("*")) {
                lhs = binary("*", lhs, parseUnary());
            } else if (accept("/")) {
                lhs = binary("/", lhs, parseUnary());
            } else {
                return lhs;
            }
        }
    }

    // Unary minus binds looser than '**': -2**2 == -4
    ExprPtr parseUnary() {
        DepthGuard guard(*this);
        if (current().type == Token::Type::OP && (current().text == "-" || current().text == "+")) {
            auto node = std::make_shared<ExprNode>();
            node->kind = ExprNode::Kind::UNARY;
            node->text = current().text;
            advance();
            attach(*node, parseUnary());
            return node;
        }
        return parsePower();
    }

    // Right associative; the exponent may carry its own sign: m**-1
    ExprPtr parsePower() {
        ExprPtr base = parsePrimary();
        if (accept("**")) {
            return binary("**", base, parseUnary());
        }
        return base;
    }

    ExprPtr parsePrimary() {
        const Token& tok = current();
        auto node = std::make_shared<ExprNode>();

        switch (tok.type) {
            case Token::Type::NUMBER:
                node->kind = ExprNode::Kind::NUMBER;
                node->number = tok.number;
                node->text = tok.text;
                advance();
                return node;

            case Token::Type::STRING:
                node->kind = ExprNode::Kind::STRING;
                node->text = tok.text;
                advance();
                return node;

            case Token::Type::NAME: {
                std::string name = tok.text;
                advance();
                if (!accept("(")) {
                    node->kind = ExprNode::Kind::NAME;
                    node->text = name;
                    return node;
                }
                if (!Evaluator::isCallable(name)) {
                    fail("Call to '" + name + "' is not allowed");
                }
                node->kind = ExprNode::Kind::CALL;
                node->text = name;
                if (!accept(")")) {
                    do {
                        attach(*node, parseExpression());
                    } while (accept(","));
                    if (!accept(")")) fail("Expected ')'");
                }
                return node;
            }

            case Token::Type::OP:
                if (accept("(")) {
                    ExprPtr inner = parseExpression();
                    if (!accept(")")) fail("Expected ')'");
                    return inner;
                }
                fail("Unexpected '" + tok.text + "'");

            case Token::Type::END:
                fail("Unexpected end of expression");
        }
        fail("Unexpected token");
    }
};

// =============================================================================
// Evaluation Helpers
// =============================================================================

const std::vector<std::string>& callableNames() {
    static const std::vector<std::string> names = {
        "exp", "log", "log10", "sqrt", "Quantity", "LambdaUnit"
    };
    return names;
}

double numberArgument(const Value& v, const std::string& function) {
    if (v.kind == Value::Kind::NUMBER) return v.number;
    if (v.kind == Value::Kind::QUANTITY || v.kind == Value::Kind::UNIT) {
        if (!v.quantity.isDimensionless()) {
            throw DimensionError(function + "() needs a dimensionless argument, got dimension " +
                                 v.quantity.dimension().toString());
        }
        return v.quantity.value();
    }
    throw UnitError(function + "() needs a number, got " + v.typeName());
}

ExponentVector stringArgument(const std::vector<Value>& args, std::size_t i,
                              const std::string& function) {
    if (i >= args.size()) return ExponentVector();
    if (args[i].kind != Value::Kind::STRING) {
        throw UnitError(function + "() argument " + std::to_string(i + 1) +
                        " must be a string, got " + args[i].typeName());
    }
    return ExponentVector::fromString(args[i].text);
}

/// Resolves a closure's parameter and captured names
class ClosureEnvironment : public Environment {
public:
    ClosureEnvironment(const Closure& closure, const Value& argument)
        : closure_(closure), argument_(argument) {}

    std::optional<Value> resolve(const std::string& name) const override {
        if (name == closure_.parameter) return argument_;
        auto it = closure_.captured.find(name);
        if (it == closure_.captured.end()) return std::nullopt;
        return it->second;
    }

private:
    const Closure& closure_;
    const Value& argument_;
};

void collectFreeNames(const ExprNode& node, std::set<std::string> bound,
                      std::set<std::string>& names) {
    switch (node.kind) {
        case ExprNode::Kind::NAME:
            if (!bound.count(node.text) && !Evaluator::isReserved(node.text)) {
                names.insert(node.text);
            }
            return;
        case ExprNode::Kind::LAMBDA:
            bound.insert(node.text);
            break;
        default:
            break;
    }
    for (const auto& child : node.children) {
        collectFreeNames(*child, bound, names);
    }
}

Quantity resultAsQuantity(const Value& v) {
    if (v.isNumeric()) return v.asQuantity();
    throw UnitError("Lambda unit function must return a number or quantity, got " + v.typeName());
}

} // anonymous namespace

// =============================================================================
// ExpressionParser Implementation
// =============================================================================

ExprPtr ExpressionParser::parse(const std::string& text, const std::string& locator) {
    Parser parser(text, locator);
    ExprPtr expr = parser.parseExpression();
    if (!parser.atEnd()) parser.fail("Unexpected '" + parser.current().text + "'");
    return expr;
}

ExprPtr ExpressionParser::parseDefinition(const std::string& text, std::optional<bool>& flag,
                                          const std::string& locator) {
    Parser parser(text, locator);
    ExprPtr expr = parser.parseExpression();
    flag.reset();

    if (parser.accept(",")) {
        const Token& tok = parser.current();
        if (tok.type == Token::Type::NAME && (tok.text == "True" || tok.text == "False")) {
            flag = (tok.text == "True");
            parser.advance();
        } else {
            parser.fail("Expected True or False after ','");
        }
    }
    if (!parser.atEnd()) parser.fail("Unexpected '" + parser.current().text + "'");
    return expr;
}

// =============================================================================
// Evaluator Implementation
// =============================================================================

const std::vector<std::string>& Evaluator::reservedNames() {
    static const std::vector<std::string> names = {
        "pi", "exp", "log", "log10", "sqrt", "Quantity", "LambdaUnit", "True", "False"
    };
    return names;
}

bool Evaluator::isReserved(const std::string& name) {
    const auto& names = reservedNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool Evaluator::isCallable(const std::string& name) {
    const auto& names = callableNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

Value Evaluator::evaluate(const ExprPtr& node) const {
    switch (node->kind) {
        case ExprNode::Kind::NUMBER:
            return Value::makeNumber(node->number);
        case ExprNode::Kind::STRING:
            return Value::makeString(node->text);
        case ExprNode::Kind::NAME:
            return evaluateName(node->text);
        case ExprNode::Kind::UNARY:
            return evaluateUnary(*node);
        case ExprNode::Kind::BINARY:
            return evaluateBinary(*node);
        case ExprNode::Kind::CALL:
            return evaluateCall(*node);
        case ExprNode::Kind::LAMBDA:
            return evaluateLambda(*node);
    }
    throw UnitError("Unknown expression node");
}

Value Evaluator::evaluateName(const std::string& name) const {
    if (name == "pi") return Value::makeNumber(boost::math::constants::pi<double>());
    if (isCallable(name)) return Value::makeFunction(name);
    if (name == "True" || name == "False") {
        throw UnitError("'" + name + "' is only allowed as the prefixable flag");
    }

    std::optional<Value> value = env_.resolve(name);
    if (!value) throw UndefinedSymbolError(name);
    return *value;
}

Value Evaluator::evaluateUnary(const ExprNode& node) const {
    Value operand = evaluate(node.children[0]);
    if (node.text == "+") return operand;

    switch (operand.kind) {
        case Value::Kind::NUMBER:
            return Value::makeNumber(-operand.number);
        case Value::Kind::QUANTITY:
        case Value::Kind::UNIT:
            return Value::makeQuantity(operand.quantity.negate());
        default:
            throw UnitError("Cannot negate " + operand.typeName());
    }
}

Value Evaluator::evaluateBinary(const ExprNode& node) const {
    if (node.text == "**") {
        return evaluatePower(evaluate(node.children[0]), node.children[1]);
    }

    Value lhs = evaluate(node.children[0]);
    Value rhs = evaluate(node.children[1]);

    if (node.text == "+") return add(lhs, rhs, false);
    if (node.text == "-") return add(lhs, rhs, true);
    if (node.text == "*") return multiply(lhs, rhs, false);
    return multiply(lhs, rhs, true);
}

Value Evaluator::add(const Value& a, const Value& b, bool subtract) {
    if (!a.isNumeric() || !b.isNumeric()) {
        throw UnitError("Cannot " + std::string(subtract ? "subtract " : "add ") +
                        b.typeName() + (subtract ? " from " : " to ") + a.typeName());
    }
    if (a.kind == Value::Kind::NUMBER && b.kind == Value::Kind::NUMBER) {
        return Value::makeNumber(subtract ? a.number - b.number : a.number + b.number);
    }

    Quantity qa = a.asQuantity();
    Quantity qb = b.asQuantity();
    Quantity sum = subtract ? qa.subtract(qb) : qa.add(qb);
    if (sum.isDimensionless() &&
        (a.kind == Value::Kind::NUMBER || b.kind == Value::Kind::NUMBER)) {
        return Value::makeNumber(sum.value());
    }
    return Value::makeQuantity(sum);
}

Value Evaluator::multiply(const Value& a, const Value& b, bool divide) {
    const char* op = divide ? "divide" : "multiply";

    if (a.kind == Value::Kind::LAMBDA_UNIT) {
        throw UnitError("Lambda unit can only appear on the right side of '" +
                        std::string(divide ? "/" : "*") + "'");
    }

    if (b.kind == Value::Kind::LAMBDA_UNIT) {
        const LambdaUnit& unit = *b.lambda_unit;
        if (divide) {
            if (!a.isNumeric()) {
                throw UnitError("Cannot divide " + a.typeName() + " by a lambda unit");
            }
            return Value::makeNumber(unit.toNumber(a.asQuantity()));
        }
        if (a.kind == Value::Kind::UNIT) {
            throw UnitError("Cannot multiply a unit by a lambda unit");
        }
        if (!a.isNumeric()) {
            throw UnitError("Cannot multiply " + a.typeName() + " by a lambda unit");
        }
        return Value::makeQuantity(unit.toQuantity(a.asQuantity().toNumber()));
    }

    if (!a.isNumeric() || !b.isNumeric()) {
        throw UnitError(std::string("Cannot ") + op + " " + a.typeName() + " and " + b.typeName());
    }

    if (a.kind == Value::Kind::NUMBER && b.kind == Value::Kind::NUMBER) {
        return Value::makeNumber(divide ? a.number / b.number : a.number * b.number);
    }
    if (a.kind == Value::Kind::NUMBER || b.kind == Value::Kind::NUMBER) {
        Quantity result = divide ? a.asQuantity().divide(b.asQuantity())
                                 : a.asQuantity().multiply(b.asQuantity());
        return Value::makeQuantity(result);
    }

    Quantity result = divide ? a.quantity.divide(b.quantity) : a.quantity.multiply(b.quantity);
    if (result.isDimensionless()) {
        return Value::makeNumber(result.value());
    }
    if (a.kind == Value::Kind::UNIT && b.kind == Value::Kind::UNIT) {
        return Value::makeUnit(result);
    }
    return Value::makeQuantity(result);
}

bool Evaluator::exactRational(const ExprPtr& node, Rational& result) const {
    switch (node->kind) {
        case ExprNode::Kind::NUMBER: {
            double n = node->number;
            if (std::floor(n) != n || std::abs(n) > 1e9) return false;
            result = Rational(static_cast<int>(n));
            return true;
        }
        case ExprNode::Kind::UNARY: {
            Rational inner;
            if (!exactRational(node->children[0], inner)) return false;
            result = node->text == "-" ? -inner : inner;
            return true;
        }
        case ExprNode::Kind::BINARY: {
            Rational a, b;
            if (node->text == "**") return false;
            if (!exactRational(node->children[0], a) || !exactRational(node->children[1], b)) {
                return false;
            }
            if (node->text == "+") result = checkedAdd(a, b);
            else if (node->text == "-") result = checkedAdd(a, -b);
            else if (node->text == "*") result = checkedMultiply(a, b);
            else {
                if (b == 0) return false;
                result = checkedDivide(a, b);
            }
            return true;
        }
        default:
            return false;
    }
}

Value Evaluator::evaluatePower(const Value& base, const ExprPtr& exponent_node) const {
    Rational exponent;
    bool rational = exactRational(exponent_node, exponent);
    double real_exponent = 0.0;
    if (rational) {
        real_exponent = static_cast<double>(exponent.numerator()) / exponent.denominator();
    } else {
        real_exponent = numberArgument(evaluate(exponent_node), "pow");
        rational = approximateRational(real_exponent, exponent);
    }

    switch (base.kind) {
        case Value::Kind::LAMBDA_UNIT:
            if (!rational) throw UnitError("Lambda unit exponent must be 1 or -1");
            if (exponent == 0) return Value::makeNumber(1.0);
            return Value::makeLambdaUnit(base.lambda_unit->power(exponent));

        case Value::Kind::NUMBER:
            if (base.number < 0.0 && std::floor(real_exponent) != real_exponent) {
                std::stringstream ss;
                ss << "Cannot raise negative value " << base.number << " to the power "
                   << real_exponent;
                throw FractionalPowerOfNegativeError(ss.str());
            }
            return Value::makeNumber(std::pow(base.number, real_exponent));

        case Value::Kind::QUANTITY:
        case Value::Kind::UNIT: {
            if (!rational) {
                if (!base.quantity.isDimensionless()) {
                    throw UnitError("Exponent of a dimensioned quantity must be rational");
                }
                return Value::makeNumber(std::pow(base.quantity.value(), real_exponent));
            }
            Quantity result = base.quantity.power(exponent);
            if (result.isDimensionless() && base.kind != Value::Kind::UNIT) {
                return Value::makeNumber(result.value());
            }
            return base.kind == Value::Kind::UNIT ? Value::makeUnit(result)
                                                  : Value::makeQuantity(result);
        }

        default:
            throw UnitError("Cannot raise " + base.typeName() + " to a power");
    }
}

Value Evaluator::evaluateLambda(const ExprNode& node) const {
    auto closure = std::make_shared<Closure>();
    closure->parameter = node.text;
    closure->body = node.children[0];

    std::set<std::string> names;
    collectFreeNames(*closure->body, {closure->parameter}, names);
    for (const auto& name : names) {
        std::optional<Value> value = env_.resolve(name);
        if (!value) throw UndefinedSymbolError(name);
        closure->captured[name] = *value;
    }
    return Value::makeClosure(closure);
}

Value Evaluator::call(const Value& function, const Value& argument) {
    if (function.kind == Value::Kind::CLOSURE) {
        ClosureEnvironment env(*function.closure, argument);
        Evaluator evaluator(env);
        return evaluator.evaluate(function.closure->body);
    }
    if (function.kind != Value::Kind::FUNCTION) {
        throw UnitError(function.typeName() + " is not callable");
    }

    const std::string& name = function.text;
    if (name == "sqrt") {
        if (argument.kind == Value::Kind::NUMBER) {
            if (argument.number < 0.0) {
                throw FractionalPowerOfNegativeError("Cannot take the square root of " +
                                                     std::to_string(argument.number));
            }
            return Value::makeNumber(std::sqrt(argument.number));
        }
        if (argument.kind == Value::Kind::QUANTITY || argument.kind == Value::Kind::UNIT) {
            Quantity root = argument.quantity.power(Rational(1, 2));
            if (argument.kind == Value::Kind::UNIT) return Value::makeUnit(root);
            return Value::makeQuantity(root);
        }
        throw UnitError("sqrt() needs a number or quantity, got " + argument.typeName());
    }

    double x = numberArgument(argument, name);
    if (name == "exp") return Value::makeNumber(std::exp(x));
    if (name == "log") return Value::makeNumber(std::log(x));
    if (name == "log10") return Value::makeNumber(std::log10(x));
    throw UnitError("Function '" + name + "' takes more than one argument");
}

Value Evaluator::evaluateCall(const ExprNode& node) const {
    std::vector<Value> args;
    for (const auto& child : node.children) {
        args.push_back(evaluate(child));
    }
    const std::string& name = node.text;

    if (name == "Quantity") {
        if (args.empty() || args.size() > 3) {
            throw UnitError(name + "() takes a value, a dimension and an optional display unit");
        }
        double value = numberArgument(args[0], name);
        ExponentVector dimension = stringArgument(args, 1, name);
        ExponentVector display = stringArgument(args, 2, name);
        return Value::makeQuantity(Quantity(value, dimension, display));
    }

    if (name == "LambdaUnit") {
        if (args.size() < 2 || args.size() > 3) {
            throw UnitError("LambdaUnit() takes forward and inverse functions and an optional dimension");
        }
        for (std::size_t i = 0; i < 2; ++i) {
            if (args[i].kind != Value::Kind::CLOSURE && args[i].kind != Value::Kind::FUNCTION) {
                throw UnitError("LambdaUnit() argument " + std::to_string(i + 1) +
                                " must be a function, got " + args[i].typeName());
            }
        }
        Value forward_fn = args[0];
        Value inverse_fn = args[1];

        LambdaUnit::Forward forward = [forward_fn](double n) {
            return resultAsQuantity(call(forward_fn, Value::makeNumber(n)));
        };
        LambdaUnit::Inverse inverse = [inverse_fn](const Quantity& q) {
            Value arg = q.isDimensionless() ? Value::makeNumber(q.value()) : Value::makeQuantity(q);
            return numberArgument(call(inverse_fn, arg), "inverse");
        };

        ExponentVector dimension = args.size() == 3 ? stringArgument(args, 2, name)
                                                    : forward(0.0).dimension();
        return Value::makeLambdaUnit(LambdaUnit(forward, inverse, dimension));
    }

    if (args.size() != 1) {
        throw UnitError(name + "() takes exactly one argument");
    }
    return call(Value::makeFunction(name), args[0]);
}

} // namespace PQS
