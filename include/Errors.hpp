#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace PQS {

/**
 * @brief Base class of every error raised by the quantity library
 */
class UnitError : public std::runtime_error {
public:
    explicit UnitError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Operation requires equal dimension vectors (add, subtract, compare)
 */
class DimensionError : public UnitError {
public:
    explicit DimensionError(const std::string& message)
        : UnitError(message) {}
};

/**
 * @brief Quantity cannot be expressed in the requested unit
 */
class IncompatibleUnitError : public UnitError {
public:
    explicit IncompatibleUnitError(const std::string& message)
        : UnitError(message) {}
};

/**
 * @brief Negative value raised to a non-integer exponent
 */
class FractionalPowerOfNegativeError : public UnitError {
public:
    explicit FractionalPowerOfNegativeError(const std::string& message)
        : UnitError(message) {}
};

/**
 * @brief Name is neither registered nor resolvable through a prefix
 */
class LookupError : public UnitError {
public:
    explicit LookupError(const std::string& name)
        : UnitError("Unknown symbol: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * @brief Malformed definition statement, expression or unit string
 *
 * The locator is "source:line" for definition sources and empty for
 * free-standing strings.
 */
class ParseError : public UnitError {
public:
    ParseError(const std::string& message, const std::string& locator = "")
        : UnitError(locator.empty() ? message : locator + ": " + message),
          locator_(locator) {}

    const std::string& locator() const { return locator_; }

private:
    std::string locator_;
};

/**
 * @brief Expression referenced a name that is not bound yet
 */
class UndefinedSymbolError : public UnitError {
public:
    UndefinedSymbolError(const std::string& symbol, const std::string& statement = "",
                         const std::string& locator = "")
        : UnitError(buildMessage(symbol, statement, locator)),
          symbol_(symbol), statement_(statement), locator_(locator) {}

    const std::string& symbol() const { return symbol_; }
    const std::string& statement() const { return statement_; }
    const std::string& locator() const { return locator_; }

private:
    static std::string buildMessage(const std::string& symbol, const std::string& statement,
                                    const std::string& locator) {
        std::string msg = "Undefined symbol '" + symbol + "'";
        if (!statement.empty()) msg += " in statement '" + statement + "'";
        if (!locator.empty()) msg = locator + ": " + msg;
        return msg;
    }

    std::string symbol_;
    std::string statement_;
    std::string locator_;
};

/**
 * @brief Definition statement failed to evaluate, or a source could not be read
 */
class DefinitionError : public UnitError {
public:
    DefinitionError(const std::string& symbol, const std::string& reason,
                    const std::string& locator = "")
        : UnitError((locator.empty() ? std::string() : locator + ": ") +
                    "can't load '" + symbol + "' due to " + reason),
          symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

} // namespace PQS

#endif // ERRORS_HPP
