#include "DefinitionParser.hpp"
#include "Expression.hpp"
#include "PrefixResolver.hpp"
#include "Errors.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <cctype>

namespace PQS {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool isIdentifier(const std::string& s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

/// First occurrence of c outside quotes
size_t findUnquoted(const std::string& line, char c) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        if (quote) {
            if (line[i] == quote) quote = 0;
        } else if (line[i] == '\'' || line[i] == '"') {
            quote = line[i];
        } else if (line[i] == c) {
            return i;
        }
    }
    return std::string::npos;
}

/**
 * @brief Names visible to statement i: everything bound so far
 */
class TableEnvironment : public Environment {
public:
    explicit TableEnvironment(const SymbolTable& table) : resolver_(table) {}

    std::optional<Value> resolve(const std::string& name) const override {
        std::optional<Symbol> symbol = resolver_.resolve(name);
        if (!symbol) return std::nullopt;

        if (const auto* constant = std::get_if<Constant>(&*symbol)) {
            Quantity q(constant->value(), constant->dimension(), constant->displayUnit());
            if (q.isDimensionless() && q.displayUnit().empty()) {
                return Value::makeNumber(q.value());
            }
            return Value::makeQuantity(q);
        }
        if (const auto* unit = std::get_if<Unit>(&*symbol)) {
            return Value::makeUnit(Quantity(unit->value(), unit->dimension(), unit->displayUnit()));
        }
        return Value::makeLambdaUnit(std::get<LambdaUnit>(*symbol));
    }

private:
    PrefixResolver resolver_;
};

} // anonymous namespace

// =============================================================================
// DefinitionSource
// =============================================================================

DefinitionSource DefinitionSource::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DefinitionError(path, "the file cannot be opened");
    }
    std::stringstream ss;
    ss << file.rdbuf();

    // Name the source by its file name only
    size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return DefinitionSource{name, ss.str()};
}

DefinitionSource DefinitionSource::fromString(const std::string& name, const std::string& text) {
    return DefinitionSource{name, text};
}

// =============================================================================
// Statement Parsing
// =============================================================================

std::vector<Statement> DefinitionParser::parseStatements(const DefinitionSource& source) {
    std::vector<Statement> statements;
    std::istringstream input(source.text);
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        std::string locator = source.name + ":" + std::to_string(line_num);

        // Section divider [Section]
        if (line[0] == '[') {
            if (line.back() != ']') {
                throw ParseError("Unterminated section divider '" + line + "'", locator);
            }
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        Statement statement;
        statement.section = current_section;
        statement.locator = locator;

        size_t note_pos = findUnquoted(line, ';');
        if (note_pos != std::string::npos) {
            statement.note = trim(line.substr(note_pos + 1));
            line = trim(line.substr(0, note_pos));
        }
        statement.text = line;

        // '=' that is not part of '=>'
        size_t eq_pos = findUnquoted(line, '=');
        if (eq_pos == std::string::npos || (eq_pos + 1 < line.size() && line[eq_pos + 1] == '>')) {
            throw ParseError("Expected 'symbol = expression', got '" + line + "'", locator);
        }

        statement.symbol = trim(line.substr(0, eq_pos));
        statement.expression = trim(line.substr(eq_pos + 1));

        if (!isIdentifier(statement.symbol)) {
            throw ParseError("Invalid symbol name '" + statement.symbol + "'", locator);
        }
        if (statement.expression.empty()) {
            throw ParseError("Missing expression for '" + statement.symbol + "'", locator);
        }
        statements.push_back(statement);
    }

    return statements;
}

// =============================================================================
// Table Construction
// =============================================================================

std::shared_ptr<const SymbolTable> DefinitionParser::build(
    const std::vector<DefinitionSource>& sources) const {
    auto table = std::make_shared<SymbolTable>();

    for (const auto& source : sources) {
        for (const auto& statement : parseStatements(source)) {
            evaluateStatement(statement, *table);
        }
    }

    return table;
}

std::shared_ptr<const SymbolTable> DefinitionParser::buildFromFiles(
    const std::vector<std::string>& paths) const {
    std::vector<DefinitionSource> sources;
    for (const auto& path : paths) {
        sources.push_back(DefinitionSource::fromFile(path));
    }
    return build(sources);
}

void DefinitionParser::evaluateStatement(const Statement& statement, SymbolTable& table) const {
    const std::string& symbol = statement.symbol;

    if (Evaluator::isReserved(symbol)) {
        throw ParseError("'" + symbol + "' is a reserved name", statement.locator);
    }

    std::optional<bool> prefixable;
    ExprPtr expr = ExpressionParser::parseDefinition(statement.expression, prefixable,
                                                     statement.locator);

    Value result;
    try {
        TableEnvironment env(table);
        Evaluator evaluator(env);
        result = evaluator.evaluate(expr);
    } catch (const UndefinedSymbolError& e) {
        throw UndefinedSymbolError(e.symbol(), statement.text, statement.locator);
    } catch (const ParseError& e) {
        // Raised by malformed dimension strings inside the expression
        throw ParseError(e.what(), statement.locator);
    } catch (const UnitError& e) {
        throw DefinitionError(symbol, e.what(), statement.locator);
    }

    SymbolTable::Entry entry;
    entry.name = symbol;
    entry.section = statement.section;
    entry.note = statement.note;
    entry.locator = statement.locator;

    ExponentVector relation;
    switch (result.kind) {
        case Value::Kind::LAMBDA_UNIT:
            entry.value = result.lambda_unit->renamed(symbol, prefixable.value_or(false));
            break;

        case Value::Kind::NUMBER:
        case Value::Kind::QUANTITY:
        case Value::Kind::UNIT: {
            Quantity q = result.asQuantity();
            if (!prefixable) {
                entry.value = Constant(symbol, q);
                break;
            }
            entry.value = Unit(symbol, q, *prefixable);
            // Pure products of units are coherent: display/symbol == 1
            if (result.kind == Value::Kind::UNIT && !q.displayUnit().contains(symbol)) {
                relation = q.displayUnit().divide(ExponentVector::single(symbol));
            }
            break;
        }

        default:
            throw DefinitionError(symbol, "the expression evaluates to a " + result.typeName() +
                                  " instead of a quantity or unit", statement.locator);
    }

    bool replaced = table.bind(entry);
    table.addRelation(relation);

    if (replaced && options_.verbose) {
        std::cerr << "Note: " << statement.locator << ": overriding previous value of '"
                  << symbol << "'" << std::endl;
    }
}

} // namespace PQS
