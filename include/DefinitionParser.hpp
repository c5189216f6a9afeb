#ifndef DEFINITION_PARSER_HPP
#define DEFINITION_PARSER_HPP

#include "SymbolTable.hpp"
#include <memory>
#include <string>
#include <vector>

namespace PQS {

/**
 * @brief Named block of definition text (usually one .ini file)
 */
struct DefinitionSource {
    std::string name;
    std::string text;

    /**
     * @brief Read a definition file
     * @throws DefinitionError if the file cannot be read
     */
    static DefinitionSource fromFile(const std::string& path);
    static DefinitionSource fromString(const std::string& name, const std::string& text);
};

/**
 * @brief One "symbol = expression[, True|False][; note]" line
 */
struct Statement {
    std::string symbol;
    std::string expression;     // right-hand side including the flag
    std::string note;
    std::string section;
    std::string locator;        // source:line
    std::string text;           // statement without the note
};

/**
 * @brief Builds a SymbolTable by replaying definition statements in order
 *
 * Each statement is evaluated against everything bound before it, so the
 * order of sources matters: the base constants come first, derived
 * constants and units after. A later definition of the same symbol
 * replaces the earlier one. Any error aborts the whole build.
 */
class DefinitionParser {
public:
    struct Options {
        bool verbose = false;   // note redefinitions on std::cerr
    };

    DefinitionParser() = default;
    explicit DefinitionParser(const Options& options) : options_(options) {}

    /**
     * @brief Split a source into statements
     * @throws ParseError for lines that are not statements, dividers or comments
     */
    static std::vector<Statement> parseStatements(const DefinitionSource& source);

    /**
     * @brief Evaluate all statements of all sources into a frozen table
     * @throws ParseError, UndefinedSymbolError, DefinitionError
     */
    std::shared_ptr<const SymbolTable> build(const std::vector<DefinitionSource>& sources) const;

    /// Convenience overload reading files in the given order
    std::shared_ptr<const SymbolTable> buildFromFiles(const std::vector<std::string>& paths) const;

private:
    Options options_;

    void evaluateStatement(const Statement& statement, SymbolTable& table) const;
};

} // namespace PQS

#endif // DEFINITION_PARSER_HPP
