#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include "PQS.hpp"
#include "SymbolTable.hpp"
#include "DefinitionParser.hpp"
#include "PrefixResolver.hpp"
#include "CoherentSimplifier.hpp"
#include "Formatter.hpp"
#include "ConfigReader.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace PQS {

/**
 * @brief A complete unit system: symbol table plus lookup, conversion and display
 *
 * The system is defined entirely by its definition sources. The base
 * constants decide the numeric value of every unit, so the same source
 * files evaluated on top of another base file give another unit system
 * (SI, Hartree, ...). Instances are independent and read-only once
 * constructed; any number of them may coexist and be shared between
 * threads.
 *
 * This class provides:
 * - Typed lookup of constants, units and lambda units, with SI prefixes
 * - Conversion of quantities to any compatible unit
 * - Parsing of "100 kPa" and "kg*m/s2" strings
 * - Display-unit selection and formatting in several text styles
 */
class UnitSystem {
public:
    /**
     * @brief Build from a configuration (definition files and display options)
     * @throws DefinitionError, ParseError, UndefinedSymbolError
     */
    explicit UnitSystem(const ConfigReader::UnitSystemConfig& config =
                            ConfigReader::UnitSystemConfig());

    /**
     * @brief Build from in-memory definition sources
     */
    explicit UnitSystem(const std::vector<DefinitionSource>& sources,
                        const CoherentSimplifier::Settings& settings = CoherentSimplifier::Settings());

    /**
     * @brief Build from a configuration file
     * @throws DefinitionError if the file cannot be read
     */
    static UnitSystem fromConfigFile(const std::string& filename);

    UnitSystem(const UnitSystem&) = delete;
    UnitSystem& operator=(const UnitSystem&) = delete;
    UnitSystem(UnitSystem&&) = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Constant, unit or lambda unit by name, including prefixed forms
     * @throws LookupError if the name cannot be resolved
     */
    Symbol lookup(const std::string& name) const;

    /**
     * @brief Check if a name resolves
     */
    bool hasSymbol(const std::string& name) const;

    SymbolKind kindOf(const std::string& name) const;

    /**
     * @brief Constant or unit as a quantity
     * @throws LookupError, UnitError for lambda units
     */
    Quantity quantity(const std::string& name) const;

    /**
     * @brief Lambda unit by name
     * @throws LookupError, UnitError if the symbol is not a lambda unit
     */
    LambdaUnit lambdaUnit(const std::string& name) const;

    /**
     * @brief Product of units, e.g. "kg*m/s2" or "W/(m2*K)"
     *
     * The result keeps the expression as its display unit.
     * @throws ParseError, LookupError
     */
    Quantity unitExpression(const std::string& expression) const;

    /**
     * @brief value times a unit expression or lambda unit ("25", "degC")
     */
    Quantity make(double value, const std::string& unit) const;

    const SymbolTable& table() const { return *table_; }
    std::shared_ptr<const SymbolTable> sharedTable() const { return table_; }

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Number of `unit` in a quantity
     * @param quantity Quantity to express
     * @param unit Unit expression or lambda unit name
     * @throws IncompatibleUnitError if the dimensions differ
     */
    double convert(const Quantity& quantity, const std::string& unit) const;

    /**
     * @brief Convert value between two units
     * @throws IncompatibleUnitError if units are incompatible
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    /**
     * @brief Convert array of values
     */
    std::vector<double> convert(const std::vector<double>& values,
                                const std::string& from_unit,
                                const std::string& to_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Split "100 psi" or "-1.5e3 kg*m/s2" into number and unit text
     * @param[out] value Parsed number
     * @param[out] unit Unit text (may be empty)
     * @return true if parsing successful
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    /**
     * @brief Parse "100 kPa" into a quantity
     * @throws ParseError, LookupError
     */
    Quantity parseQuantity(const std::string& value_with_unit) const;

    // =========================================================================
    // Dimensional Analysis
    // =========================================================================

    /**
     * @brief Check if two unit expressions have the same dimension
     */
    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    /**
     * @brief Units whose dimension equals the given one, in definition order
     */
    std::vector<std::string> getSymbolsWithDimension(const ExponentVector& dimension) const;

    // =========================================================================
    // Display
    // =========================================================================

    /**
     * @brief Format a quantity in its display unit (or a coherent one)
     */
    std::string format(const Quantity& quantity) const;
    std::string format(const Quantity& quantity, FormatStyle style,
                       const NumberFormat& number_format = NumberFormat()) const;

    /**
     * @brief Format a quantity in an explicit unit expression or lambda unit
     * @throws IncompatibleUnitError if the dimensions differ
     */
    std::string formatIn(const Quantity& quantity, const std::string& unit,
                         FormatStyle style = FormatStyle::PLAIN,
                         const NumberFormat& number_format = NumberFormat(),
                         const std::string& prefix = "") const;

    /**
     * @brief Simplify a display vector using the coherent relations
     */
    ExponentVector simplify(const ExponentVector& display) const;

    /// Style used by format(quantity)
    FormatStyle defaultStyle() const { return default_style_; }
    const NumberFormat& defaultNumberFormat() const { return default_number_format_; }
    const CoherentSimplifier& simplifier() const { return *simplifier_; }
    const Formatter& formatter() const { return formatter_; }

    // =========================================================================
    // Listing
    // =========================================================================

    std::vector<std::string> getSections() const;
    std::vector<std::string> getSymbolsInSection(const std::string& section) const;
    std::vector<std::string> getPrefixableUnits() const;

    /**
     * @brief Print the symbol table to a stream
     */
    void printDatabase(std::ostream& os) const;

    /**
     * @brief Generate markdown documentation of all symbols
     */
    std::string generateDocumentation() const;

private:
    std::shared_ptr<const SymbolTable> table_;
    std::unique_ptr<PrefixResolver> resolver_;
    std::unique_ptr<CoherentSimplifier> simplifier_;
    Formatter formatter_;
    FormatStyle default_style_ = FormatStyle::PLAIN;
    NumberFormat default_number_format_;

    void initialize(const CoherentSimplifier::Settings& settings);

    /// Number of `unit` in a quantity, honoring lambda units
    double numberIn(const Quantity& quantity, const std::string& unit,
                    ExponentVector& display) const;

    std::string trim(const std::string& str) const;
    std::string describe(const SymbolTable::Entry& entry) const;
};

} // namespace PQS

#endif // UNIT_SYSTEM_HPP
