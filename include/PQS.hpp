#ifndef PQS_HPP
#define PQS_HPP

#include <string>
#include <vector>
#include <memory>
#include <map>

namespace PQS {

// Forward declarations
class ExponentVector;
class Quantity;
class Unit;
class Constant;
class LambdaUnit;
class SymbolTable;
class PrefixResolver;
class CoherentSimplifier;
class Formatter;
class DefinitionParser;
class UnitSystem;
class ConfigReader;

// Enumerations
enum class SymbolKind {
    CONSTANT,
    UNIT,
    LAMBDA_UNIT
};

/**
 * @brief Text styles supported by the formatter
 */
enum class FormatStyle {
    PLAIN,      // "" : m2*kg/s2
    HTML,       // H  : m<sup>2</sup>&nbsp;kg&nbsp;s<sup>-2</sup>
    LATEX,      // L  : \mathrm{m}^2\,\mathrm{kg}\,\mathrm{s}^{-2}
    UNICODE,    // U  : m² kg s⁻²
    MODELICA,   // M  : m2.kg/s2
    VERBOSE     // V  : m**2 * kg / s**2
};

/**
 * @brief Number rendering policy
 *
 * A negative precision selects the shortest representation that reads
 * back to the same double, always showing a decimal point ("1.0").
 */
struct NumberFormat {
    int precision = -1;
    char notation = 'g';        // 'g', 'e', 'f', 'G' or 'E'
};

// Physical dimension alphabet
namespace Dimensions {
    constexpr const char* CURRENT = "I";
    constexpr const char* LENGTH = "L";
    constexpr const char* MASS = "M";
    constexpr const char* AMOUNT = "N";
    constexpr const char* TIME = "T";
    constexpr const char* TEMPERATURE = "Theta";
    constexpr const char* ANGLE = "A";
}

constexpr const char* PQS_VERSION = "1.0.0";

} // namespace PQS

#endif // PQS_HPP
