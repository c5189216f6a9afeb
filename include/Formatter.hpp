#ifndef FORMATTER_HPP
#define FORMATTER_HPP

#include "PQS.hpp"
#include "ExponentVector.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace PQS {

/**
 * @brief Renders numbers and unit combinations as text
 *
 * | Style    | Token | Product    | Negative exponents      |
 * |----------|-------|------------|-------------------------|
 * | PLAIN    | ""    | m*kg       | "/" with (group)        |
 * | HTML     | "H"   | m&nbsp;kg  | <sup>-2</sup>           |
 * | LATEX    | "L"   | m\,kg      | ^{-2}                   |
 * | UNICODE  | "U"   | m kg       | ⁻²                      |
 * | MODELICA | "M"   | m.kg       | "/" with (group)        |
 * | VERBOSE  | "V"   | m * kg     | " / " with (group), **2 |
 */
class Formatter {
public:
    /// Symbol text substitutions per style, applied in order
    using Replacements = std::map<FormatStyle, std::vector<std::pair<std::string, std::string>>>;

    Formatter();
    explicit Formatter(const Replacements& replacements);

    /**
     * @brief deg, ohm and angstrom for the Unicode and LaTeX styles
     */
    static Replacements defaultReplacements();

    /**
     * @brief Style from its token ("", "H", "L", "U", "M", "V") or name
     * @throws ParseError for an unknown style
     */
    static FormatStyle parseStyle(const std::string& token);
    static std::string styleToken(FormatStyle style);
    static std::string styleName(FormatStyle style);

    /**
     * @brief Unit combination only, e.g. "m/s2"
     */
    std::string formatUnit(const ExponentVector& units, FormatStyle style) const;

    /**
     * @brief Number with the style's exponential notation
     * @throws ParseError for a notation other than e, f, g, E or G
     */
    std::string formatNumber(double value, FormatStyle style,
                             const NumberFormat& number_format = NumberFormat()) const;

    /**
     * @brief Value followed by its unit
     * @param value Number of `units`
     * @param units Unit combination
     * @param style Output style
     * @param number_format Precision policy
     * @param prefix Optional SI prefix applied to the leading unit; the
     *               value is rescaled accordingly
     * @throws LookupError for an unknown prefix
     */
    std::string format(double value, const ExponentVector& units, FormatStyle style,
                       const NumberFormat& number_format = NumberFormat(),
                       const std::string& prefix = "") const;

private:
    Replacements replacements_;

    std::string decorateSymbol(const std::string& symbol, FormatStyle style) const;
    std::string formatExponent(const Rational& exponent, FormatStyle style) const;
};

/// Unicode superscript form of an integer, e.g. -2 -> "⁻²"
std::string toSuperscript(long value);

} // namespace PQS

#endif // FORMATTER_HPP
