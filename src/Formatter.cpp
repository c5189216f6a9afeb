#include "Formatter.hpp"
#include "Prefixes.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <cstdlib>
#include <sstream>

namespace PQS {

namespace {

struct StyleRules {
    const char* multiply;
    const char* divide;         // nullptr: negative exponents instead
    const char* separator;      // between number and unit
};

StyleRules rulesFor(FormatStyle style) {
    switch (style) {
        case FormatStyle::PLAIN: return {"*", "/", " "};
        case FormatStyle::HTML: return {"&nbsp;", nullptr, "&nbsp;"};
        case FormatStyle::LATEX: return {"\\,", nullptr, "\\,"};
        case FormatStyle::UNICODE: return {" ", nullptr, " "};
        case FormatStyle::MODELICA: return {".", "/", " "};
        case FormatStyle::VERBOSE: return {" * ", " / ", " "};
    }
    return {"*", "/", " "};
}

std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) return text;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.length(), to);
        pos += to.length();
    }
    return text;
}

// printf-style %.<precision><notation> for notation e, f, g, E or G
std::string printNumber(double value, int precision, char notation) {
    std::ostringstream ss;
    switch (notation) {
        case 'e': case 'E':
            ss << std::scientific;
            break;
        case 'f':
            ss << std::fixed;
            break;
        case 'g': case 'G':
            break;
        default:
            throw ParseError("Unknown number notation '" + std::string(1, notation) +
                             "'; expected e, f, g, E or G");
    }
    if (std::isupper(static_cast<unsigned char>(notation))) ss << std::uppercase;
    ss << std::setprecision(precision) << value;
    return ss.str();
}

} // anonymous namespace

std::string toSuperscript(long value) {
    static const char* digits[] = {"⁰", "¹", "²", "³", "⁴", "⁵", "⁶", "⁷", "⁸", "⁹"};
    std::string result = value < 0 ? "⁻" : "";
    std::string plain = std::to_string(value < 0 ? -value : value);
    for (char c : plain) {
        result += digits[c - '0'];
    }
    return result;
}

// =============================================================================
// Construction and Styles
// =============================================================================

Formatter::Formatter() : replacements_(defaultReplacements()) {}

Formatter::Formatter(const Replacements& replacements) : replacements_(replacements) {}

Formatter::Replacements Formatter::defaultReplacements() {
    Replacements r;
    r[FormatStyle::UNICODE] = {{"angstrom", "Å"}, {"deg", "°"}, {"ohm", "Ω"}};
    r[FormatStyle::LATEX] = {{"angstrom", "\\AA"}, {"deg", "{}^{\\circ}"}, {"ohm", "\\Omega"}};
    r[FormatStyle::HTML] = {{"angstrom", "&Aring;"}, {"deg", "&deg;"}, {"ohm", "&Omega;"}};
    return r;
}

FormatStyle Formatter::parseStyle(const std::string& token) {
    std::string t = token;
    std::transform(t.begin(), t.end(), t.begin(), ::tolower);

    if (t.empty() || t == "plain") return FormatStyle::PLAIN;
    if (t == "h" || t == "html") return FormatStyle::HTML;
    if (t == "l" || t == "latex") return FormatStyle::LATEX;
    if (t == "u" || t == "unicode") return FormatStyle::UNICODE;
    if (t == "m" || t == "modelica") return FormatStyle::MODELICA;
    if (t == "v" || t == "verbose") return FormatStyle::VERBOSE;
    throw ParseError("Unknown format style '" + token + "'");
}

std::string Formatter::styleToken(FormatStyle style) {
    switch (style) {
        case FormatStyle::PLAIN: return "";
        case FormatStyle::HTML: return "H";
        case FormatStyle::LATEX: return "L";
        case FormatStyle::UNICODE: return "U";
        case FormatStyle::MODELICA: return "M";
        case FormatStyle::VERBOSE: return "V";
    }
    return "";
}

std::string Formatter::styleName(FormatStyle style) {
    switch (style) {
        case FormatStyle::PLAIN: return "plain";
        case FormatStyle::HTML: return "html";
        case FormatStyle::LATEX: return "latex";
        case FormatStyle::UNICODE: return "unicode";
        case FormatStyle::MODELICA: return "modelica";
        case FormatStyle::VERBOSE: return "verbose";
    }
    return "plain";
}

// =============================================================================
// Units
// =============================================================================

std::string Formatter::decorateSymbol(const std::string& symbol, FormatStyle style) const {
    std::string text = symbol;
    auto it = replacements_.find(style);
    if (it != replacements_.end()) {
        for (const auto& r : it->second) {
            text = replaceAll(text, r.first, r.second);
        }
    }
    if (style == FormatStyle::LATEX) return "\\mathrm{" + text + "}";
    return text;
}

std::string Formatter::formatExponent(const Rational& exponent, FormatStyle style) const {
    if (exponent == 1) return "";

    bool fraction = exponent.denominator() != 1;
    std::stringstream ss;
    ss << exponent.numerator();
    if (fraction) ss << "/" << exponent.denominator();
    std::string text = ss.str();

    switch (style) {
        case FormatStyle::HTML:
            return "<sup>" + text + "</sup>";
        case FormatStyle::LATEX:
            if (text.size() > 1) return "^{" + text + "}";
            return "^" + text;
        case FormatStyle::UNICODE:
            if (fraction) {
                return toSuperscript(exponent.numerator()) + "ᐟ" +
                       toSuperscript(exponent.denominator());
            }
            return toSuperscript(exponent.numerator());
        case FormatStyle::VERBOSE:
            return fraction ? "**(" + text + ")" : "**" + text;
        default:
            return fraction ? "(" + text + ")" : text;
    }
}

std::string Formatter::formatUnit(const ExponentVector& units, FormatStyle style) const {
    StyleRules rules = rulesFor(style);
    auto terms = units.terms();

    auto join = [&](const std::vector<ExponentVector::Term>& list) {
        std::string out;
        for (size_t i = 0; i < list.size(); ++i) {
            if (i > 0) out += rules.multiply;
            out += decorateSymbol(list[i].first, style) + formatExponent(list[i].second, style);
        }
        return out;
    };

    std::vector<ExponentVector::Term> numerator;
    std::vector<ExponentVector::Term> denominator;
    for (const auto& term : terms) {
        if (term.second > 0) {
            numerator.push_back(term);
        } else {
            denominator.push_back({term.first, rules.divide ? -term.second : term.second});
        }
    }

    // Negative superscripts follow the numerator: m² kg s⁻²
    if (!rules.divide) {
        numerator.insert(numerator.end(), denominator.begin(), denominator.end());
        return join(numerator);
    }
    if (denominator.empty()) return join(numerator);

    std::string text = numerator.empty() ? "1" : join(numerator);
    text += rules.divide;
    if (denominator.size() > 1) {
        text += "(" + join(denominator) + ")";
    } else {
        text += join(denominator);
    }
    return text;
}

// =============================================================================
// Numbers
// =============================================================================

std::string Formatter::formatNumber(double value, FormatStyle style,
                                    const NumberFormat& number_format) const {
    std::string text;
    if (number_format.precision < 0) {
        // Shortest text that reads back as the same double
        for (int p = 15; p <= 17; ++p) {
            text = printNumber(value, p, 'g');
            if (std::strtod(text.c_str(), nullptr) == value) break;
        }
        if (std::isfinite(value) && text.find_first_of(".e") == std::string::npos) {
            text += ".0";
        }
    } else {
        text = printNumber(value, number_format.precision, number_format.notation);
    }

    size_t e_pos = text.find('e');
    if (e_pos == std::string::npos || !std::isfinite(value)) return text;
    if (style != FormatStyle::HTML && style != FormatStyle::LATEX && style != FormatStyle::UNICODE) {
        return text;
    }

    std::string mantissa = text.substr(0, e_pos);
    long exponent = std::strtol(text.c_str() + e_pos + 1, nullptr, 10);
    switch (style) {
        case FormatStyle::HTML:
            return mantissa + "&times;10<sup>" + std::to_string(exponent) + "</sup>";
        case FormatStyle::LATEX:
            return mantissa + " \\times 10^{" + std::to_string(exponent) + "}";
        default:
            return mantissa + "×10" + toSuperscript(exponent);
    }
}

std::string Formatter::format(double value, const ExponentVector& units, FormatStyle style,
                              const NumberFormat& number_format, const std::string& prefix) const {
    ExponentVector shown = units;
    if (!prefix.empty() && !units.empty()) {
        const Prefix* p = findPrefix(prefix);
        if (!p) throw LookupError(prefix);

        ExponentVector::Term lead = units.terms().front();
        double e = static_cast<double>(lead.second.numerator()) / lead.second.denominator();
        value /= std::pow(p->factor(), e);
        shown = units.divide(ExponentVector::single(lead.first, lead.second))
                     .multiply(ExponentVector::single(prefix + lead.first, lead.second));
    }

    std::string number = formatNumber(value, style, number_format);
    if (shown.empty()) return number;
    return number + rulesFor(style).separator + formatUnit(shown, style);
}

} // namespace PQS
