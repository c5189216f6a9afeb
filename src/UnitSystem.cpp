#include "UnitSystem.hpp"
#include "Errors.hpp"
#include <sstream>
#include <iomanip>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace PQS {

// =============================================================================
// Construction
// =============================================================================

UnitSystem::UnitSystem(const ConfigReader::UnitSystemConfig& config) {
    DefinitionParser::Options options;
    options.verbose = config.verbose;
    DefinitionParser parser(options);
    table_ = parser.buildFromFiles(config.definitionPaths());

    CoherentSimplifier::Settings settings;
    settings.level = config.level;
    settings.max_terms = config.max_terms;
    initialize(settings);

    default_style_ = Formatter::parseStyle(config.style);
    default_number_format_.precision = config.precision;

    Formatter::Replacements replacements = Formatter::defaultReplacements();
    for (const auto& style_pair : config.replacements) {
        FormatStyle style;
        try {
            style = Formatter::parseStyle(style_pair.first);
        } catch (const ParseError&) {
            std::cerr << "Warning: Ignoring replacements for unknown style '"
                      << style_pair.first << "'" << std::endl;
            continue;
        }
        auto& list = replacements[style];
        list.clear();
        for (const auto& r : style_pair.second) {
            list.emplace_back(r.first, r.second);
        }
    }
    formatter_ = Formatter(replacements);
}

UnitSystem::UnitSystem(const std::vector<DefinitionSource>& sources,
                       const CoherentSimplifier::Settings& settings) {
    DefinitionParser parser;
    table_ = parser.build(sources);
    initialize(settings);
}

UnitSystem UnitSystem::fromConfigFile(const std::string& filename) {
    ConfigReader reader;
    if (!reader.loadFile(filename)) {
        throw DefinitionError(filename, "the configuration file cannot be read");
    }
    ConfigReader::UnitSystemConfig config;
    reader.parseUnitSystemConfig(config);
    return UnitSystem(config);
}

void UnitSystem::initialize(const CoherentSimplifier::Settings& settings) {
    resolver_ = std::make_unique<PrefixResolver>(*table_);
    simplifier_ = std::make_unique<CoherentSimplifier>(*table_, settings);
}

std::string UnitSystem::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Database Access
// =============================================================================

Symbol UnitSystem::lookup(const std::string& name) const {
    std::optional<Symbol> symbol = resolver_->resolve(name);
    if (!symbol) {
        throw LookupError(name);
    }
    return *symbol;
}

bool UnitSystem::hasSymbol(const std::string& name) const {
    return resolver_->resolve(name).has_value();
}

SymbolKind UnitSystem::kindOf(const std::string& name) const {
    return PQS::kindOf(lookup(name));
}

Quantity UnitSystem::quantity(const std::string& name) const {
    return quantityOf(lookup(name));
}

LambdaUnit UnitSystem::lambdaUnit(const std::string& name) const {
    Symbol symbol = lookup(name);
    if (const auto* lambda = std::get_if<LambdaUnit>(&symbol)) {
        return *lambda;
    }
    throw UnitError("'" + name + "' is a " + kindName(PQS::kindOf(symbol)) +
                    ", not a lambda unit");
}

Quantity UnitSystem::unitExpression(const std::string& expression) const {
    std::string text = trim(expression);

    // Registered names are taken whole, without product parsing
    ExponentVector display = hasSymbol(text) ? ExponentVector::single(text)
                                             : ExponentVector::fromString(text);

    Quantity result(1.0);
    for (const auto& term : display.entries()) {
        Symbol symbol = lookup(term.first);
        if (std::holds_alternative<LambdaUnit>(symbol)) {
            throw UnitError("Lambda unit '" + term.first +
                            "' cannot be combined with other units");
        }
        const Quantity& q = quantityOf(symbol);
        result = result.multiply(Quantity(q.value(), q.dimension()).power(term.second));
    }
    return result.withDisplayUnit(display);
}

Quantity UnitSystem::make(double value, const std::string& unit) const {
    std::string text = trim(unit);
    if (text.empty()) return Quantity(value);

    if (hasSymbol(text)) {
        Symbol symbol = lookup(text);
        if (const auto* lambda = std::get_if<LambdaUnit>(&symbol)) {
            return lambda->toQuantity(value);
        }
    }
    return unitExpression(text).multiply(value);
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::numberIn(const Quantity& quantity, const std::string& unit,
                            ExponentVector& display) const {
    std::string text = trim(unit);
    if (hasSymbol(text)) {
        Symbol symbol = lookup(text);
        if (const auto* lambda = std::get_if<LambdaUnit>(&symbol)) {
            display = ExponentVector::single(text);
            return lambda->toNumber(quantity);
        }
    }

    Quantity target = unitExpression(text);
    display = target.displayUnit();
    return quantity.convertTo(target);
}

double UnitSystem::convert(const Quantity& quantity, const std::string& unit) const {
    ExponentVector display;
    return numberIn(quantity, unit, display);
}

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    return convert(make(value, from_unit), to_unit);
}

std::vector<double> UnitSystem::convert(const std::vector<double>& values,
                                        const std::string& from_unit,
                                        const std::string& to_unit) const {
    std::vector<double> result;
    result.reserve(values.size());
    for (double v : values) {
        result.push_back(convert(v, from_unit, to_unit));
    }
    return result;
}

// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    // Find where the number ends and unit begins
    size_t i = 0;

    // Skip sign
    if (trimmed[i] == '+' || trimmed[i] == '-') i++;

    // Skip digits and decimal point
    bool has_digits = false;
    bool has_decimal = false;
    while (i < trimmed.length()) {
        if (std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            has_digits = true;
            i++;
        } else if (trimmed[i] == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else if ((trimmed[i] == 'e' || trimmed[i] == 'E') && has_digits) {
            // Scientific notation only if digits follow, "5 eV" keeps its unit
            size_t j = i + 1;
            if (j < trimmed.length() && (trimmed[j] == '+' || trimmed[j] == '-')) j++;
            if (j >= trimmed.length() || !std::isdigit(static_cast<unsigned char>(trimmed[j]))) {
                break;
            }
            i = j;
        } else {
            break;
        }
    }

    if (!has_digits) return false;

    // Extract number and unit parts
    std::string num_str = trim(trimmed.substr(0, i));
    std::string unit_str = trim(trimmed.substr(i));

    try {
        value = std::stod(num_str);
        unit = unit_str;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

Quantity UnitSystem::parseQuantity(const std::string& value_with_unit) const {
    double value;
    std::string unit;

    if (!parseValueWithUnit(value_with_unit, value, unit)) {
        throw ParseError("Failed to parse quantity '" + value_with_unit + "'");
    }
    return make(value, unit);
}

// =============================================================================
// Dimensional Analysis
// =============================================================================

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    auto dimensionOfUnit = [this](const std::string& unit) {
        std::string text = trim(unit);
        if (hasSymbol(text)) return dimensionOf(lookup(text));
        return unitExpression(text).dimension();
    };

    try {
        return dimensionOfUnit(unit1) == dimensionOfUnit(unit2);
    } catch (const UnitError&) {
        return false;
    }
}

std::vector<std::string> UnitSystem::getSymbolsWithDimension(const ExponentVector& dimension) const {
    std::vector<std::string> result;
    for (const auto& entry : table_->entries()) {
        if (entry.kind() == SymbolKind::CONSTANT) continue;
        if (dimensionOf(entry.value) == dimension) {
            result.push_back(entry.name);
        }
    }
    return result;
}

// =============================================================================
// Display
// =============================================================================

ExponentVector UnitSystem::simplify(const ExponentVector& display) const {
    return simplifier_->simplify(display);
}

std::string UnitSystem::format(const Quantity& quantity) const {
    return format(quantity, default_style_, default_number_format_);
}

std::string UnitSystem::format(const Quantity& quantity, FormatStyle style,
                               const NumberFormat& number_format) const {
    ExponentVector display = simplifier_->displayFor(quantity);

    double number = quantity.value();
    if (display.size() == 1) {
        const auto& term = *display.entries().begin();
        std::optional<Symbol> symbol = resolver_->resolve(term.first);
        if (symbol && std::holds_alternative<LambdaUnit>(*symbol)) {
            number = std::get<LambdaUnit>(*symbol).toNumber(quantity);
            return formatter_.format(number, display, style, number_format);
        }
    }

    // Symbols that do not resolve are raw dimension names with unit value 1
    for (const auto& term : display.entries()) {
        std::optional<Symbol> symbol = resolver_->resolve(term.first);
        if (!symbol || std::holds_alternative<LambdaUnit>(*symbol)) continue;
        const Rational& e = term.second;
        number /= std::pow(quantityOf(*symbol).value(),
                           static_cast<double>(e.numerator()) / e.denominator());
    }
    return formatter_.format(number, display, style, number_format);
}

std::string UnitSystem::formatIn(const Quantity& quantity, const std::string& unit,
                                 FormatStyle style, const NumberFormat& number_format,
                                 const std::string& prefix) const {
    ExponentVector display;
    double number = numberIn(quantity, unit, display);
    return formatter_.format(number, display, style, number_format, prefix);
}

// =============================================================================
// Listing
// =============================================================================

std::vector<std::string> UnitSystem::getSections() const {
    return table_->sections();
}

std::vector<std::string> UnitSystem::getSymbolsInSection(const std::string& section) const {
    std::vector<std::string> result;
    for (const auto& entry : table_->entries()) {
        if (entry.section == section) {
            result.push_back(entry.name);
        }
    }
    return result;
}

std::vector<std::string> UnitSystem::getPrefixableUnits() const {
    std::vector<std::string> result;
    for (const auto& entry : table_->entries()) {
        if (const auto* unit = std::get_if<Unit>(&entry.value)) {
            if (unit->prefixable()) result.push_back(entry.name);
        } else if (const auto* lambda = std::get_if<LambdaUnit>(&entry.value)) {
            if (lambda->prefixable()) result.push_back(entry.name);
        }
    }
    return result;
}

std::string UnitSystem::describe(const SymbolTable::Entry& entry) const {
    if (entry.kind() == SymbolKind::LAMBDA_UNIT) {
        return "f(n) [" + dimensionOf(entry.value).toString() + "]";
    }
    const Quantity& q = quantityOf(entry.value);
    NumberFormat nf;
    nf.precision = 10;
    return format(Quantity(q.value(), q.dimension()), FormatStyle::PLAIN, nf);
}

void UnitSystem::printDatabase(std::ostream& os) const {
    os << "Unit System Database\n";
    os << "====================\n\n";

    for (const auto& section : getSections()) {
        os << "Section: " << (section.empty() ? "(none)" : section) << "\n";
        os << std::string(40, '-') << "\n";

        for (const auto& name : getSymbolsInSection(section)) {
            const SymbolTable::Entry* entry = table_->find(name);
            os << std::setw(12) << std::left << name
               << " [" << std::setw(11) << kindName(entry->kind()) << "] "
               << " = " << std::setw(28) << describe(*entry)
               << " (" << dimensionOf(entry->value).toString() << ")";
            if (!entry->note.empty()) os << "  " << entry->note;
            os << "\n";
        }
        os << "\n";
    }
}

std::string UnitSystem::generateDocumentation() const {
    std::stringstream ss;

    ss << "# Unit System Documentation\n\n";
    ss << "This document lists every constant and unit of the unit system.\n";
    ss << "Values are shown in coherent units of the system itself.\n";
    ss << "Prefixable units accept the SI prefixes Y Z E P T G M k h da d c m u n p f a z y.\n\n";

    for (const auto& section : getSections()) {
        ss << "## " << (section.empty() ? "Other" : section) << "\n\n";
        ss << "| Symbol | Kind | Value | Dimension | Prefixable | Note |\n";
        ss << "|--------|------|-------|-----------|------------|------|\n";

        for (const auto& name : getSymbolsInSection(section)) {
            const SymbolTable::Entry* entry = table_->find(name);
            bool prefixable = false;
            if (const auto* unit = std::get_if<Unit>(&entry->value)) {
                prefixable = unit->prefixable();
            } else if (const auto* lambda = std::get_if<LambdaUnit>(&entry->value)) {
                prefixable = lambda->prefixable();
            }
            ss << "| " << name
               << " | " << kindName(entry->kind())
               << " | " << describe(*entry)
               << " | " << dimensionOf(entry->value).toString()
               << " | " << (prefixable ? "yes" : "no")
               << " | " << entry->note << " |\n";
        }
        ss << "\n";
    }

    return ss.str();
}

} // namespace PQS
