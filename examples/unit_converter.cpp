/**
 * @file unit_converter.cpp
 * @brief Command-line unit converter built on a definition-file unit system
 *
 * Usage:
 *   ./unit_converter [options] <value> <from_unit> <to_unit>
 *   ./unit_converter [options] "<value> <unit>"
 *   ./unit_converter [options] --list [section]
 *   ./unit_converter [options] --docs
 *   ./unit_converter --help
 *
 * Options:
 *   --config <file>    Unit system configuration (definition files, style)
 *   --format <style>   plain, H, L, U, M or V
 *
 * Examples:
 *   ./unit_converter 5000 psi MPa
 *   ./unit_converter 100 degC degF
 *   ./unit_converter "9.81 kg*m/s2"
 *   ./unit_converter --format L 1 eV J
 *   ./unit_converter --list "Derived units"
 */

#include "UnitSystem.hpp"
#include "Errors.hpp"
#include <iostream>
#include <iomanip>
#include <memory>
#include <string>
#include <vector>
#include <cstring>

using namespace PQS;

void printHelp() {
    std::cout << "\n";
    std::cout << "PQS Unit Converter\n";
    std::cout << "==================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  unit_converter [options] <value> <from_unit> <to_unit>\n";
    std::cout << "  unit_converter [options] \"<value> <unit>\"\n";
    std::cout << "  unit_converter [options] --list [section]\n";
    std::cout << "  unit_converter [options] --docs\n";
    std::cout << "  unit_converter --help\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>    Unit system configuration file\n";
    std::cout << "  --format <style>   plain, H (html), L (latex), U (unicode), M (modelica), V (verbose)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  unit_converter 5000 psi MPa\n";
    std::cout << "  unit_converter 100 degC degF\n";
    std::cout << "  unit_converter 1 km/hr m/s\n";
    std::cout << "  unit_converter \"9.81 kg*m/s2\"\n";
    std::cout << "  unit_converter --list\n";
    std::cout << "  unit_converter --list \"Derived units\"\n\n";
    std::cout << "Unit expressions:\n";
    std::cout << "  Products and quotients of units with integer or rational exponents,\n";
    std::cout << "  e.g. kg*m/s2, W/(m2*K), m(1/2). Prefixable units accept SI prefixes\n";
    std::cout << "  (km, MPa, ns, ...).\n\n";
}

void listSymbols(const UnitSystem& units, const std::string& section = "") {
    std::cout << "\n";

    if (section.empty()) {
        // List all sections
        std::cout << "Available Sections:\n";
        std::cout << "===================\n\n";

        for (const auto& sec : units.getSections()) {
            auto symbols = units.getSymbolsInSection(sec);
            std::cout << std::setw(35) << std::left << (sec.empty() ? "(none)" : sec)
                      << " (" << symbols.size() << " symbols)\n";
        }
        std::cout << "\nUse: unit_converter --list <section> to see symbols in a section\n\n";
        return;
    }

    auto symbols = units.getSymbolsInSection(section);
    if (symbols.empty()) {
        std::cout << "Section '" << section << "' not found.\n";
        std::cout << "Use: unit_converter --list to see available sections\n\n";
        return;
    }

    std::cout << "Symbols in section: " << section << "\n";
    std::cout << std::string(60, '=') << "\n\n";
    std::cout << std::setw(12) << std::left << "Symbol"
              << std::setw(14) << "Kind"
              << "Value\n";
    std::cout << std::string(60, '-') << "\n";

    for (const auto& name : symbols) {
        const SymbolTable::Entry* entry = units.table().find(name);
        std::cout << std::setw(12) << std::left << name
                  << std::setw(14) << kindName(entry->kind());
        if (entry->kind() == SymbolKind::LAMBDA_UNIT) {
            std::cout << "[" << dimensionOf(entry->value).toString() << "]";
        } else {
            const Quantity& q = quantityOf(entry->value);
            std::cout << units.format(Quantity(q.value(), q.dimension()));
        }
        if (!entry->note.empty()) std::cout << "  (" << entry->note << ")";
        std::cout << "\n";
    }
    std::cout << "\n";
}

int performConversion(const UnitSystem& units, FormatStyle style, double value,
                      const std::string& from_unit, const std::string& to_unit) {
    try {
        // Check compatibility
        if (!units.areCompatible(from_unit, to_unit)) {
            std::cerr << "Error: Incompatible units '" << from_unit << "' and '"
                      << to_unit << "'\n";
            return 1;
        }

        Quantity quantity = units.make(value, from_unit);

        std::cout << "\n";
        std::cout << "Conversion Result:\n";
        std::cout << "==================\n\n";
        std::cout << "  Input:    " << units.formatIn(quantity, from_unit, style) << "\n";
        std::cout << "  Output:   " << units.formatIn(quantity, to_unit, style) << "\n";
        std::cout << "  Coherent: " << units.format(quantity, style) << "\n\n";

        auto isLambda = [&units](const std::string& unit) {
            return units.hasSymbol(unit) && units.kindOf(unit) == SymbolKind::LAMBDA_UNIT;
        };
        if (!isLambda(from_unit) && !isLambda(to_unit)) {
            std::cout << "Conversion Factor: 1 " << from_unit << " = "
                      << std::scientific << std::setprecision(9)
                      << units.convert(1.0, from_unit, to_unit)
                      << " " << to_unit << "\n\n";
        }
    } catch (const LookupError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --list to see available symbols\n";
        return 1;
    } catch (const UnitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int showQuantity(const UnitSystem& units, FormatStyle style, const std::string& text) {
    try {
        Quantity quantity = units.parseQuantity(text);
        std::cout << units.format(quantity, style) << "\n";
    } catch (const UnitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string style_token;
    bool style_given = false;
    std::vector<std::string> args;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            printHelp();
            return 0;
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (strcmp(argv[i], "--format") == 0 && i + 1 < argc) {
            style_token = argv[++i];
            style_given = true;
        } else {
            args.push_back(argv[i]);
        }
    }

    if (args.empty()) {
        printHelp();
        return 0;
    }

    std::unique_ptr<UnitSystem> units;
    try {
        if (config_file.empty()) {
            units = std::make_unique<UnitSystem>();
        } else {
            units = std::make_unique<UnitSystem>(UnitSystem::fromConfigFile(config_file));
        }
    } catch (const UnitError& e) {
        std::cerr << "Error: Cannot build the unit system: " << e.what() << "\n";
        return 1;
    }

    FormatStyle style = units->defaultStyle();
    if (style_given) {
        try {
            style = Formatter::parseStyle(style_token);
        } catch (const ParseError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    if (args[0] == "--list") {
        listSymbols(*units, args.size() > 1 ? args[1] : "");
        return 0;
    }

    if (args[0] == "--docs") {
        std::cout << units->generateDocumentation();
        return 0;
    }

    if (args.size() == 1) {
        return showQuantity(*units, style, args[0]);
    }

    if (args.size() != 3) {
        std::cerr << "Error: Invalid number of arguments\n";
        printHelp();
        return 1;
    }

    // Parse conversion arguments
    try {
        double value = std::stod(args[0]);
        return performConversion(*units, style, value, args[1], args[2]);
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: Invalid value '" << args[0] << "'\n";
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: Value out of range\n";
        return 1;
    }
}
