/*
 * Example: Unit Systems From Definition Files
 *
 * Builds the SI unit system and the Hartree atomic unit system from the
 * same derived definitions on top of different base constants, then
 * evaluates a few physical relations in both.
 */

#include "UnitSystem.hpp"
#include "Errors.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

using namespace PQS;

namespace {

std::string definitionPath(const std::string& file) {
    return std::string(PQS_DEFINITIONS_DIR) + "/" + file;
}

std::vector<DefinitionSource> sourcesFor(const std::string& base_file) {
    std::vector<DefinitionSource> sources;
    for (const auto& file : {base_file, std::string("derived.ini"),
                             std::string("BIPM.ini"), std::string("other.ini")}) {
        sources.push_back(DefinitionSource::fromFile(definitionPath(file)));
    }
    return sources;
}

void printConstants(const UnitSystem& units, const std::string& title) {
    std::cout << title << "\n";
    std::cout << std::string(title.size(), '-') << "\n";
    for (const auto& name : {"e", "hbar", "m_e", "k_C", "c", "k_B"}) {
        Quantity q = units.quantity(name);
        std::cout << "  " << std::setw(6) << std::left << name << " = "
                  << std::setprecision(10) << q.value()
                  << "  [" << q.dimension().toString() << "]\n";
    }
    std::cout << "\n";
}

} // anonymous namespace

int main() {
    std::cout << "================================================\n";
    std::cout << "  Unit Systems From Definition Files\n";
    std::cout << "================================================\n\n";

    try {
        UnitSystem si(sourcesFor("base-SI.ini"));
        UnitSystem hartree(sourcesFor("base-Hartree.ini"));

        printConstants(si, "SI");
        printConstants(hartree, "Hartree atomic units");

        // The same physical quantity in both systems
        Quantity weight_si = si.quantity("kg") * si.quantity("g_0") * 75.0;
        Quantity weight_h = hartree.quantity("kg") * hartree.quantity("g_0") * 75.0;
        std::cout << "Weight of 75 kg:\n";
        std::cout << "  SI:      " << si.format(weight_si) << "\n";
        std::cout << "  Hartree: " << hartree.formatIn(weight_h, "N") << "\n";
        std::cout << "  Number in atomic units: " << weight_h.value() << "\n\n";

        // Display styles
        Quantity field = si.make(1.5, "kV/mm");
        std::cout << "Electric field 1.5 kV/mm in each style:\n";
        for (FormatStyle style : {FormatStyle::PLAIN, FormatStyle::HTML, FormatStyle::LATEX,
                                  FormatStyle::UNICODE, FormatStyle::MODELICA,
                                  FormatStyle::VERBOSE}) {
            std::cout << "  " << std::setw(9) << std::left << Formatter::styleName(style)
                      << si.format(field, style) << "\n";
        }
        std::cout << "\n";

        // Lambda units
        Quantity body = si.make(37.0, "degC");
        std::cout << "Body temperature: " << si.formatIn(body, "degC") << " = "
                  << si.formatIn(body, "degF") << " = " << si.format(body) << "\n";
        Quantity gain = si.make(20.0, "dB");
        std::cout << "20 dB as a power ratio: " << gain.toNumber() << "\n\n";
    } catch (const UnitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
