#include "ConfigReader.hpp"
#include "UnitSystem.hpp"
#include "Formatter.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>

namespace PQS {

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [section]
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            current_section = trim(current_section);
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    file.close();
    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::logic_error&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::logic_error&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

std::vector<std::string> ConfigReader::getStringArray(const std::string& section,
                                                      const std::string& key) const {
    return split(getString(section, key), ',');
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       const UnitSystem& units, const std::string& target_unit,
                                       double default_val, const std::string& default_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    double parsed_value;
    std::string parsed_unit;
    if (!units.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "'" << std::endl;
        return default_val;
    }

    if (parsed_unit.empty()) {
        parsed_unit = default_unit;
    }
    if (parsed_unit.empty()) {
        return parsed_value;
    }

    try {
        return units.convert(parsed_value, parsed_unit, target_unit);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return {};
    return sec_it->second;
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& section : getSections()) {
        if (section.find(prefix) == 0) {
            result.push_back(section);
        }
    }
    return result;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Merge data - other file values override existing
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

// =============================================================================
// Unit System Configuration
// =============================================================================

std::vector<std::string> ConfigReader::UnitSystemConfig::definitionPaths() const {
    std::vector<std::string> paths;
    for (const auto& file : files) {
        if (directory.empty() || (!file.empty() && file[0] == '/')) {
            paths.push_back(file);
        } else {
            paths.push_back(directory + "/" + file);
        }
    }
    return paths;
}

bool ConfigReader::parseUnitSystemConfig(UnitSystemConfig& config) const {
    bool found = hasSection("definitions");

    config.directory = getString("definitions", "directory", config.directory);
    if (hasKey("definitions", "files")) {
        config.files = getStringArray("definitions", "files");
    }
    config.verbose = getBool("definitions", "verbose", config.verbose);

    config.level = getInt("simplification", "level", config.level);
    config.max_terms = getInt("simplification", "max_terms", config.max_terms);

    config.style = getString("format", "style", config.style);
    config.precision = getInt("format", "precision", config.precision);

    const std::string prefix = "replacements.";
    for (const auto& section : getSectionsMatching(prefix)) {
        config.replacements[section.substr(prefix.size())] = getSectionData(section);
    }

    return found;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection("definitions")) {
        result.warnings.push_back("No [definitions] section found - using the SI definition files");
    } else if (getStringArray("definitions", "files").empty()) {
        result.errors.push_back("[definitions] files is empty");
        result.valid = false;
    }

    if (getInt("simplification", "level", 2) < 0) {
        result.errors.push_back("Invalid simplification level (must be >= 0)");
        result.valid = false;
    }

    if (getInt("simplification", "max_terms", 3) < 1) {
        result.errors.push_back("Invalid max_terms (must be >= 1)");
        result.valid = false;
    }

    if (hasKey("format", "style")) {
        try {
            Formatter::parseStyle(getString("format", "style"));
        } catch (const std::exception& e) {
            result.errors.push_back(e.what());
            result.valid = false;
        }
    }

    for (const auto& section : getSectionsMatching("replacements.")) {
        std::string token = section.substr(std::string("replacements.").size());
        try {
            Formatter::parseStyle(token);
        } catch (const std::exception&) {
            result.warnings.push_back("Replacements for unknown style '" + token + "' are ignored");
        }
    }

    return result;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write template: " << filename << std::endl;
        return;
    }

    file << "# Unit system configuration\n";
    file << "\n";
    file << "[definitions]\n";
    file << "# Definition files are evaluated in order; later files may redefine symbols\n";
    file << "directory = " << PQS_DEFINITIONS_DIR << "\n";
    file << "files = base-SI.ini, derived.ini, BIPM.ini, other.ini\n";
    file << "verbose = false\n";
    file << "\n";
    file << "[simplification]\n";
    file << "level = 2\n";
    file << "max_terms = 3\n";
    file << "\n";
    file << "[format]\n";
    file << "# Style: (empty) plain, H html, L latex, U unicode, M modelica, V verbose\n";
    file << "style = U\n";
    file << "# Significant digits, -1 for the shortest exact representation\n";
    file << "precision = -1\n";
    file << "\n";
    file << "[replacements.U]\n";
    file << "deg = °\n";
    file << "ohm = Ω\n";
    file << "angstrom = Å\n";

    file.close();
}

} // namespace PQS
