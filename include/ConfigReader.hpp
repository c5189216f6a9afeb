#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include <string>
#include <map>
#include <vector>

#ifndef PQS_DEFINITIONS_DIR
#define PQS_DEFINITIONS_DIR "config/definitions"
#endif

namespace PQS {

class UnitSystem;

/**
 * @brief INI-style configuration reader
 *
 * Sections in [brackets], "key = value" lines, '#' and ';' comments.
 * Selects the definition files that make up a unit system and the
 * simplification and formatting options used to display quantities.
 */
class ConfigReader {
public:
    // =========================================================================
    // Nested Struct Definitions
    // =========================================================================

    struct UnitSystemConfig {
        // [definitions]
        std::string directory;
        std::vector<std::string> files;         // evaluated in this order
        bool verbose;                           // note redefinitions

        // [simplification]
        int level;
        int max_terms;

        // [format]
        std::string style;                      // "", H, L, U, M, V
        int precision;                          // -1: shortest round trip

        // [replacements.<style>]: style token -> symbol text -> replacement
        std::map<std::string, std::map<std::string, std::string>> replacements;

        UnitSystemConfig() : directory(PQS_DEFINITIONS_DIR),
                             files{"base-SI.ini", "derived.ini", "BIPM.ini", "other.ini"},
                             verbose(false), level(2), max_terms(3),
                             style(""), precision(-1) {}

        /// Files joined with the directory (absolute file names kept)
        std::vector<std::string> definitionPaths() const;
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    // =========================================================================
    // Constructor/Destructor
    // =========================================================================

    ConfigReader() = default;
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    /**
     * @brief Fill a unit-system configuration; missing keys keep defaults
     * @return true if the file had a [definitions] section
     */
    bool parseUnitSystemConfig(UnitSystemConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;

    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;

    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;

    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;

    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    std::vector<std::string> getStringArray(const std::string& section,
                                            const std::string& key) const;

    // =========================================================================
    // Unit-Aware Value Accessors
    // =========================================================================

    /**
     * @brief Read "100 kPa" style values and express them in target_unit
     * @param units Unit system used to interpret the value
     * @param default_val Returned when the key is missing or unparsable
     * @param target_unit Unit of the returned number
     * @param default_unit Unit assumed when the value has none
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                             const UnitSystem& units, const std::string& target_unit,
                             double default_val = 0.0,
                             const std::string& default_unit = "") const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace PQS

#endif // CONFIG_READER_HPP
