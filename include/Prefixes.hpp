#ifndef PREFIXES_HPP
#define PREFIXES_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace PQS {

/**
 * @brief SI prefix: symbol and power-of-ten exponent
 */
struct Prefix {
    std::string symbol;     // "k", "da", "u"
    std::string name;       // "kilo"
    int exponent;           // 3

    double factor() const;
    std::size_t arity() const { return symbol.size(); }
};

/**
 * @brief The 20 SI prefixes from yotta to yocto, largest first
 */
const std::vector<Prefix>& siPrefixes();

/**
 * @brief Find a prefix by symbol
 * @return Pointer into the static table, or nullptr
 */
const Prefix* findPrefix(const std::string& symbol);

} // namespace PQS

#endif // PREFIXES_HPP
