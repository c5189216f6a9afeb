#include "Prefixes.hpp"
#include <cmath>

namespace PQS {

double Prefix::factor() const {
    return std::pow(10.0, exponent);
}

const std::vector<Prefix>& siPrefixes() {
    static const std::vector<Prefix> prefixes = {
        {"Y", "yotta", 24},
        {"Z", "zetta", 21},
        {"E", "exa", 18},
        {"P", "peta", 15},
        {"T", "tera", 12},
        {"G", "giga", 9},
        {"M", "mega", 6},
        {"k", "kilo", 3},
        {"h", "hecto", 2},
        {"da", "deca", 1},
        {"d", "deci", -1},
        {"c", "centi", -2},
        {"m", "milli", -3},
        {"u", "micro", -6},     // ASCII stand-in for mu
        {"n", "nano", -9},
        {"p", "pico", -12},
        {"f", "femto", -15},
        {"a", "atto", -18},
        {"z", "zepto", -21},
        {"y", "yocto", -24}
    };
    return prefixes;
}

const Prefix* findPrefix(const std::string& symbol) {
    for (const auto& prefix : siPrefixes()) {
        if (prefix.symbol == symbol) return &prefix;
    }
    return nullptr;
}

} // namespace PQS
