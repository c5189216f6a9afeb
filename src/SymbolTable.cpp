#include "SymbolTable.hpp"
#include "Errors.hpp"
#include <algorithm>

namespace PQS {

SymbolKind kindOf(const Symbol& symbol) {
    switch (symbol.index()) {
        case 0: return SymbolKind::CONSTANT;
        case 1: return SymbolKind::UNIT;
        default: return SymbolKind::LAMBDA_UNIT;
    }
}

std::string kindName(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::CONSTANT: return "constant";
        case SymbolKind::UNIT: return "unit";
        case SymbolKind::LAMBDA_UNIT: return "lambda unit";
    }
    return "unknown";
}

const ExponentVector& dimensionOf(const Symbol& symbol) {
    if (const auto* lambda = std::get_if<LambdaUnit>(&symbol)) {
        return lambda->dimension();
    }
    return quantityOf(symbol).dimension();
}

const Quantity& quantityOf(const Symbol& symbol) {
    if (const auto* constant = std::get_if<Constant>(&symbol)) return *constant;
    if (const auto* unit = std::get_if<Unit>(&symbol)) return *unit;
    throw UnitError("Lambda unit '" + std::get<LambdaUnit>(symbol).symbol() +
                    "' is not a quantity");
}

// =============================================================================
// SymbolTable Implementation
// =============================================================================

const SymbolTable::Entry* SymbolTable::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

std::vector<std::string> SymbolTable::sections() const {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        if (std::find(result.begin(), result.end(), entry.section) == result.end()) {
            result.push_back(entry.section);
        }
    }
    return result;
}

bool SymbolTable::bind(Entry entry) {
    auto it = index_.find(entry.name);
    if (it == index_.end()) {
        entry.order = entries_.size();
        index_[entry.name] = entries_.size();
        entries_.push_back(std::move(entry));
        return false;
    }

    // Relations that defined the previous value no longer hold
    const std::string& name = entry.name;
    relations_.erase(std::remove_if(relations_.begin(), relations_.end(),
                                    [&name](const ExponentVector& r) {
                                        return r.exponent(name) == -1;
                                    }),
                     relations_.end());

    entry.order = it->second;
    entries_[it->second] = std::move(entry);
    return true;
}

void SymbolTable::addRelation(const ExponentVector& relation) {
    if (!relation.empty()) relations_.push_back(relation);
}

} // namespace PQS
