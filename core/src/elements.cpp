#include "gslgen/elements.hpp"
#include "gslgen/errors.hpp"
#include <algorithm>

namespace gslgen {

namespace {

// IUPAC 2016 monoisotopic masses. Order here is the formula output order.
const std::vector<ElementInfo> kElements = {
    {"C", "C", 12.0000000, 12},
    {"H", "H", 1.00782503223, 1},
    {"N", "N", 14.0030740048, 14},
    {"O", "O", 15.9949146223, 16},
    {"P", "P", 30.9737619985, 31},
    {"S", "S", 31.9720711744, 32},
    {"Na", "Na", 22.9897692820, 23},
    {"K", "K", 38.9637064864, 39},
    {"Cl", "Cl", 34.968852682, 35},
};

const std::vector<ElementInfo> kIsotopes = {
    {"2H", "H", 2.01410177812, 2},
    {"13C", "C", 13.00335483507, 13},
    {"15N", "N", 15.0001088982, 15},
    {"18O", "O", 17.99915961286, 18},
};

constexpr int kFixedOrder = 6;

const ElementInfo* findIn(const std::vector<ElementInfo>& table,
                          const std::string& symbol) {
    auto it = std::find_if(table.begin(), table.end(),
        [&](const ElementInfo& e) { return e.symbol == symbol; });
    return it == table.end() ? nullptr : &*it;
}

} // namespace

Mass ElementTable::mass(const std::string& symbol) {
    const ElementInfo* info = findIn(kElements, symbol);
    if (!info) {
        throw FormulaError("unknown element '" + symbol + "'");
    }
    return info->mass;
}

Mass ElementTable::isotopeMass(const std::string& isotope) {
    const ElementInfo* info = findIn(kIsotopes, isotope);
    if (!info) {
        throw FormulaError("unknown isotope '" + isotope + "'");
    }
    return info->mass;
}

const std::string& ElementTable::isotopeElement(const std::string& isotope) {
    const ElementInfo* info = findIn(kIsotopes, isotope);
    if (!info) {
        throw FormulaError("unknown isotope '" + isotope + "'");
    }
    return info->element;
}

bool ElementTable::isKnown(const std::string& symbol) {
    return findIn(kElements, symbol) != nullptr;
}

bool ElementTable::isKnownIsotope(const std::string& isotope) {
    return findIn(kIsotopes, isotope) != nullptr;
}

const std::vector<ElementInfo>& ElementTable::elements() {
    return kElements;
}

const std::vector<ElementInfo>& ElementTable::isotopes() {
    return kIsotopes;
}

int ElementTable::outputRank(const std::string& symbol) {
    for (int i = 0; i < kFixedOrder; ++i) {
        if (kElements[static_cast<std::size_t>(i)].symbol == symbol) {
            return i;
        }
    }
    return kFixedOrder;
}

} // namespace gslgen
