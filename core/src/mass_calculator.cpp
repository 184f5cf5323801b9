#include "gslgen/mass_calculator.hpp"
#include "gslgen/elements.hpp"
#include "gslgen/errors.hpp"

namespace gslgen {

Mass MassCalculator::monoisotopicMass(const Formula& formula) {
    Mass total = 0.0;
    for (const auto& [symbol, n] : formula.counts()) {
        total += n * ElementTable::mass(symbol);
    }
    return total;
}

Mass MassCalculator::labeledMass(const Formula& formula,
                                 const IsotopeSubstitution& substitution) {
    std::map<std::string, int> replaced;
    for (const auto& [isotope, n] : substitution) {
        if (n < 0) {
            throw FormulaError("negative substitution count for " + isotope);
        }
        const std::string& element = ElementTable::isotopeElement(isotope);
        replaced[element] += n;
        if (replaced[element] > formula.count(element)) {
            throw FormulaError("cannot substitute " + std::to_string(replaced[element]) +
                               " " + element + " atoms in " + formula.toString());
        }
    }

    Mass total = 0.0;
    for (const auto& [symbol, n] : formula.counts()) {
        auto it = replaced.find(symbol);
        int light = (it == replaced.end()) ? n : n - it->second;
        total += light * ElementTable::mass(symbol);
    }
    for (const auto& [isotope, n] : substitution) {
        total += n * ElementTable::isotopeMass(isotope);
    }
    return total;
}

Mass MassCalculator::substitutionShift(const IsotopeSubstitution& substitution) {
    Mass shift = 0.0;
    for (const auto& [isotope, n] : substitution) {
        shift += n * (ElementTable::isotopeMass(isotope) -
                      ElementTable::mass(ElementTable::isotopeElement(isotope)));
    }
    return shift;
}

} // namespace gslgen
