#include "gslgen/species.hpp"
#include "gslgen/mass_calculator.hpp"

namespace gslgen {

namespace {

const Formula& condensationWater() {
    static const Formula water = Formula::parse("H2O");
    return water;
}

} // namespace

std::string speciesName(const std::string& class_name, const BuildingBlock& lcb,
                        const BuildingBlock& fa) {
    return class_name + " " + lcb.name() + "/" + fa.name();
}

Species assembleSpecies(const LipidClassDef& lipid_class, const BuildingBlock& lcb,
                        const BuildingBlock& fa) {
    // Formula::operator-= throws FormulaError on a negative count
    Formula formula = lipid_class.headgroup + lcb.formula() + fa.formula();
    formula -= condensationWater();

    return Species{lipid_class.name,
                   lcb,
                   fa,
                   formula,
                   speciesName(lipid_class.name, lcb, fa),
                   MassCalculator::monoisotopicMass(formula)};
}

} // namespace gslgen
