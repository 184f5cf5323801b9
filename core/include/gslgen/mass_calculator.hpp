#pragma once

#include "formula.hpp"
#include "types.hpp"
#include <map>
#include <string>

namespace gslgen {

/**
 * @brief Heavy-isotope substitution applied to a formula.
 *
 * Maps an isotope notation ("2H", "15N", "13C", "18O") to the number of
 * atoms of its element that are replaced by that isotope.
 */
using IsotopeSubstitution = std::map<std::string, int>;

/**
 * @brief Exact mass and m/z arithmetic.
 *
 * Masses are plain double-precision sums of atomic masses; nothing is
 * rounded here.
 */
class MassCalculator {
public:
    /**
     * @brief Compute the monoisotopic neutral mass of a formula.
     *
     * @throws FormulaError if the formula holds an unknown element
     */
    static Mass monoisotopicMass(const Formula& formula);

    /**
     * @brief Compute the neutral mass with heavy-isotope substitution.
     *
     * Substituted atoms are priced at the isotope mass, the remainder of
     * each element at its standard mass.
     *
     * @param formula Elemental composition
     * @param substitution Isotope notation to number of substituted atoms
     * @throws FormulaError if an isotope is unknown or asks for more atoms
     *         than the formula holds
     */
    static Mass labeledMass(const Formula& formula,
                            const IsotopeSubstitution& substitution);

    /**
     * @brief Mass shift caused by a substitution, independent of formula.
     *
     * Sum over isotopes of count x (heavy mass - standard mass).
     */
    static Mass substitutionShift(const IsotopeSubstitution& substitution);
};

} // namespace gslgen
