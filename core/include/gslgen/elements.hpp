#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace gslgen {

/// Mass of a proton (H+), used for charge adjustment
constexpr Mass PROTON_MASS = 1.007276466812;

/// Mass of an electron, used to derive ion masses of non-proton charge carriers
constexpr Mass ELECTRON_MASS = 0.000548579909;

/**
 * @brief One entry of the atomic mass table.
 *
 * `symbol` is the element symbol used in formulas ("C", "H"); isotope
 * variants are keyed by their mass-number notation ("13C", "2H") and name
 * the element they substitute in `element`.
 */
struct ElementInfo {
    std::string symbol;
    std::string element;
    Mass mass = 0.0;
    int mass_number = 0;
};

/**
 * @brief Read-only table of exact atomic masses (IUPAC 2016).
 *
 * All accessors are static and the table is immutable, so lookups are safe
 * from any number of threads.
 */
class ElementTable {
public:
    /**
     * @brief Get the monoisotopic mass of an element.
     *
     * @param symbol Element symbol ("C", "H", "N", "O", "P", "S", "Na", ...)
     * @return Exact mass of the most abundant isotope
     * @throws FormulaError if the symbol is unknown
     */
    static Mass mass(const std::string& symbol);

    /**
     * @brief Get the mass of a heavy isotope.
     *
     * @param isotope Isotope notation ("2H", "13C", "15N", "18O")
     * @throws FormulaError if the isotope is unknown
     */
    static Mass isotopeMass(const std::string& isotope);

    /**
     * @brief Get the element substituted by a heavy isotope ("2H" -> "H").
     *
     * @throws FormulaError if the isotope is unknown
     */
    static const std::string& isotopeElement(const std::string& isotope);

    /// Check if an element symbol is known
    static bool isKnown(const std::string& symbol);

    /// Check if an isotope notation is known
    static bool isKnownIsotope(const std::string& isotope);

    /// All elements, in formula output order
    static const std::vector<ElementInfo>& elements();

    /// All heavy isotopes
    static const std::vector<ElementInfo>& isotopes();

    /**
     * @brief Rank of an element in formula output order.
     *
     * C, H, N, O, P, S come first in that order; any other symbol sorts
     * after them alphabetically.
     */
    static int outputRank(const std::string& symbol);
};

} // namespace gslgen
