#pragma once

#include "building_blocks.hpp"
#include "formula.hpp"
#include "lipid_class.hpp"
#include "types.hpp"
#include <string>

namespace gslgen {

/**
 * @brief One concrete molecular species of a lipid class.
 *
 * formula = headgroup + LCB + FA - H2O (one amide condensation).
 */
struct Species {
    std::string class_name;
    BuildingBlock lcb;
    BuildingBlock fa;
    Formula formula;

    /// "<Class> <LCB>/<FA>", e.g. "Cer 18:1;2/16:0"
    std::string name;

    /// Monoisotopic neutral mass of `formula`
    Mass mass = 0.0;
};

/**
 * @brief Assemble the precursor formula and name of a species.
 *
 * @param lipid_class Owning class (supplies the headgroup residue)
 * @param lcb Long-chain base
 * @param fa Fatty acid
 * @throws FormulaError if the combination has a negative atom count
 */
Species assembleSpecies(const LipidClassDef& lipid_class, const BuildingBlock& lcb,
                        const BuildingBlock& fa);

/// Canonical species name ("GD1a 18:1;2/18:0")
std::string speciesName(const std::string& class_name, const BuildingBlock& lcb,
                        const BuildingBlock& fa);

} // namespace gslgen
