#pragma once

#include "types.hpp"
#include <string>

namespace gslgen {

/// Isotope label designation of a transition row
enum class LabelStatus : std::uint8_t {
    NONE = 0,  ///< No labeling active, or product not label-eligible
    LIGHT,     ///< Unlabeled member of a light/heavy pair
    HEAVY      ///< Isotope-substituted member of a light/heavy pair
};

/// Convert label status to its output value ("", "light", "heavy")
inline std::string toString(LabelStatus status) {
    switch (status) {
        case LabelStatus::LIGHT: return "light";
        case LabelStatus::HEAVY: return "heavy";
        default: return "";
    }
}

/**
 * @brief One output row of a transition list.
 *
 * Charges are signed (+z positive mode, -z negative mode). Formulas are the
 * neutral compositions of the precursor and product; m/z values are full
 * precision and rounded only when written out.
 */
struct TransitionRecord {
    /// Lipid class ("GD1a")
    std::string molecule_list_name;

    /// Species name ("GD1a 18:1;2/18:0")
    std::string molecule;

    std::string molecule_formula;
    std::string precursor_adduct;
    MZ precursor_mz = 0.0;
    int precursor_charge = 0;

    std::string product_name;
    std::string product_formula;
    MZ product_mz = 0.0;
    int product_charge = 0;

    LabelStatus label = LabelStatus::NONE;

    bool operator==(const TransitionRecord& other) const {
        return molecule_list_name == other.molecule_list_name &&
               molecule == other.molecule &&
               molecule_formula == other.molecule_formula &&
               precursor_adduct == other.precursor_adduct &&
               precursor_mz == other.precursor_mz &&
               precursor_charge == other.precursor_charge &&
               product_name == other.product_name &&
               product_formula == other.product_formula &&
               product_mz == other.product_mz &&
               product_charge == other.product_charge &&
               label == other.label;
    }

    bool operator!=(const TransitionRecord& other) const { return !(*this == other); }
};

} // namespace gslgen
