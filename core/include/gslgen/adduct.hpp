#pragma once

#include "formula.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace gslgen {

/**
 * @brief Ionization adduct, applied uniformly to precursor and product ions.
 *
 * An adduct carries `carrier_count` non-proton charge carriers (Na+, NH4+,
 * CH3COO-, ...). At charge z the remaining z - carrier_count charges are
 * protons added (positive mode) or removed (negative mode), so
 *
 *     m/z = (M + k * carrier_ion_mass +/- (z - k) * proton_mass) / z
 *
 * "[M+H]+" at z=2 is "[M+2H]2+", "[M+Na]+" at z=2 is "[M+H+Na]2+".
 */
struct AdductDef {
    /// Catalog name ("[M+H]+", "[M+Na]+", "[M+CH3COO]-")
    std::string name;

    /// Charge sign
    Polarity polarity = Polarity::POSITIVE;

    /// Neutral formula of one charge carrier (empty for proton-only adducts)
    Formula carrier;

    /// Label of the carrier in ion names ("Na", "NH4", "CH3COO")
    std::string carrier_label;

    /// Number of carriers (k)
    int carrier_count = 0;

    /// Lowest charge this adduct can form
    [[nodiscard]] ChargeState minCharge() const noexcept {
        return carrier_count > 1 ? carrier_count : 1;
    }

    /// Check if the adduct can form an ion of charge magnitude z
    [[nodiscard]] bool supportsCharge(ChargeState z) const noexcept {
        return z >= minCharge() && z <= MAX_CHARGE;
    }

    /// Ion mass of one carrier (formula mass corrected by the electron mass)
    [[nodiscard]] Mass carrierIonMass() const;

    /**
     * @brief Mass added to the neutral molecule to form the z-charged ion.
     *
     * @throws ConfigurationError if z is not supported
     */
    [[nodiscard]] Mass massDelta(ChargeState z) const;

    /**
     * @brief Compute m/z of the z-charged ion of a neutral mass.
     *
     * @throws ConfigurationError if z is not supported
     */
    [[nodiscard]] MZ mz(Mass neutral_mass, ChargeState z) const;

    /**
     * @brief Ion notation at charge z ("[M+H]1+", "[M-2H]2-", "[M+H+Na]2+").
     *
     * @throws ConfigurationError if z is not supported
     */
    [[nodiscard]] std::string ionName(ChargeState z) const;

    /// Signed charge (+z or -z)
    [[nodiscard]] int signedCharge(ChargeState z) const noexcept {
        return polarity == Polarity::NEGATIVE ? -z : z;
    }
};

/**
 * @brief Read-only catalog of the supported adducts.
 */
class AdductCatalog {
public:
    /// All adducts in catalog order
    static const std::vector<AdductDef>& all();

    /// Check if an adduct name is known
    static bool contains(const std::string& name);

    /**
     * @brief Look up an adduct by name.
     *
     * Accepts the catalog name ("[M+H]+") and the bare form ("M+H").
     *
     * @throws ConfigurationError if the name is unknown
     */
    static const AdductDef& get(const std::string& name);

    /**
     * @brief Resolve a list of names, preserving order and dropping duplicates.
     *
     * @throws ConfigurationError if any name is unknown
     */
    static std::vector<AdductDef> resolve(const std::vector<std::string>& names);
};

} // namespace gslgen
