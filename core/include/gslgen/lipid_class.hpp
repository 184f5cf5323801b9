#pragma once

#include "formula.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace gslgen {

/// What a fragment rule's delta is applied to
enum class RuleBase : std::uint8_t {
    PRECURSOR,        ///< The intact neutral precursor
    LONG_CHAIN_BASE,  ///< The free long-chain base of the species
    FATTY_ACID,       ///< The free fatty acid of the species
    NONE              ///< Nothing; the delta is the whole product formula
};

/// How a rule's product is charged
enum class RuleScope : std::uint8_t {
    INTACT_PRECURSOR,  ///< Inherits the precursor adduct and charge
    FRAGMENT           ///< Expanded over product adducts and product charges
};

/**
 * @brief Declarative fragmentation rule.
 *
 * The product formula is base formula + delta. Name templates may contain
 * `{lcb}` and `{fa}`, replaced by the short names of the species' building
 * blocks.
 */
struct FragmentRule {
    std::string name;
    RuleBase base = RuleBase::PRECURSOR;
    FormulaDelta delta;
    PolaritySet polarity = PolaritySet::BOTH;
    RuleScope scope = RuleScope::FRAGMENT;

    /// Highest product charge magnitude this rule produces
    ChargeState max_charge = 1;
};

/// Broad structural family of a lipid class
enum class ClassFamily : std::uint8_t {
    CERAMIDE,
    SPHINGOMYELIN,
    GLYCOSPHINGOLIPID
};

inline std::string toString(ClassFamily family) {
    switch (family) {
        case ClassFamily::CERAMIDE: return "ceramide";
        case ClassFamily::SPHINGOMYELIN: return "sphingomyelin";
        default: return "glycosphingolipid";
    }
}

/**
 * @brief Static definition of one lipid class.
 *
 * Immutable once registered; shared read-only by all generation runs.
 */
struct LipidClassDef {
    /// Class identifier ("Cer", "GD1a")
    std::string name;

    ClassFamily family = ClassFamily::GLYCOSPHINGOLIPID;

    /// Headgroup residue formula (empty for ceramides)
    Formula headgroup;

    /// Number of sialic-acid (Neu5Ac) residues
    int sialic_acids = 0;

    /// Number of sulfate or phosphate groups
    int acidic_groups = 0;

    /// Allowed precursor charge magnitudes
    ChargeRange charge_range{1, 1};

    /**
     * @brief Negative-mode charge bound (ionizable sites).
     *
     * 0 means "derive from composition": sialic acids + acidic groups + 1.
     */
    ChargeState negative_charge_limit = 0;

    /// Charge states suggested for this class
    std::vector<ChargeState> recommended_charges{1};

    /// Hydroxyl count of the class' long-chain bases at hydroxylation 0
    int base_hydroxyls = 2;

    /// Default long-chain bases ("18:1;2", ...)
    std::vector<std::string> default_bases;

    /// Default isotope label token for heavy standards
    std::string default_label_token = "M2DN15";

    /// Human-readable structure
    std::string description;

    /// Expected molecular weight range, in Da
    Range<double> mw_range{0.0, 0.0};

    /// Fragment rules in output order
    std::vector<FragmentRule> rules;

    /// Effective negative-mode charge bound
    [[nodiscard]] ChargeState negativeChargeLimit() const noexcept {
        return negative_charge_limit > 0 ? negative_charge_limit
                                         : sialic_acids + acidic_groups + 1;
    }

    /**
     * @brief Check if a precursor of charge z and given polarity is plausible.
     *
     * z must lie inside `charge_range`; in negative mode it must also not
     * exceed `negativeChargeLimit()`.
     */
    [[nodiscard]] bool acceptsCharge(ChargeState z, Polarity polarity) const noexcept {
        if (!charge_range.contains(z)) {
            return false;
        }
        return polarity != Polarity::NEGATIVE || z <= negativeChargeLimit();
    }
};

/**
 * @brief Catalog of lipid classes, keyed by name.
 *
 * The built-in catalog is available through standard(); custom registries
 * can be assembled with add() for new classes or tests.
 */
class ClassRegistry {
public:
    ClassRegistry() = default;

    /// Built-in catalog (constructed once, read-only)
    static const ClassRegistry& standard();

    /**
     * @brief Register a class.
     *
     * @throws ConfigurationError if the name is empty or already registered
     */
    void add(LipidClassDef def);

    /**
     * @brief Look up a class.
     *
     * @throws ConfigurationError if the class is unknown
     */
    [[nodiscard]] const LipidClassDef& get(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    /// Class names, sorted
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const noexcept { return classes_.size(); }

private:
    std::map<std::string, LipidClassDef> classes_;
};

/// Populate a registry with the built-in lipid classes
void registerStandardClasses(ClassRegistry& registry);

} // namespace gslgen
