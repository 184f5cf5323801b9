#pragma once

#include "formula.hpp"
#include "lipid_class.hpp"
#include "species.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gslgen {

/**
 * @brief Neutral product of one fragment rule applied to one species.
 *
 * Adducts and charges are applied later; `formula` and `mass` are neutral.
 */
struct ProductIon {
    /// Rule name with `{lcb}`/`{fa}` expanded (no charge suffix)
    std::string name;

    Formula formula;
    Mass mass = 0.0;

    PolaritySet polarity = PolaritySet::BOTH;
    RuleScope scope = RuleScope::FRAGMENT;
    ChargeState max_charge = 1;

    /// Position of the producing rule in the class rule list
    std::size_t rule_index = 0;
};

/**
 * @brief Generic interpreter of a class's fragment rules.
 *
 * Holds no per-class logic: every class-specific behavior comes from the
 * FragmentRule list of the LipidClassDef. A rule whose product would hold a
 * negative atom count is skipped for that species.
 *
 * The class definition must outlive the engine.
 */
class FragmentationEngine {
public:
    explicit FragmentationEngine(const LipidClassDef& lipid_class);

    /**
     * @brief Apply one rule to a species.
     *
     * @return The product, or std::nullopt if the rule is structurally
     *         impossible for this species
     */
    [[nodiscard]] std::optional<ProductIon> apply(std::size_t rule_index,
                                                  const Species& species) const;

    /**
     * @brief Apply every rule in class order.
     *
     * @param species Precursor species
     * @param skipped Incremented once per skipped rule (may be null)
     */
    [[nodiscard]] std::vector<ProductIon> products(const Species& species,
                                                   std::size_t* skipped = nullptr) const;

    [[nodiscard]] std::size_t ruleCount() const noexcept { return class_->rules.size(); }

    [[nodiscard]] const LipidClassDef& lipidClass() const noexcept { return *class_; }

    /// Replace `{lcb}` and `{fa}` in a rule name template
    static std::string expandName(const std::string& name_template, const Species& species);

    /// Product name at charge z (" [Z=n]" appended for z > 1)
    static std::string chargedName(const std::string& name, ChargeState z);

private:
    const LipidClassDef* class_;
};

} // namespace gslgen
