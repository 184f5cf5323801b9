#include "gslgen/fragmentation.hpp"
#include "gslgen/errors.hpp"
#include "gslgen/log.hpp"
#include "gslgen/mass_calculator.hpp"

namespace gslgen {

namespace {

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

FragmentationEngine::FragmentationEngine(const LipidClassDef& lipid_class)
    : class_(&lipid_class) {}

std::string FragmentationEngine::expandName(const std::string& name_template,
                                            const Species& species) {
    std::string name = name_template;
    replaceAll(name, "{lcb}", species.lcb.name());
    replaceAll(name, "{fa}", species.fa.name());
    return name;
}

std::string FragmentationEngine::chargedName(const std::string& name, ChargeState z) {
    if (z <= 1) {
        return name;
    }
    return name + " [Z=" + std::to_string(z) + "]";
}

std::optional<ProductIon> FragmentationEngine::apply(std::size_t rule_index,
                                                     const Species& species) const {
    if (rule_index >= class_->rules.size()) {
        throw ConfigurationError("rule index " + std::to_string(rule_index) +
                                 " out of range for class " + class_->name);
    }
    const FragmentRule& rule = class_->rules[rule_index];

    Formula base;
    switch (rule.base) {
        case RuleBase::PRECURSOR: base = species.formula; break;
        case RuleBase::LONG_CHAIN_BASE: base = species.lcb.formula(); break;
        case RuleBase::FATTY_ACID: base = species.fa.formula(); break;
        case RuleBase::NONE: break;
    }

    std::optional<Formula> formula = base.tryApply(rule.delta);
    if (!formula || formula->empty()) {
        return std::nullopt;
    }

    ProductIon product;
    product.name = expandName(rule.name, species);
    product.formula = std::move(*formula);
    product.mass = MassCalculator::monoisotopicMass(product.formula);
    product.polarity = rule.polarity;
    product.scope = rule.scope;
    product.max_charge = rule.max_charge;
    product.rule_index = rule_index;
    return product;
}

std::vector<ProductIon> FragmentationEngine::products(const Species& species,
                                                      std::size_t* skipped) const {
    std::vector<ProductIon> result;
    result.reserve(class_->rules.size());

    for (std::size_t i = 0; i < class_->rules.size(); ++i) {
        auto product = apply(i, species);
        if (!product) {
            log::debug("Skipping rule '{}' for {}: negative atom count",
                       class_->rules[i].name, species.name);
            if (skipped != nullptr) {
                ++(*skipped);
            }
            continue;
        }
        result.push_back(std::move(*product));
    }
    return result;
}

} // namespace gslgen
