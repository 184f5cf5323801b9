#include "gslgen/engine.hpp"
#include "gslgen/elements.hpp"
#include "gslgen/errors.hpp"
#include "gslgen/log.hpp"
#include <fmt/ranges.h>
#include <algorithm>

namespace gslgen {

namespace {

std::vector<ChargeState> sortedCharges(std::vector<ChargeState> charges) {
    std::sort(charges.begin(), charges.end());
    charges.erase(std::unique(charges.begin(), charges.end()), charges.end());
    return charges;
}

void checkDegrees(const std::vector<int>& degrees, const std::string& what) {
    if (degrees.empty()) {
        throw ConfigurationError("no " + what + " degrees given");
    }
    for (int d : degrees) {
        if (d < 0) {
            throw ConfigurationError(what + " degree must not be negative, got " +
                                     std::to_string(d));
        }
    }
}

void checkCarbonRange(const CarbonRange& range, const std::string& what) {
    if (range.isEmpty()) {
        throw ConfigurationError(what + " carbon range [" + std::to_string(range.min_value) +
                                 ", " + std::to_string(range.max_value) + "] is empty");
    }
    if (range.min_value < 1) {
        throw ConfigurationError(what + " carbon count must be positive, got " +
                                 std::to_string(range.min_value));
    }
}

void checkBlocks(const std::vector<BuildingBlock>& blocks, BlockKind kind,
                 const std::string& what) {
    for (const auto& block : blocks) {
        if (block.kind() != kind) {
            throw ConfigurationError("explicit " + what + " list holds " + block.name() +
                                     " of the wrong kind");
        }
    }
}

void validateLcb(const LcbSpec& lcb) {
    if (!lcb.explicit_bases.empty()) {
        checkBlocks(lcb.explicit_bases, BlockKind::LONG_CHAIN_BASE, "long-chain base");
        return;
    }
    checkCarbonRange(lcb.carbons, "long-chain base");
    checkDegrees(lcb.unsaturations, "long-chain base unsaturation");
    checkDegrees(lcb.hydroxylations, "long-chain base hydroxylation");
    if (lcb.base_hydroxyls < 0) {
        throw ConfigurationError("long-chain base hydroxyl baseline must not be negative");
    }
}

void validateFa(const FaSpec& fa) {
    if (!fa.explicit_chains.empty()) {
        checkBlocks(fa.explicit_chains, BlockKind::FATTY_ACID, "fatty acid");
        return;
    }
    checkCarbonRange(fa.carbons, "fatty acid");
    if (fa.max_unsaturation < 0) {
        throw ConfigurationError("fatty acid maximum unsaturation must not be negative, got " +
                                 std::to_string(fa.max_unsaturation));
    }

    bool any = false;
    for (int c = fa.carbons.min_value; c <= fa.carbons.max_value && !any; ++c) {
        any = fa.parity == Parity::BOTH || (fa.parity == Parity::EVEN) == (c % 2 == 0);
    }
    if (!any) {
        throw ConfigurationError("no fatty acid chain length in [" +
                                 std::to_string(fa.carbons.min_value) + ", " +
                                 std::to_string(fa.carbons.max_value) + "] is " +
                                 toString(fa.parity));
    }
}

} // namespace

// ============================================================================
// Configuration
// ============================================================================

RunConfig defaultRunConfig(const std::string& lipid_class, const ClassRegistry& registry) {
    const LipidClassDef& def = registry.get(lipid_class);

    RunConfig config;
    config.lipid_class = def.name;
    config.lcb.base_hydroxyls = def.base_hydroxyls;
    for (const auto& base : def.default_bases) {
        config.lcb.explicit_bases.push_back(
            BuildingBlock::parse(base, BlockKind::LONG_CHAIN_BASE, def.base_hydroxyls));
    }
    return config;
}

void validateConfig(const RunConfig& config, const ClassRegistry& registry) {
    if (config.lipid_class.empty()) {
        throw ConfigurationError("no lipid class given");
    }
    if (!registry.contains(config.lipid_class)) {
        throw ConfigurationError("unknown lipid class '" + config.lipid_class + "'");
    }

    validateLcb(config.lcb);
    validateFa(config.fa);

    if (config.charges.empty()) {
        throw ConfigurationError("no charge states given");
    }
    for (ChargeState z : config.charges) {
        if (z < 1 || z > MAX_CHARGE) {
            throw ConfigurationError("charge state " + std::to_string(z) +
                                     " outside 1.." + std::to_string(MAX_CHARGE));
        }
    }

    if (config.precursor_adducts.empty()) {
        throw ConfigurationError("no precursor adducts given");
    }
    if (config.product_adducts.empty()) {
        throw ConfigurationError("no product adducts given");
    }
    AdductCatalog::resolve(config.precursor_adducts);
    AdductCatalog::resolve(config.product_adducts);

    if (config.labels) {
        if (config.labels->substitution.empty()) {
            throw ConfigurationError("isotope label '" + config.labels->token +
                                     "' substitutes no atoms");
        }
        for (const auto& [isotope, n] : config.labels->substitution) {
            if (!ElementTable::isKnownIsotope(isotope)) {
                throw ConfigurationError("isotope label '" + config.labels->token +
                                         "' names unknown isotope " + isotope);
            }
            if (n < 1) {
                throw ConfigurationError("isotope label '" + config.labels->token +
                                         "' substitutes " + std::to_string(n) + " " +
                                         isotope + " atoms");
            }
        }
    }
}

// ============================================================================
// TransitionStream
// ============================================================================

TransitionStream::TransitionStream(const RunConfig& config, const ClassRegistry& registry,
                                   const CancellationToken* cancel)
    : config_(config),
      class_(&registry.get(config.lipid_class)),
      cancel_(cancel),
      engine_(*class_),
      product_adducts_(AdductCatalog::resolve(config.product_adducts)),
      lcbs_(config_.lcb),
      fas_(config_.fa) {
    const std::vector<ChargeState> charges = sortedCharges(config_.charges);
    const std::vector<AdductDef> precursors = AdductCatalog::resolve(config_.precursor_adducts);

    log::info("Starting transition generation for {} with charge states {}",
              class_->name, fmt::join(charges, ", "));

    for (ChargeState z : charges) {
        for (const auto& resolved : precursors) {
            const AdductDef& adduct = AdductCatalog::get(resolved.name);
            if (!adduct.supportsCharge(z)) {
                log::warn("Adduct {} cannot form charge {}; skipping", adduct.name, z);
                continue;
            }
            if (!class_->acceptsCharge(z, adduct.polarity)) {
                log::warn("Charge state {}{} not valid for {}; skipping", z,
                          signChar(adduct.polarity), class_->name);
                continue;
            }
            precursor_ions_.push_back(PrecursorIon{&adduct, z});
        }
    }

    if (config_.labels) {
        labeler_ = std::make_unique<IsotopeLabeler>(*config_.labels);
    }
}

std::optional<TransitionRecord> TransitionStream::next() {
    if (finished_) {
        return std::nullopt;
    }
    if (callback_cancelled_ || (cancel_ != nullptr && cancel_->isCancelled())) {
        finish(GenerationStatus::CANCELLED);
        return std::nullopt;
    }

    const GeneratorOptions& options = config_.options;
    if (options.max_rows > 0 && stats_.rows >= options.max_rows) {
        finish(hasMoreRows() ? GenerationStatus::ROW_LIMIT_REACHED
                             : GenerationStatus::COMPLETED);
        return std::nullopt;
    }
    if (!hasMoreRows()) {
        finish(GenerationStatus::COMPLETED);
        return std::nullopt;
    }

    TransitionRecord record = std::move(buffer_.front());
    buffer_.pop_front();
    ++stats_.rows;

    if (options.progress_callback && options.progress_interval > 0 &&
        stats_.rows % options.progress_interval == 0) {
        if (!options.progress_callback(static_cast<int>(stats_.rows), -1)) {
            callback_cancelled_ = true;
        }
    }
    return record;
}

void TransitionStream::reset() {
    lcbs_.reset();
    fas_.reset();
    current_lcb_.reset();
    species_.reset();
    products_.clear();
    product_index_ = 0;
    precursor_index_ = 0;
    buffer_.clear();
    stats_ = GenerationStats{};
    status_ = GenerationStatus::COMPLETED;
    finished_ = false;
    callback_cancelled_ = false;
}

bool TransitionStream::hasMoreRows() {
    while (buffer_.empty()) {
        if (!advance()) {
            return false;
        }
    }
    return true;
}

bool TransitionStream::advance() {
    if (precursor_ions_.empty()) {
        return false;
    }

    for (;;) {
        if (!species_) {
            if (!nextSpecies()) {
                return false;
            }
            product_index_ = 0;
            precursor_index_ = 0;
        }
        if (product_index_ >= products_.size()) {
            species_.reset();
            continue;
        }
        if (precursor_index_ >= precursor_ions_.size()) {
            ++product_index_;
            precursor_index_ = 0;
            continue;
        }

        emit(products_[product_index_], precursor_ions_[precursor_index_]);
        ++precursor_index_;
        return true;
    }
}

bool TransitionStream::nextSpecies() {
    for (;;) {
        if (!current_lcb_) {
            current_lcb_ = lcbs_.next();
            if (!current_lcb_) {
                return false;
            }
            fas_.reset();
        }

        auto fa = fas_.next();
        if (!fa) {
            current_lcb_.reset();
            continue;
        }

        try {
            species_ = assembleSpecies(*class_, *current_lcb_, *fa);
        } catch (const FormulaError& e) {
            ++stats_.skipped_formulas;
            log::debug("Skipping {}: {}", speciesName(class_->name, *current_lcb_, *fa),
                       e.what());
            continue;
        }

        ++stats_.species;
        products_ = engine_.products(*species_, &stats_.skipped_rules);
        return true;
    }
}

void TransitionStream::emit(const ProductIon& product, const PrecursorIon& precursor) {
    const Polarity polarity = precursor.adduct->polarity;
    if (!contains(product.polarity, polarity)) {
        return;
    }

    if (product.scope == RuleScope::INTACT_PRECURSOR) {
        emitPair(product, precursor, product.name, *precursor.adduct, precursor.charge);
        return;
    }

    ChargeState limit = std::min(product.max_charge, precursor.charge);
    if (polarity == Polarity::NEGATIVE) {
        limit = std::min(limit, class_->negativeChargeLimit());
    }

    for (ChargeState z = 1; z <= limit; ++z) {
        const std::string name = FragmentationEngine::chargedName(product.name, z);
        for (const auto& adduct : product_adducts_) {
            if (adduct.polarity == polarity && adduct.supportsCharge(z)) {
                emitPair(product, precursor, name, adduct, z);
            }
        }
    }
}

void TransitionStream::emitPair(const ProductIon& product, const PrecursorIon& precursor,
                                const std::string& product_name,
                                const AdductDef& product_adduct, ChargeState product_charge) {
    const AdductDef& precursor_adduct = *precursor.adduct;

    TransitionRecord light;
    light.molecule_list_name = class_->name;
    light.molecule = species_->name;
    light.molecule_formula = species_->formula.toString();
    light.precursor_adduct = precursor_adduct.ionName(precursor.charge);
    light.precursor_mz = precursor_adduct.mz(species_->mass, precursor.charge);
    light.precursor_charge = precursor_adduct.signedCharge(precursor.charge);
    light.product_name = product_name;
    light.product_formula = product.formula.toString();
    light.product_mz = product_adduct.mz(product.mass, product_charge);
    light.product_charge = product_adduct.signedCharge(product_charge);

    if (!labeler_ || !labeler_->isEligible(product_name)) {
        buffer_.push_back(std::move(light));
        return;
    }

    TransitionRecord heavy = light;
    heavy.label = LabelStatus::HEAVY;
    heavy.precursor_adduct = labeler_->heavyAdductName(light.precursor_adduct);

    try {
        heavy.precursor_mz = precursor_adduct.mz(labeler_->heavyMass(species_->formula),
                                                 precursor.charge);
        heavy.product_mz = product_adduct.mz(labeler_->heavyMass(product.formula),
                                             product_charge);
    } catch (const FormulaError& e) {
        ++stats_.skipped_labels;
        log::debug("No heavy row for {} / {}: {}", species_->name, product_name, e.what());
        buffer_.push_back(std::move(light));
        return;
    }

    light.label = LabelStatus::LIGHT;
    buffer_.push_back(std::move(light));
    buffer_.push_back(std::move(heavy));
}

void TransitionStream::finish(GenerationStatus status) {
    status_ = status;
    finished_ = true;
    buffer_.clear();

    log::info("Generated {} transitions for {} ({} species, status: {})", stats_.rows,
              class_->name, stats_.species, toString(status));
    if (stats_.skipped_formulas + stats_.skipped_rules + stats_.skipped_labels > 0) {
        log::debug("Skipped {} formulas, {} rule applications, {} heavy rows",
                   stats_.skipped_formulas, stats_.skipped_rules, stats_.skipped_labels);
    }
}

// ============================================================================
// Materialised run
// ============================================================================

GenerationResult generateTransitions(const RunConfig& config, const ClassRegistry& registry,
                                     const CancellationToken* cancel) {
    validateConfig(config, registry);

    TransitionStream stream(config, registry, cancel);
    GenerationResult result;
    while (auto record = stream.next()) {
        result.records.push_back(std::move(*record));
    }
    result.status = stream.status();
    result.stats = stream.stats();
    return result;
}

} // namespace gslgen
