#include "gslgen/building_blocks.hpp"
#include "gslgen/errors.hpp"
#include <algorithm>
#include <regex>

namespace gslgen {

namespace {

std::vector<int> sortedUnique(std::vector<int> values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

std::vector<BuildingBlock> sortedUnique(std::vector<BuildingBlock> blocks) {
    std::sort(blocks.begin(), blocks.end());
    blocks.erase(std::unique(blocks.begin(), blocks.end()), blocks.end());
    return blocks;
}

} // namespace

// ============================================================================
// BuildingBlock
// ============================================================================

BuildingBlock::BuildingBlock(BlockKind kind, int carbons, int unsaturation, int hydroxyls)
    : kind_(kind), carbons_(carbons), unsaturation_(unsaturation), hydroxyls_(hydroxyls) {
    if (carbons < 1) {
        throw ConfigurationError("carbon count must be positive, got " +
                                 std::to_string(carbons));
    }
    if (unsaturation < 0) {
        throw ConfigurationError("unsaturation must not be negative, got " +
                                 std::to_string(unsaturation));
    }
    if (hydroxyls < 0) {
        throw ConfigurationError("hydroxyl count must not be negative, got " +
                                 std::to_string(hydroxyls));
    }
}

BuildingBlock BuildingBlock::parse(const std::string& text, BlockKind kind,
                                   int default_hydroxyls) {
    static const std::regex pattern(R"(^\s*(\d+):(\d+)(?:;(\d+))?\s*$)");
    std::smatch match;
    if (!std::regex_match(text, match, pattern)) {
        throw ConfigurationError("malformed building block '" + text + "'");
    }

    int carbons = std::stoi(match[1].str());
    int unsaturation = std::stoi(match[2].str());
    int hydroxyls = 0;
    if (match[3].matched) {
        hydroxyls = std::stoi(match[3].str());
    } else if (kind == BlockKind::LONG_CHAIN_BASE) {
        hydroxyls = default_hydroxyls;
    }
    return BuildingBlock(kind, carbons, unsaturation, hydroxyls);
}

Formula BuildingBlock::formula() const {
    if (kind_ == BlockKind::LONG_CHAIN_BASE) {
        return Formula({
            {"C", carbons_},
            {"H", 2 * carbons_ + 3 - 2 * unsaturation_},
            {"N", 1},
            {"O", hydroxyls_},
        });
    }
    return Formula({
        {"C", carbons_},
        {"H", 2 * carbons_ - 2 * unsaturation_},
        {"O", 2 + hydroxyls_},
    });
}

std::string BuildingBlock::name() const {
    std::string out = std::to_string(carbons_) + ":" + std::to_string(unsaturation_);
    if (kind_ == BlockKind::LONG_CHAIN_BASE || hydroxyls_ > 0) {
        out += ";" + std::to_string(hydroxyls_);
    }
    return out;
}

bool BuildingBlock::operator<(const BuildingBlock& other) const noexcept {
    if (carbons_ != other.carbons_) return carbons_ < other.carbons_;
    if (unsaturation_ != other.unsaturation_) return unsaturation_ < other.unsaturation_;
    return hydroxyls_ < other.hydroxyls_;
}

bool BuildingBlock::operator==(const BuildingBlock& other) const noexcept {
    return kind_ == other.kind_ && carbons_ == other.carbons_ &&
           unsaturation_ == other.unsaturation_ && hydroxyls_ == other.hydroxyls_;
}

// ============================================================================
// BlockEnumerator
// ============================================================================

BlockEnumerator::BlockEnumerator(const LcbSpec& spec)
    : kind_(BlockKind::LONG_CHAIN_BASE), carbons_(spec.carbons) {
    if (!spec.explicit_bases.empty()) {
        explicit_ = sortedUnique(spec.explicit_bases);
        use_explicit_ = true;
    }
    unsaturations_ = sortedUnique(spec.unsaturations);
    for (int degree : sortedUnique(spec.hydroxylations)) {
        hydroxyls_.push_back(spec.base_hydroxyls + degree);
    }
    reset();
}

BlockEnumerator::BlockEnumerator(const FaSpec& spec)
    : kind_(BlockKind::FATTY_ACID), carbons_(spec.carbons), parity_(spec.parity) {
    if (!spec.explicit_chains.empty()) {
        explicit_ = sortedUnique(spec.explicit_chains);
        use_explicit_ = true;
    }
    for (int u = 0; u <= spec.max_unsaturation; ++u) {
        unsaturations_.push_back(u);
    }
    hydroxyls_.push_back(0);
    reset();
}

void BlockEnumerator::reset() noexcept {
    carbon_ = carbons_.min_value;
    unsat_index_ = 0;
    hydroxyl_index_ = 0;
    explicit_index_ = 0;
}

bool BlockEnumerator::carbonAccepted(int carbons) const noexcept {
    switch (parity_) {
        case Parity::EVEN: return carbons % 2 == 0;
        case Parity::ODD: return carbons % 2 != 0;
        default: return true;
    }
}

std::optional<BuildingBlock> BlockEnumerator::next() {
    if (use_explicit_) {
        if (explicit_index_ >= explicit_.size()) {
            return std::nullopt;
        }
        return explicit_[explicit_index_++];
    }

    if (unsaturations_.empty() || hydroxyls_.empty()) {
        return std::nullopt;
    }

    while (carbon_ <= carbons_.max_value) {
        if (!carbonAccepted(carbon_)) {
            ++carbon_;
            continue;
        }

        BuildingBlock block(kind_, carbon_, unsaturations_[unsat_index_],
                            hydroxyls_[hydroxyl_index_]);

        // Advance: hydroxyls fastest, then unsaturation, then carbons
        if (++hydroxyl_index_ >= hydroxyls_.size()) {
            hydroxyl_index_ = 0;
            if (++unsat_index_ >= unsaturations_.size()) {
                unsat_index_ = 0;
                ++carbon_;
            }
        }
        return block;
    }
    return std::nullopt;
}

std::vector<BuildingBlock> BlockEnumerator::toVector() const {
    BlockEnumerator copy = *this;
    copy.reset();
    std::vector<BuildingBlock> blocks;
    while (auto block = copy.next()) {
        blocks.push_back(*block);
    }
    return blocks;
}

} // namespace gslgen
