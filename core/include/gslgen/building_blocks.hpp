#pragma once

#include "formula.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gslgen {

/// Which part of the ceramide backbone a building block is
enum class BlockKind : std::uint8_t {
    LONG_CHAIN_BASE,
    FATTY_ACID
};

/**
 * @brief One concrete long-chain base or fatty acid.
 *
 * Immutable once built. Long-chain bases contribute C(n) H(2n+3-2u) N O(h),
 * fatty acids C(n) H(2n-2u) O(2+h), where h counts hydroxyl groups (total
 * hydroxyls for a long-chain base, extra hydroxyls for a fatty acid).
 */
class BuildingBlock {
public:
    /**
     * @brief Construct a building block.
     *
     * @throws ConfigurationError if carbons < 1 or unsaturation/hydroxyls < 0
     */
    BuildingBlock(BlockKind kind, int carbons, int unsaturation, int hydroxyls);

    /**
     * @brief Parse a short name.
     *
     * "18:1;2" is a long-chain base with 18 carbons, 1 double bond and 2
     * hydroxyls; "16:0" is a fatty acid. A long-chain base written without
     * ";h" takes `default_hydroxyls`.
     *
     * @throws ConfigurationError on malformed text
     */
    static BuildingBlock parse(const std::string& text, BlockKind kind,
                               int default_hydroxyls = 2);

    [[nodiscard]] BlockKind kind() const noexcept { return kind_; }
    [[nodiscard]] int carbons() const noexcept { return carbons_; }
    [[nodiscard]] int unsaturation() const noexcept { return unsaturation_; }
    [[nodiscard]] int hydroxyls() const noexcept { return hydroxyls_; }

    /**
     * @brief Elemental contribution of this block.
     *
     * @throws FormulaError if the unsaturation leaves a negative hydrogen count
     */
    [[nodiscard]] Formula formula() const;

    /// Canonical short name ("18:1;2", "16:0", "16:0;1")
    [[nodiscard]] std::string name() const;

    /// Order by carbons, then unsaturation, then hydroxyls
    bool operator<(const BuildingBlock& other) const noexcept;
    bool operator==(const BuildingBlock& other) const noexcept;
    bool operator!=(const BuildingBlock& other) const noexcept { return !(*this == other); }

private:
    BlockKind kind_;
    int carbons_;
    int unsaturation_;
    int hydroxyls_;
};

/**
 * @brief Family of long-chain bases to enumerate.
 *
 * Hydroxylation degrees are counted from `base_hydroxyls` (2 for the common
 * 1,3-dihydroxy bases, 1 for 1-deoxy bases), so degree 0 with the default
 * baseline gives "18:1;2".
 */
struct LcbSpec {
    /// Carbon count range (inclusive)
    CarbonRange carbons{18, 18};

    /// Permitted unsaturation degrees
    std::vector<int> unsaturations{0, 1, 2};

    /// Permitted hydroxylation degrees beyond the baseline
    std::vector<int> hydroxylations{0};

    /// Hydroxyl count at hydroxylation degree 0
    int base_hydroxyls = 2;

    /// Explicit bases; when non-empty the ranges above are ignored
    std::vector<BuildingBlock> explicit_bases;
};

/**
 * @brief Family of N-acyl chains to enumerate.
 */
struct FaSpec {
    /// Carbon count range (inclusive)
    CarbonRange carbons{16, 26};

    /// Unsaturation degrees 0..max_unsaturation are enumerated
    int max_unsaturation = 1;

    /// Chain-length parity filter
    Parity parity = Parity::BOTH;

    /// Explicit chains; when non-empty the ranges above are ignored
    std::vector<BuildingBlock> explicit_chains;
};

/**
 * @brief Lazy, restartable enumeration of building blocks.
 *
 * Produces blocks in ascending carbon count, then unsaturation, then
 * hydroxylation. An empty intersection (e.g. min carbon > max carbon)
 * simply yields nothing.
 *
 * Usage:
 * @code
 * BlockEnumerator lcbs(LcbSpec{});
 * while (auto lcb = lcbs.next()) {
 *     std::cout << lcb->name() << "\n";
 * }
 * @endcode
 */
class BlockEnumerator {
public:
    explicit BlockEnumerator(const LcbSpec& spec);
    explicit BlockEnumerator(const FaSpec& spec);

    /// Next block, or std::nullopt once the sequence is exhausted
    std::optional<BuildingBlock> next();

    /// Restart from the first block
    void reset() noexcept;

    /// Kind of block this enumerator produces
    [[nodiscard]] BlockKind kind() const noexcept { return kind_; }

    /// Materialize the whole sequence (for small families and tests)
    [[nodiscard]] std::vector<BuildingBlock> toVector() const;

private:
    bool carbonAccepted(int carbons) const noexcept;

    BlockKind kind_;
    CarbonRange carbons_;
    Parity parity_ = Parity::BOTH;
    std::vector<int> unsaturations_;
    std::vector<int> hydroxyls_;
    std::vector<BuildingBlock> explicit_;
    bool use_explicit_ = false;

    // Cursor
    int carbon_ = 0;
    std::size_t unsat_index_ = 0;
    std::size_t hydroxyl_index_ = 0;
    std::size_t explicit_index_ = 0;
};

} // namespace gslgen
