#pragma once

#include "adduct.hpp"
#include "building_blocks.hpp"
#include "fragmentation.hpp"
#include "isotope_label.hpp"
#include "lipid_class.hpp"
#include "species.hpp"
#include "transition.hpp"
#include "types.hpp"
#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gslgen {

/**
 * @brief Progress callback signature.
 *
 * @param current Rows emitted so far
 * @param total Total expected rows (-1 if unknown)
 * @return false to cancel generation, true to continue
 */
using ProgressCallback = std::function<bool(int current, int total)>;

/**
 * @brief Options for a generation run.
 */
struct GeneratorOptions {
    /// Maximum number of rows to emit (0 = unlimited)
    std::size_t max_rows = 0;

    /// Rows between progress callback invocations
    std::size_t progress_interval = 1000;

    /// Progress callback (called every `progress_interval` rows)
    ProgressCallback progress_callback = nullptr;
};

/**
 * @brief Cancellation signal shared between a caller and a running stream.
 *
 * cancel() may be called from any thread; the stream checks it between
 * emitted rows.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Complete input of one generation run.
 */
struct RunConfig {
    /// Lipid class name ("Cer", "GD1a")
    std::string lipid_class;

    LcbSpec lcb;
    FaSpec fa;

    /// Requested precursor charge magnitudes
    std::vector<ChargeState> charges{1};

    /// Precursor adducts, in declaration order
    std::vector<std::string> precursor_adducts{"[M+H]+", "[M-H]-"};

    /// Product adducts, in declaration order
    std::vector<std::string> product_adducts{"[M+H]+", "[M-H]-"};

    /// Isotope labeling (disabled when empty)
    std::optional<IsotopeLabelSpec> labels;

    GeneratorOptions options;
};

/**
 * @brief Default configuration for a class.
 *
 * Uses the class' default long-chain bases, FA 16..26 with unsaturation
 * 0..1, charge 1 and adducts [M+H]+ / [M-H]-.
 *
 * @throws ConfigurationError if the class is unknown
 */
RunConfig defaultRunConfig(const std::string& lipid_class,
                           const ClassRegistry& registry = ClassRegistry::standard());

/**
 * @brief Reject empty or inconsistent configurations.
 *
 * Requested charges the class cannot form are not errors; they are dropped
 * with a warning when the stream is built.
 *
 * @throws ConfigurationError describing the first problem found
 */
void validateConfig(const RunConfig& config,
                    const ClassRegistry& registry = ClassRegistry::standard());

/// Final state of a generation run
enum class GenerationStatus : std::uint8_t {
    COMPLETED,
    CANCELLED,
    ROW_LIMIT_REACHED
};

inline std::string toString(GenerationStatus status) {
    switch (status) {
        case GenerationStatus::CANCELLED: return "cancelled";
        case GenerationStatus::ROW_LIMIT_REACHED: return "row limit reached";
        default: return "completed";
    }
}

/**
 * @brief Counters of a generation run.
 */
struct GenerationStats {
    /// Species assembled
    std::size_t species = 0;

    /// Rows emitted
    std::size_t rows = 0;

    /// LCB x FA combinations rejected with a FormulaError
    std::size_t skipped_formulas = 0;

    /// (species, rule) pairs skipped for a negative atom count
    std::size_t skipped_rules = 0;

    /// Heavy rows dropped because the substitution did not fit the formula
    std::size_t skipped_labels = 0;
};

/**
 * @brief Lazy, cancellable stream of transition records.
 *
 * Rows are produced on demand in the order
 * species (LCB, then FA ascending) x rule order x precursor charge x
 * precursor adduct x product charge x product adduct x light/heavy.
 * Only the rows of one (species, rule, precursor ion) combination are
 * buffered at a time.
 *
 * The stream does not validate its configuration (see validateConfig());
 * empty building-block ranges simply yield no rows. The registry and token
 * must outlive the stream.
 *
 * Usage:
 * @code
 * TransitionStream stream(config);
 * while (auto record = stream.next()) {
 *     writer.write(*record);
 * }
 * @endcode
 */
class TransitionStream {
public:
    /**
     * @throws ConfigurationError if the class or an adduct is unknown
     */
    explicit TransitionStream(const RunConfig& config,
                              const ClassRegistry& registry = ClassRegistry::standard(),
                              const CancellationToken* cancel = nullptr);

    /// Next row, or std::nullopt once finished (see status())
    std::optional<TransitionRecord> next();

    /// Restart from the first row; counters and status are cleared
    void reset();

    /// True once next() has returned std::nullopt
    [[nodiscard]] bool finished() const noexcept { return finished_; }

    /// Status; meaningful once finished()
    [[nodiscard]] GenerationStatus status() const noexcept { return status_; }

    [[nodiscard]] const GenerationStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const LipidClassDef& lipidClass() const noexcept { return *class_; }

private:
    struct PrecursorIon {
        const AdductDef* adduct;
        ChargeState charge;
    };

    bool advance();
    bool nextSpecies();
    bool hasMoreRows();
    void emit(const ProductIon& product, const PrecursorIon& precursor);
    void emitPair(const ProductIon& product, const PrecursorIon& precursor,
                  const std::string& product_name, const AdductDef& product_adduct,
                  ChargeState product_charge);
    void finish(GenerationStatus status);

    RunConfig config_;
    const LipidClassDef* class_;
    const CancellationToken* cancel_;
    FragmentationEngine engine_;
    std::vector<AdductDef> product_adducts_;
    std::vector<PrecursorIon> precursor_ions_;
    std::unique_ptr<IsotopeLabeler> labeler_;

    BlockEnumerator lcbs_;
    BlockEnumerator fas_;
    std::optional<BuildingBlock> current_lcb_;
    std::optional<Species> species_;
    std::vector<ProductIon> products_;
    std::size_t product_index_ = 0;
    std::size_t precursor_index_ = 0;

    std::deque<TransitionRecord> buffer_;
    GenerationStats stats_;
    GenerationStatus status_ = GenerationStatus::COMPLETED;
    bool finished_ = false;
    bool callback_cancelled_ = false;
};

/**
 * @brief Result of a materialised generation run.
 */
struct GenerationResult {
    std::vector<TransitionRecord> records;
    GenerationStatus status = GenerationStatus::COMPLETED;
    GenerationStats stats;
};

/**
 * @brief Validate a configuration and collect every row of its stream.
 *
 * @throws ConfigurationError if the configuration is invalid
 */
GenerationResult generateTransitions(const RunConfig& config,
                                     const ClassRegistry& registry = ClassRegistry::standard(),
                                     const CancellationToken* cancel = nullptr);

} // namespace gslgen
