#pragma once

#include "formula.hpp"
#include "mass_calculator.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace gslgen {

/// Product-name keywords labeled by default
constexpr const char* DEFAULT_LABEL_KEYWORDS = "LCB,precursor,HG(-Hex";

/**
 * @brief Parse an isotope label token.
 *
 * Tokens are case-insensitive, may start with "M" and list count/isotope
 * pairs: D (2H), N15, C13, O18. A missing count means 1.
 *
 * @code
 * parseIsotopeLabel("M2DN15");   // {"2H": 2, "15N": 1}
 * parseIsotopeLabel("m4d2n15");  // {"2H": 4, "15N": 2}
 * @endcode
 *
 * @throws ConfigurationError on an unrecognised isotope or a dangling count
 */
IsotopeSubstitution parseIsotopeLabel(const std::string& token);

/// Split a comma-separated keyword list, trimming blanks and dropping empties
std::vector<std::string> splitKeywords(const std::string& text);

/**
 * @brief Isotope labeling configuration of a run.
 */
struct IsotopeLabelSpec {
    /// Normalised token shown in heavy adduct names ("M2DN15")
    std::string token;

    /// Atoms replaced by heavy isotopes
    IsotopeSubstitution substitution;

    /// Case-insensitive product-name keywords selecting labeled products
    std::vector<std::string> keywords;
};

/**
 * @brief Build a label configuration from a token and a comma-separated keyword list.
 *
 * @throws ConfigurationError if the token is malformed
 */
IsotopeLabelSpec makeLabelSpec(const std::string& token,
                               const std::string& keywords = DEFAULT_LABEL_KEYWORDS);

/**
 * @brief Decides label eligibility and computes heavy masses.
 */
class IsotopeLabeler {
public:
    explicit IsotopeLabeler(IsotopeLabelSpec spec);

    /// True if any keyword occurs in the product name (case-insensitive)
    [[nodiscard]] bool isEligible(const std::string& product_name) const;

    /// Insert the token into an ion name: "[M+H]1+" -> "[M2DN15+H]1+"
    [[nodiscard]] std::string heavyAdductName(const std::string& ion_name) const;

    /**
     * @brief Neutral mass of a formula with the substitution applied.
     *
     * @throws FormulaError if the formula lacks the atoms to substitute
     */
    [[nodiscard]] Mass heavyMass(const Formula& formula) const;

    /// Neutral mass shift of the substitution
    [[nodiscard]] Mass massShift() const;

    [[nodiscard]] const IsotopeLabelSpec& spec() const noexcept { return spec_; }

private:
    IsotopeLabelSpec spec_;
    std::vector<std::string> lowered_keywords_;
};

} // namespace gslgen
