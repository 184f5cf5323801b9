#pragma once

#include "types.hpp"
#include <map>
#include <optional>
#include <string>

namespace gslgen {

class FormulaDelta;

/**
 * @brief Elemental composition of a neutral molecule or fragment.
 *
 * A Formula maps element symbols to non-negative atom counts. Elements with
 * a zero count are never stored, so an absent element and a zero count are
 * the same thing. Iteration order is the symbol order of std::map, which
 * keeps every derived value independent of insertion order.
 */
class Formula {
public:
    using Counts = std::map<std::string, int>;

    /// Empty formula (no atoms)
    Formula() = default;

    /**
     * @brief Construct from element counts.
     *
     * @param counts Element symbol to atom count
     * @throws FormulaError if a count is negative or a symbol is unknown
     */
    explicit Formula(const Counts& counts);

    /**
     * @brief Parse formula text such as "C34H67NO3".
     *
     * @throws FormulaError on malformed text or unknown elements
     */
    static Formula parse(const std::string& text);

    /// Get the atom count of an element (0 when absent)
    [[nodiscard]] int count(const std::string& symbol) const;

    /// Check if the formula holds no atoms
    [[nodiscard]] bool empty() const noexcept { return counts_.empty(); }

    /// Get the element counts
    [[nodiscard]] const Counts& counts() const noexcept { return counts_; }

    /// Total number of atoms
    [[nodiscard]] int atomCount() const;

    /// Add all atoms of another formula
    Formula& operator+=(const Formula& other);

    /**
     * @brief Remove all atoms of another formula.
     *
     * @throws FormulaError if any count would become negative
     */
    Formula& operator-=(const Formula& other);

    /**
     * @brief Apply a signed delta.
     *
     * @return The resulting formula, or std::nullopt if any element count
     *         would become negative
     */
    [[nodiscard]] std::optional<Formula> tryApply(const FormulaDelta& delta) const;

    /**
     * @brief Apply a signed delta.
     *
     * @throws FormulaError if any element count would become negative
     */
    [[nodiscard]] Formula apply(const FormulaDelta& delta) const;

    /// Formula text, C H N O P S first, then other elements alphabetically
    [[nodiscard]] std::string toString() const;

    bool operator==(const Formula& other) const { return counts_ == other.counts_; }
    bool operator!=(const Formula& other) const { return counts_ != other.counts_; }

private:
    Counts counts_;
};

inline Formula operator+(Formula lhs, const Formula& rhs) {
    lhs += rhs;
    return lhs;
}

inline Formula operator-(Formula lhs, const Formula& rhs) {
    lhs -= rhs;
    return lhs;
}

/**
 * @brief Signed per-element change applied to a formula.
 *
 * Used for neutral losses ("-C11H17NO8"), condensation water ("-H2O") and
 * mixed changes ("+HN-O"). A sign applies to every element that follows it
 * until the next sign; text without a leading sign is additive.
 */
class FormulaDelta {
public:
    using Counts = std::map<std::string, int>;

    FormulaDelta() = default;

    /// Construct from signed counts (zero entries are dropped)
    explicit FormulaDelta(const Counts& counts);

    /// Delta that adds every atom of a formula
    static FormulaDelta adding(const Formula& formula);

    /// Delta that removes every atom of a formula
    static FormulaDelta removing(const Formula& formula);

    /**
     * @brief Parse delta text such as "-C11H17NO8" or "+HN-O".
     *
     * @throws FormulaError on malformed text or unknown elements
     */
    static FormulaDelta parse(const std::string& text);

    /// Get the signed change for an element (0 when absent)
    [[nodiscard]] int count(const std::string& symbol) const;

    [[nodiscard]] const Counts& counts() const noexcept { return counts_; }

    [[nodiscard]] bool isZero() const noexcept { return counts_.empty(); }

    FormulaDelta& operator+=(const FormulaDelta& other);

    /// Delta text, additions first ("+HN-O"); "0" for no change
    [[nodiscard]] std::string toString() const;

    bool operator==(const FormulaDelta& other) const { return counts_ == other.counts_; }

private:
    Counts counts_;
};

inline FormulaDelta operator+(FormulaDelta lhs, const FormulaDelta& rhs) {
    lhs += rhs;
    return lhs;
}

} // namespace gslgen
