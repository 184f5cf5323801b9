#include "gslgen/formula.hpp"
#include "gslgen/elements.hpp"
#include "gslgen/errors.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace gslgen {

namespace {

/// Largest count accepted for one element in formula text
constexpr int MAX_ATOM_COUNT = 100000;

// Parses "C6H12O6" style element runs. A '+' or '-' switches the sign for
// everything that follows when allow_signs is set.
std::map<std::string, int> parseCounts(const std::string& text, bool allow_signs) {
    std::map<std::string, int> counts;
    int sign = 1;
    std::size_t i = 0;

    while (i < text.size()) {
        char c = text[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (c == '+' || c == '-') {
            if (!allow_signs) {
                throw FormulaError("unexpected sign in formula '" + text + "'");
            }
            sign = (c == '-') ? -1 : 1;
            ++i;
            continue;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            throw FormulaError("malformed formula '" + text + "' at position " +
                               std::to_string(i));
        }

        std::string symbol(1, c);
        ++i;
        while (i < text.size() && std::islower(static_cast<unsigned char>(text[i]))) {
            symbol += text[i];
            ++i;
        }

        if (!ElementTable::isKnown(symbol)) {
            throw FormulaError("unknown element '" + symbol + "' in '" + text + "'");
        }

        int n = 0;
        bool has_digits = false;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            n = n * 10 + (text[i] - '0');
            if (n > MAX_ATOM_COUNT) {
                throw FormulaError("atom count of " + symbol + " exceeds " +
                                   std::to_string(MAX_ATOM_COUNT) + " in '" + text + "'");
            }
            has_digits = true;
            ++i;
        }
        if (!has_digits) {
            n = 1;
        }

        counts[symbol] += sign * n;
    }

    for (auto it = counts.begin(); it != counts.end();) {
        if (it->second == 0) {
            it = counts.erase(it);
        } else {
            ++it;
        }
    }
    return counts;
}

std::vector<std::string> orderedSymbols(const std::map<std::string, int>& counts) {
    std::vector<std::string> symbols;
    symbols.reserve(counts.size());
    for (const auto& [symbol, n] : counts) {
        symbols.push_back(symbol);
    }
    std::stable_sort(symbols.begin(), symbols.end(),
        [](const std::string& a, const std::string& b) {
            int ra = ElementTable::outputRank(a);
            int rb = ElementTable::outputRank(b);
            if (ra != rb) return ra < rb;
            return a < b;
        });
    return symbols;
}

void appendElement(std::string& out, const std::string& symbol, int n) {
    out += symbol;
    if (n > 1) {
        out += std::to_string(n);
    }
}

} // namespace

// ============================================================================
// Formula
// ============================================================================

Formula::Formula(const Counts& counts) {
    for (const auto& [symbol, n] : counts) {
        if (!ElementTable::isKnown(symbol)) {
            throw FormulaError("unknown element '" + symbol + "'");
        }
        if (n < 0) {
            throw FormulaError("negative count for element '" + symbol + "'");
        }
        if (n > 0) {
            counts_[symbol] = n;
        }
    }
}

Formula Formula::parse(const std::string& text) {
    Formula f;
    f.counts_ = parseCounts(text, false);
    return f;
}

int Formula::count(const std::string& symbol) const {
    auto it = counts_.find(symbol);
    return it == counts_.end() ? 0 : it->second;
}

int Formula::atomCount() const {
    int total = 0;
    for (const auto& [symbol, n] : counts_) {
        total += n;
    }
    return total;
}

Formula& Formula::operator+=(const Formula& other) {
    for (const auto& [symbol, n] : other.counts_) {
        counts_[symbol] += n;
    }
    return *this;
}

Formula& Formula::operator-=(const Formula& other) {
    *this = apply(FormulaDelta::removing(other));
    return *this;
}

std::optional<Formula> Formula::tryApply(const FormulaDelta& delta) const {
    Formula result = *this;
    for (const auto& [symbol, n] : delta.counts()) {
        int updated = result.count(symbol) + n;
        if (updated < 0) {
            return std::nullopt;
        }
        if (updated == 0) {
            result.counts_.erase(symbol);
        } else {
            result.counts_[symbol] = updated;
        }
    }
    return result;
}

Formula Formula::apply(const FormulaDelta& delta) const {
    auto result = tryApply(delta);
    if (!result) {
        throw FormulaError("applying " + delta.toString() + " to " + toString() +
                           " gives a negative atom count");
    }
    return *result;
}

std::string Formula::toString() const {
    std::string out;
    for (const auto& symbol : orderedSymbols(counts_)) {
        appendElement(out, symbol, counts_.at(symbol));
    }
    return out;
}

// ============================================================================
// FormulaDelta
// ============================================================================

FormulaDelta::FormulaDelta(const Counts& counts) {
    for (const auto& [symbol, n] : counts) {
        if (!ElementTable::isKnown(symbol)) {
            throw FormulaError("unknown element '" + symbol + "'");
        }
        if (n != 0) {
            counts_[symbol] = n;
        }
    }
}

FormulaDelta FormulaDelta::adding(const Formula& formula) {
    FormulaDelta d;
    d.counts_ = formula.counts();
    return d;
}

FormulaDelta FormulaDelta::removing(const Formula& formula) {
    FormulaDelta d;
    for (const auto& [symbol, n] : formula.counts()) {
        d.counts_[symbol] = -n;
    }
    return d;
}

FormulaDelta FormulaDelta::parse(const std::string& text) {
    FormulaDelta d;
    d.counts_ = parseCounts(text, true);
    return d;
}

int FormulaDelta::count(const std::string& symbol) const {
    auto it = counts_.find(symbol);
    return it == counts_.end() ? 0 : it->second;
}

FormulaDelta& FormulaDelta::operator+=(const FormulaDelta& other) {
    for (const auto& [symbol, n] : other.counts_) {
        int updated = count(symbol) + n;
        if (updated == 0) {
            counts_.erase(symbol);
        } else {
            counts_[symbol] = updated;
        }
    }
    return *this;
}

std::string FormulaDelta::toString() const {
    if (counts_.empty()) {
        return "0";
    }

    std::string gained;
    std::string lost;
    for (const auto& symbol : orderedSymbols(counts_)) {
        int n = counts_.at(symbol);
        if (n > 0) {
            appendElement(gained, symbol, n);
        } else {
            appendElement(lost, symbol, -n);
        }
    }

    std::string out;
    if (!gained.empty()) out += "+" + gained;
    if (!lost.empty()) out += "-" + lost;
    return out;
}

} // namespace gslgen
