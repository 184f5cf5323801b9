#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <limits>

namespace gslgen {

/// Mass-to-charge ratio type
using MZ = double;

/// Exact (monoisotopic) mass in Daltons
using Mass = double;

/// Charge magnitude (always positive; the sign lives in Polarity)
using ChargeState = int;

/// Highest charge magnitude the generator accepts
constexpr ChargeState MAX_CHARGE = 5;

/// Polarity of the ion mode
enum class Polarity : std::int8_t {
    UNKNOWN = 0,
    POSITIVE = 1,
    NEGATIVE = -1
};

/// Polarities a fragment rule may be registered for
enum class PolaritySet : std::uint8_t {
    POSITIVE,
    NEGATIVE,
    BOTH
};

/// Check whether a polarity is a member of a polarity set
inline bool contains(PolaritySet set, Polarity p) {
    switch (set) {
        case PolaritySet::POSITIVE: return p == Polarity::POSITIVE;
        case PolaritySet::NEGATIVE: return p == Polarity::NEGATIVE;
        case PolaritySet::BOTH: return p != Polarity::UNKNOWN;
    }
    return false;
}

/// Fatty-acid chain parity filter
enum class Parity : std::uint8_t {
    BOTH = 0,
    EVEN,
    ODD
};

/// Range template for min/max values
template<typename T>
struct Range {
    T min_value = std::numeric_limits<T>::max();
    T max_value = std::numeric_limits<T>::lowest();

    Range() = default;
    Range(T min_val, T max_val) : min_value(min_val), max_value(max_val) {}

    bool isEmpty() const { return min_value > max_value; }

    bool contains(T value) const {
        return value >= min_value && value <= max_value;
    }
};

using CarbonRange = Range<int>;
using ChargeRange = Range<ChargeState>;

/// Convert polarity to string
inline std::string toString(Polarity p) {
    switch (p) {
        case Polarity::POSITIVE: return "positive";
        case Polarity::NEGATIVE: return "negative";
        default: return "unknown";
    }
}

/// Convert parity filter to string
inline std::string toString(Parity p) {
    switch (p) {
        case Parity::EVEN: return "even";
        case Parity::ODD: return "odd";
        default: return "both";
    }
}

/// Sign character used in ion notation ("+" or "-")
inline char signChar(Polarity p) {
    return p == Polarity::NEGATIVE ? '-' : '+';
}

} // namespace gslgen
