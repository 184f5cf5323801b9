#include "gslgen/adduct.hpp"
#include "gslgen/elements.hpp"
#include "gslgen/errors.hpp"
#include "gslgen/mass_calculator.hpp"
#include <algorithm>

namespace gslgen {

namespace {

AdductDef makeAdduct(const std::string& name, Polarity polarity,
                     const std::string& carrier_formula = "",
                     const std::string& carrier_label = "",
                     int carrier_count = 0) {
    AdductDef a;
    a.name = name;
    a.polarity = polarity;
    if (!carrier_formula.empty()) {
        a.carrier = Formula::parse(carrier_formula);
    }
    a.carrier_label = carrier_label;
    a.carrier_count = carrier_count;
    return a;
}

std::string withCount(int n, const std::string& label) {
    return n == 1 ? label : std::to_string(n) + label;
}

// "M+H" -> "[M+H]+"; names already in bracket form are returned unchanged
std::string canonicalName(const std::string& name) {
    if (name.empty() || name.front() == '[') {
        return name;
    }
    for (const auto& adduct : AdductCatalog::all()) {
        const std::string& full = adduct.name;
        auto close = full.find(']');
        if (close != std::string::npos && full.substr(1, close - 1) == name) {
            return full;
        }
    }
    return name;
}

void requireCharge(const AdductDef& adduct, ChargeState z) {
    if (!adduct.supportsCharge(z)) {
        throw ConfigurationError("adduct " + adduct.name + " cannot form charge " +
                                 std::to_string(z));
    }
}

} // namespace

// ============================================================================
// AdductDef
// ============================================================================

Mass AdductDef::carrierIonMass() const {
    if (carrier.empty()) {
        return PROTON_MASS;
    }
    Mass sign = polarity == Polarity::NEGATIVE ? -1.0 : 1.0;
    return MassCalculator::monoisotopicMass(carrier) - sign * ELECTRON_MASS;
}

Mass AdductDef::massDelta(ChargeState z) const {
    requireCharge(*this, z);
    int protons = z - carrier_count;
    Mass sign = polarity == Polarity::NEGATIVE ? -1.0 : 1.0;
    Mass delta = sign * protons * PROTON_MASS;
    if (carrier_count > 0) {
        delta += carrier_count * carrierIonMass();
    }
    return delta;
}

MZ AdductDef::mz(Mass neutral_mass, ChargeState z) const {
    return (neutral_mass + massDelta(z)) / z;
}

std::string AdductDef::ionName(ChargeState z) const {
    requireCharge(*this, z);
    int protons = z - carrier_count;

    std::string out = "[M";
    if (protons > 0) {
        out += polarity == Polarity::NEGATIVE ? "-" : "+";
        out += withCount(protons, "H");
    }
    if (carrier_count > 0) {
        out += "+" + withCount(carrier_count, carrier_label);
    }
    out += "]" + std::to_string(z) + signChar(polarity);
    return out;
}

// ============================================================================
// AdductCatalog
// ============================================================================

const std::vector<AdductDef>& AdductCatalog::all() {
    static const std::vector<AdductDef> catalog = {
        makeAdduct("[M+H]+", Polarity::POSITIVE),
        makeAdduct("[M-H]-", Polarity::NEGATIVE),
        makeAdduct("[M+Na]+", Polarity::POSITIVE, "Na", "Na", 1),
        makeAdduct("[M+2Na]+", Polarity::POSITIVE, "Na", "Na", 2),
        makeAdduct("[M+3Na]+", Polarity::POSITIVE, "Na", "Na", 3),
        makeAdduct("[M+NH4]+", Polarity::POSITIVE, "NH4", "NH4", 1),
        makeAdduct("[M+CH3COO]-", Polarity::NEGATIVE, "C2H3O2", "CH3COO", 1),
        makeAdduct("[M+HCOO]-", Polarity::NEGATIVE, "CHO2", "HCOO", 1),
    };
    return catalog;
}

bool AdductCatalog::contains(const std::string& name) {
    const std::string key = canonicalName(name);
    const auto& catalog = all();
    return std::any_of(catalog.begin(), catalog.end(),
                       [&](const AdductDef& a) { return a.name == key; });
}

const AdductDef& AdductCatalog::get(const std::string& name) {
    const std::string key = canonicalName(name);
    for (const auto& adduct : all()) {
        if (adduct.name == key) {
            return adduct;
        }
    }
    throw ConfigurationError("unknown adduct '" + name + "'");
}

std::vector<AdductDef> AdductCatalog::resolve(const std::vector<std::string>& names) {
    std::vector<AdductDef> result;
    for (const auto& name : names) {
        const AdductDef& adduct = get(name);
        bool seen = std::any_of(result.begin(), result.end(),
                                [&](const AdductDef& a) { return a.name == adduct.name; });
        if (!seen) {
            result.push_back(adduct);
        }
    }
    return result;
}

} // namespace gslgen
