#include "gslgen/isotope_label.hpp"
#include "gslgen/errors.hpp"
#include <algorithm>
#include <cctype>

namespace gslgen {

namespace {

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const char* blanks = " \t\r\n";
    auto first = text.find_first_not_of(blanks);
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(blanks);
    return text.substr(first, last - first + 1);
}

// "m2dn15" -> "M2DN15", "2D" -> "M2D"
std::string normalizeToken(const std::string& token) {
    std::string upper = toUpper(trim(token));
    if (upper.empty() || upper.front() != 'M') {
        upper.insert(upper.begin(), 'M');
    }
    return upper;
}

/// Largest number of atoms one isotope code may substitute
constexpr int MAX_LABEL_COUNT = 1000;

struct IsotopeCode {
    const char* code;
    const char* isotope;
};

constexpr IsotopeCode ISOTOPE_CODES[] = {
    {"N15", "15N"},
    {"C13", "13C"},
    {"O18", "18O"},
    {"D", "2H"},
};

} // namespace

IsotopeSubstitution parseIsotopeLabel(const std::string& token) {
    IsotopeSubstitution result;
    std::string text = toUpper(trim(token));
    if (!text.empty() && text.front() == 'M') {
        text.erase(0, 1);
    }

    std::size_t i = 0;
    while (i < text.size()) {
        int count = 0;
        bool has_count = false;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            count = count * 10 + (text[i] - '0');
            if (count > MAX_LABEL_COUNT) {
                throw ConfigurationError("isotope count in label '" + token + "' exceeds " +
                                         std::to_string(MAX_LABEL_COUNT));
            }
            has_count = true;
            ++i;
        }
        if (i >= text.size()) {
            throw ConfigurationError("isotope label '" + token +
                                     "' ends with a count but no isotope");
        }
        if (!has_count) {
            count = 1;
        }

        bool matched = false;
        for (const auto& code : ISOTOPE_CODES) {
            std::string c = code.code;
            if (text.compare(i, c.size(), c) == 0) {
                result[code.isotope] += count;
                i += c.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            throw ConfigurationError("unrecognized isotope '" + text.substr(i, 3) +
                                     "' in label '" + token +
                                     "'; valid labels are D, N15, C13, O18");
        }
    }
    return result;
}

std::vector<std::string> splitKeywords(const std::string& text) {
    std::vector<std::string> keywords;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        std::string keyword = trim(text.substr(start, comma - start));
        if (!keyword.empty()) {
            keywords.push_back(std::move(keyword));
        }
        start = comma + 1;
    }
    return keywords;
}

IsotopeLabelSpec makeLabelSpec(const std::string& token, const std::string& keywords) {
    IsotopeLabelSpec spec;
    spec.substitution = parseIsotopeLabel(token);
    spec.token = normalizeToken(token);
    spec.keywords = splitKeywords(keywords);
    return spec;
}

// ============================================================================
// IsotopeLabeler
// ============================================================================

IsotopeLabeler::IsotopeLabeler(IsotopeLabelSpec spec) : spec_(std::move(spec)) {
    spec_.token = normalizeToken(spec_.token);
    for (const auto& keyword : spec_.keywords) {
        lowered_keywords_.push_back(toLower(keyword));
    }
}

bool IsotopeLabeler::isEligible(const std::string& product_name) const {
    const std::string name = toLower(product_name);
    return std::any_of(lowered_keywords_.begin(), lowered_keywords_.end(),
                       [&](const std::string& k) {
                           return !k.empty() && name.find(k) != std::string::npos;
                       });
}

std::string IsotopeLabeler::heavyAdductName(const std::string& ion_name) const {
    auto pos = ion_name.find("[M");
    if (pos == std::string::npos) {
        return ion_name;
    }
    return ion_name.substr(0, pos) + "[" + spec_.token + ion_name.substr(pos + 2);
}

Mass IsotopeLabeler::heavyMass(const Formula& formula) const {
    return MassCalculator::labeledMass(formula, spec_.substitution);
}

Mass IsotopeLabeler::massShift() const {
    return MassCalculator::substitutionShift(spec_.substitution);
}

} // namespace gslgen
