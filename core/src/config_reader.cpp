#include "gslgen/io/config_reader.hpp"
#include "gslgen/log.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace gslgen {
namespace io {

namespace {

// Split on commas and whitespace
std::vector<std::string> tokenize(const std::string& text) {
    std::string spaced = text;
    std::replace(spaced.begin(), spaced.end(), ',', ' ');
    std::istringstream stream(spaced);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

int parseInt(const std::string& text, const std::string& what) {
    std::size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::exception&) {
        throw ConfigParseError("invalid integer '" + text + "' for " + what);
    }
    if (pos != text.size()) {
        throw ConfigParseError("invalid integer '" + text + "' for " + what);
    }
    return value;
}

std::vector<int> parseIntList(const std::string& text, const std::string& what) {
    std::vector<int> values;
    for (const auto& token : tokenize(text)) {
        values.push_back(parseInt(token, what));
    }
    return values;
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Parity parseParity(const std::string& text) {
    const std::string value = lower(text);
    if (value == "even") return Parity::EVEN;
    if (value == "odd") return Parity::ODD;
    if (value == "both" || value.empty()) return Parity::BOTH;
    throw ConfigParseError("invalid parity '" + text + "' (expected even, odd or both)");
}

bool hasAttribute(const pugi::xml_node& node, const char* name) {
    return !node.attribute(name).empty();
}

int intAttribute(const pugi::xml_node& node, const char* name) {
    return parseInt(node.attribute(name).value(),
                    std::string(node.name()) + "@" + name);
}

} // namespace

class ConfigReader::Impl {
public:
    explicit Impl(const ClassRegistry& registry) : registry_(&registry) {}

    std::vector<RunConfig> readFile(const std::string& filename) {
        pugi::xml_document doc;
        pugi::xml_parse_result result = doc.load_file(filename.c_str());
        if (!result) {
            throw ConfigParseError("failed to load " + filename + ": " +
                                   result.description());
        }
        return parseDocument(doc);
    }

    std::vector<RunConfig> readString(const std::string& content) {
        pugi::xml_document doc;
        pugi::xml_parse_result result = doc.load_string(content.c_str());
        if (!result) {
            throw ConfigParseError(std::string("XML error: ") + result.description() +
                                   " at offset " + std::to_string(result.offset));
        }
        return parseDocument(doc);
    }

private:
    std::vector<RunConfig> parseDocument(const pugi::xml_document& doc) {
        pugi::xml_node root = doc.child("gslgen");
        if (!root) {
            throw ConfigParseError("missing <gslgen> root element");
        }

        std::vector<RunConfig> runs;
        for (pugi::xml_node run : root.children("run")) {
            runs.push_back(parseRun(run));
        }
        if (runs.empty()) {
            throw ConfigParseError("no <run> element found");
        }
        log::debug("Read {} run configuration(s)", runs.size());
        return runs;
    }

    RunConfig parseRun(const pugi::xml_node& run) {
        std::string class_name = run.attribute("class").value();
        if (class_name.empty()) {
            throw ConfigParseError("<run> without a class attribute");
        }

        const LipidClassDef& def = registry_->get(class_name);
        RunConfig config = defaultRunConfig(class_name, *registry_);

        if (pugi::xml_node lcb = run.child("lcb")) {
            parseLcb(lcb, def, config.lcb);
        }
        if (pugi::xml_node fa = run.child("fa")) {
            parseFa(fa, config.fa);
        }
        if (pugi::xml_node charges = run.child("charges")) {
            const std::vector<std::string> tokens = tokenize(charges.child_value());
            if (tokens.size() == 1 && lower(tokens.front()) == "auto") {
                config.charges = def.recommended_charges;
            } else {
                config.charges.clear();
                for (const auto& token : tokens) {
                    config.charges.push_back(parseInt(token, "charges"));
                }
            }
        }
        if (pugi::xml_node adducts = run.child("adducts")) {
            config.precursor_adducts = tokenize(adducts.child_value());
            config.product_adducts = config.precursor_adducts;
        }
        if (pugi::xml_node adducts = run.child("precursor_adducts")) {
            config.precursor_adducts = tokenize(adducts.child_value());
        }
        if (pugi::xml_node adducts = run.child("product_adducts")) {
            config.product_adducts = tokenize(adducts.child_value());
        }
        if (pugi::xml_node labels = run.child("labels")) {
            if (labels.attribute("enabled").as_bool(true)) {
                std::string token = hasAttribute(labels, "token")
                                        ? labels.attribute("token").value()
                                        : def.default_label_token;
                std::string keywords = hasAttribute(labels, "keywords")
                                           ? labels.attribute("keywords").value()
                                           : DEFAULT_LABEL_KEYWORDS;
                config.labels = makeLabelSpec(token, keywords);
            }
        }
        if (pugi::xml_node options = run.child("options")) {
            if (hasAttribute(options, "max_rows")) {
                int max_rows = intAttribute(options, "max_rows");
                if (max_rows < 0) {
                    throw ConfigParseError("options@max_rows must not be negative");
                }
                config.options.max_rows = static_cast<std::size_t>(max_rows);
            }
            if (hasAttribute(options, "progress_interval")) {
                int interval = intAttribute(options, "progress_interval");
                if (interval < 0) {
                    throw ConfigParseError("options@progress_interval must not be negative");
                }
                config.options.progress_interval = static_cast<std::size_t>(interval);
            }
        }
        return config;
    }

    void parseLcb(const pugi::xml_node& node, const LipidClassDef& def, LcbSpec& lcb) {
        lcb.base_hydroxyls = hasAttribute(node, "base_hydroxyls")
                                 ? intAttribute(node, "base_hydroxyls")
                                 : def.base_hydroxyls;

        if (hasAttribute(node, "bases")) {
            lcb.explicit_bases.clear();
            for (const auto& text : tokenize(node.attribute("bases").value())) {
                lcb.explicit_bases.push_back(
                    BuildingBlock::parse(text, BlockKind::LONG_CHAIN_BASE, lcb.base_hydroxyls));
            }
            return;
        }

        // Any range attribute switches from the class' default bases to ranges
        if (hasAttribute(node, "min") || hasAttribute(node, "max") ||
            hasAttribute(node, "unsaturation") || hasAttribute(node, "hydroxylation")) {
            lcb.explicit_bases.clear();
        }
        if (hasAttribute(node, "min")) {
            lcb.carbons.min_value = intAttribute(node, "min");
        }
        if (hasAttribute(node, "max")) {
            lcb.carbons.max_value = intAttribute(node, "max");
        }
        if (hasAttribute(node, "unsaturation")) {
            lcb.unsaturations = parseIntList(node.attribute("unsaturation").value(),
                                             "lcb@unsaturation");
        }
        if (hasAttribute(node, "hydroxylation")) {
            lcb.hydroxylations = parseIntList(node.attribute("hydroxylation").value(),
                                              "lcb@hydroxylation");
        }
    }

    void parseFa(const pugi::xml_node& node, FaSpec& fa) {
        if (hasAttribute(node, "chains")) {
            fa.explicit_chains.clear();
            for (const auto& text : tokenize(node.attribute("chains").value())) {
                fa.explicit_chains.push_back(BuildingBlock::parse(text, BlockKind::FATTY_ACID));
            }
            return;
        }
        if (hasAttribute(node, "min")) {
            fa.carbons.min_value = intAttribute(node, "min");
        }
        if (hasAttribute(node, "max")) {
            fa.carbons.max_value = intAttribute(node, "max");
        }
        if (hasAttribute(node, "max_unsaturation")) {
            fa.max_unsaturation = intAttribute(node, "max_unsaturation");
        }
        if (hasAttribute(node, "parity")) {
            fa.parity = parseParity(node.attribute("parity").value());
        }
    }

    const ClassRegistry* registry_;
};

// ============================================================================
// ConfigReader
// ============================================================================

ConfigReader::ConfigReader(const ClassRegistry& registry)
    : impl_(std::make_unique<Impl>(registry)) {}

ConfigReader::~ConfigReader() = default;

ConfigReader::ConfigReader(ConfigReader&&) noexcept = default;
ConfigReader& ConfigReader::operator=(ConfigReader&&) noexcept = default;

RunConfig ConfigReader::read(const std::string& filename) {
    return impl_->readFile(filename).front();
}

std::vector<RunConfig> ConfigReader::readAll(const std::string& filename) {
    return impl_->readFile(filename);
}

RunConfig ConfigReader::parseString(const std::string& content) {
    return impl_->readString(content).front();
}

std::vector<RunConfig> ConfigReader::parseStringAll(const std::string& content) {
    return impl_->readString(content);
}

} // namespace io
} // namespace gslgen
