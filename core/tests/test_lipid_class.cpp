#include <catch2/catch_test_macros.hpp>
#include "gslgen/errors.hpp"
#include "gslgen/lipid_class.hpp"
#include <algorithm>

using namespace gslgen;

namespace {

bool hasRule(const LipidClassDef& def, const std::string& name, PolaritySet polarity) {
    return std::any_of(def.rules.begin(), def.rules.end(), [&](const FragmentRule& r) {
        return r.name == name && r.polarity == polarity;
    });
}

const FragmentRule* findRule(const LipidClassDef& def, const std::string& name,
                             PolaritySet polarity) {
    for (const auto& rule : def.rules) {
        if (rule.name == name && rule.polarity == polarity) {
            return &rule;
        }
    }
    return nullptr;
}

} // namespace

TEST_CASE("Standard class catalog", "[lipid_class]") {
    const ClassRegistry& registry = ClassRegistry::standard();

    SECTION("All classes are registered") {
        const std::vector<std::string> expected = {
            "Cer", "doxCer", "SM", "Hex", "Lac", "SM4", "SHex2", "LC3", "LC4", "Gb3",
            "Gb4", "GA1", "GA2", "GM4", "GM3", "GM2", "GM1", "GD3", "GD2", "GD1a",
            "GD1b", "GT3", "GT2", "GT1a", "GT1b", "GT1c", "GQ1", "GP1", "nLc6",
            "nLc8", "nLc10"};
        REQUIRE(registry.size() == expected.size());
        for (const auto& name : expected) {
            REQUIRE(registry.contains(name));
        }
    }

    SECTION("Names are sorted") {
        auto names = registry.names();
        REQUIRE(std::is_sorted(names.begin(), names.end()));
    }

    SECTION("Unknown class throws") {
        REQUIRE_FALSE(registry.contains("GZ9"));
        REQUIRE_THROWS_AS(registry.get("GZ9"), ConfigurationError);
    }

    SECTION("Families") {
        REQUIRE(registry.get("Cer").family == ClassFamily::CERAMIDE);
        REQUIRE(registry.get("doxCer").family == ClassFamily::CERAMIDE);
        REQUIRE(registry.get("SM").family == ClassFamily::SPHINGOMYELIN);
        REQUIRE(registry.get("GD1a").family == ClassFamily::GLYCOSPHINGOLIPID);
        REQUIRE(toString(ClassFamily::SPHINGOMYELIN) == "sphingomyelin");
    }

    SECTION("Headgroups") {
        REQUIRE(registry.get("Cer").headgroup.empty());
        REQUIRE(registry.get("Hex").headgroup == Formula::parse("C6H10O5"));
        REQUIRE(registry.get("GD1a").headgroup == Formula::parse("C48H77N3O36"));
        REQUIRE(registry.get("SM").headgroup == Formula::parse("C5H12NO3P"));
    }

    SECTION("Every class starts with the intact precursor") {
        for (const auto& name : registry.names()) {
            const auto& def = registry.get(name);
            REQUIRE_FALSE(def.rules.empty());
            REQUIRE(def.rules.front().name == "precursor");
            REQUIRE(def.rules.front().scope == RuleScope::INTACT_PRECURSOR);
            REQUIRE(def.rules.front().polarity == PolaritySet::BOTH);
        }
    }

    SECTION("Sialic-acid losses only on sialylated classes") {
        for (const auto& name : registry.names()) {
            const auto& def = registry.get(name);
            const bool loses_neu5ac = hasRule(def, "HG(-Neu5Ac,309)", PolaritySet::POSITIVE);
            REQUIRE(loses_neu5ac == (def.sialic_acids > 0));
        }
    }
}

TEST_CASE("Charge plausibility", "[lipid_class]") {
    const ClassRegistry& registry = ClassRegistry::standard();

    SECTION("GD1a carries two sialic acids") {
        const auto& gd1a = registry.get("GD1a");
        REQUIRE(gd1a.sialic_acids == 2);
        REQUIRE(gd1a.negativeChargeLimit() == 3);
        REQUIRE(gd1a.acceptsCharge(2, Polarity::NEGATIVE));
        REQUIRE(gd1a.acceptsCharge(3, Polarity::NEGATIVE));
        REQUIRE_FALSE(gd1a.acceptsCharge(4, Polarity::NEGATIVE));
        REQUIRE(gd1a.recommended_charges == (std::vector<ChargeState>{2, 3}));
    }

    SECTION("Ceramides are singly charged") {
        const auto& cer = registry.get("Cer");
        REQUIRE(cer.acceptsCharge(1, Polarity::POSITIVE));
        REQUIRE_FALSE(cer.acceptsCharge(2, Polarity::POSITIVE));
    }

    SECTION("Sulfatide counts its sulfate") {
        REQUIRE(registry.get("SM4").negativeChargeLimit() == 2);
    }

    SECTION("GP1 reaches charge 5") {
        const auto& gp1 = registry.get("GP1");
        REQUIRE(gp1.acceptsCharge(5, Polarity::NEGATIVE));
        REQUIRE(gp1.negativeChargeLimit() == 6);
    }

    SECTION("Neolacto classes have a configured bound") {
        const auto& nlc8 = registry.get("nLc8");
        REQUIRE(nlc8.sialic_acids == 0);
        REQUIRE(nlc8.negativeChargeLimit() == 2);
        REQUIRE(nlc8.acceptsCharge(2, Polarity::NEGATIVE));
    }

    SECTION("Neutral classes stop at charge 1 in negative mode") {
        const auto& gb3 = registry.get("Gb3");
        REQUIRE(gb3.acceptsCharge(2, Polarity::POSITIVE));
        REQUIRE_FALSE(gb3.acceptsCharge(2, Polarity::NEGATIVE));
    }
}

TEST_CASE("Class-specific rule data", "[lipid_class]") {
    const ClassRegistry& registry = ClassRegistry::standard();

    SECTION("Deoxy ceramide") {
        const auto& dox = registry.get("doxCer");
        REQUIRE(dox.base_hydroxyls == 1);
        REQUIRE(dox.default_label_token == "M3D");
        REQUIRE(dox.default_bases == (std::vector<std::string>{"18:0;1", "18:1;1"}));
        REQUIRE(hasRule(dox, "doxLCB {lcb}", PolaritySet::POSITIVE));
        REQUIRE_FALSE(hasRule(dox, "LCB {lcb}(-HO)", PolaritySet::POSITIVE));
    }

    SECTION("Negative headgroup losses keep one water") {
        const auto* rule = findRule(registry.get("GM3"), "HG(-Neu5Ac,309)", PolaritySet::NEGATIVE);
        REQUIRE(rule != nullptr);
        REQUIRE(rule->delta == FormulaDelta::parse("-C11H17NO8"));
        REQUIRE(rule->base == RuleBase::PRECURSOR);
    }

    SECTION("Positive headgroup losses remove the residue") {
        const auto* rule = findRule(registry.get("GM3"), "HG(-Neu5Ac,309)", PolaritySet::POSITIVE);
        REQUIRE(rule != nullptr);
        REQUIRE(rule->delta == FormulaDelta::parse("-C11H19NO9"));
    }

    SECTION("Doubly charged sialic-acid loss of GT1b") {
        const auto* negative = findRule(registry.get("GT1b"), "HG(-Neu5Ac,309)",
                                        PolaritySet::NEGATIVE);
        const auto* positive = findRule(registry.get("GT1b"), "HG(-Neu5Ac,309)",
                                        PolaritySet::POSITIVE);
        REQUIRE(negative->max_charge == 2);
        REQUIRE(positive->max_charge == 1);
    }

    SECTION("Fixed headgroup ions have no base") {
        const auto* rule = findRule(registry.get("SM"), "Phosphocholine", PolaritySet::POSITIVE);
        REQUIRE(rule != nullptr);
        REQUIRE(rule->base == RuleBase::NONE);
        REQUIRE(rule->delta == FormulaDelta::parse("C5H14NO4P"));
    }

    SECTION("Neutral glycolipids have backbone fragments but no negative headgroup rules") {
        const auto& lac = registry.get("Lac");
        REQUIRE(hasRule(lac, "FA {fa}+(HN)", PolaritySet::NEGATIVE));
        REQUIRE(hasRule(lac, "HG(-Hex2,342)", PolaritySet::POSITIVE));
        REQUIRE_FALSE(hasRule(lac, "HG(-Hex2,342)", PolaritySet::NEGATIVE));
    }

    SECTION("Ceramides have no negative backbone fragments") {
        REQUIRE_FALSE(hasRule(registry.get("Cer"), "LCB(-CH3O)", PolaritySet::NEGATIVE));
        REQUIRE(hasRule(registry.get("SM"), "LCB(-CH3O)", PolaritySet::NEGATIVE));
    }
}

TEST_CASE("Custom registries", "[lipid_class]") {
    ClassRegistry registry;

    LipidClassDef def;
    def.name = "Test";
    def.headgroup = Formula::parse("C6H10O5");
    registry.add(def);

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.get("Test").headgroup == Formula::parse("C6H10O5"));

    SECTION("Duplicate names throw") {
        REQUIRE_THROWS_AS(registry.add(def), ConfigurationError);
    }

    SECTION("Empty names throw") {
        REQUIRE_THROWS_AS(registry.add(LipidClassDef{}), ConfigurationError);
    }
}
