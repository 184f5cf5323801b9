#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "gslgen/engine.hpp"
#include "gslgen/elements.hpp"
#include "gslgen/errors.hpp"
#include <algorithm>
#include <cstdlib>
#include <iterator>

using namespace gslgen;
using Catch::Approx;

namespace {

// One species, Cer 18:1;2/16:0, protonated only
RunConfig singleCeramide() {
    RunConfig config = defaultRunConfig("Cer");
    config.lcb.explicit_bases = {BuildingBlock::parse("18:1;2", BlockKind::LONG_CHAIN_BASE)};
    config.fa.explicit_chains = {BuildingBlock::parse("16:0", BlockKind::FATTY_ACID)};
    config.precursor_adducts = {"[M+H]+"};
    config.product_adducts = {"[M+H]+"};
    return config;
}

RunConfig singleGanglioside(const std::string& lipid_class, std::vector<ChargeState> charges) {
    RunConfig config = defaultRunConfig(lipid_class);
    config.lcb.explicit_bases = {BuildingBlock::parse("18:1;2", BlockKind::LONG_CHAIN_BASE)};
    config.fa.explicit_chains = {BuildingBlock::parse("18:0", BlockKind::FATTY_ACID)};
    config.charges = std::move(charges);
    config.precursor_adducts = {"[M-H]-"};
    config.product_adducts = {"[M-H]-"};
    return config;
}

std::vector<TransitionRecord> drain(TransitionStream& stream) {
    std::vector<TransitionRecord> records;
    while (auto record = stream.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

} // namespace

TEST_CASE("Single ceramide species", "[engine]") {
    GenerationResult result = generateTransitions(singleCeramide());
    const auto& rows = result.records;

    REQUIRE(result.status == GenerationStatus::COMPLETED);
    REQUIRE(result.stats.species == 1);
    REQUIRE(result.stats.rows == 5);
    REQUIRE(rows.size() == 5);

    SECTION("Intact precursor row") {
        const auto& row = rows[0];
        REQUIRE(row.molecule_list_name == "Cer");
        REQUIRE(row.molecule == "Cer 18:1;2/16:0");
        REQUIRE(row.molecule_formula == "C34H67NO3");
        REQUIRE(row.precursor_adduct == "[M+H]1+");
        REQUIRE(row.precursor_mz == Approx(538.519371497922).margin(1e-9));
        REQUIRE(row.precursor_charge == 1);
        REQUIRE(row.product_name == "precursor");
        REQUIRE(row.product_formula == "C34H67NO3");
        REQUIRE(row.product_mz == Approx(row.precursor_mz).margin(1e-12));
        REQUIRE(row.product_charge == 1);
        REQUIRE(row.label == LabelStatus::NONE);
    }

    SECTION("Fragments follow rule order") {
        REQUIRE(rows[1].product_name == "precursor-(H2O,18)");
        REQUIRE(rows[1].product_formula == "C34H65NO2");
        REQUIRE(rows[1].product_mz == Approx(520.5088068111619).margin(1e-9));

        REQUIRE(rows[2].product_name == "LCB 18:1;2(-HO)");
        REQUIRE(rows[2].product_mz == Approx(282.279141221962).margin(1e-9));
        REQUIRE(rows[3].product_name == "LCB 18:1;2(-H3O2)");
        REQUIRE(rows[3].product_mz == Approx(264.26857653520204).margin(1e-9));
        REQUIRE(rows[4].product_name == "LCB 18:1;2(-CH3O2)");
        REQUIRE(rows[4].product_mz == Approx(252.268576535202).margin(1e-9));
    }

    SECTION("Every row shares the precursor") {
        for (const auto& row : rows) {
            REQUIRE(row.precursor_adduct == "[M+H]1+");
            REQUIRE(row.precursor_mz == Approx(538.519371497922).margin(1e-9));
        }
    }
}

TEST_CASE("Polarity of products follows the precursor", "[engine]") {
    RunConfig config = singleCeramide();
    config.precursor_adducts = {"[M+H]+", "[M-H]-"};
    config.product_adducts = {"[M+H]+", "[M-H]-"};

    GenerationResult result = generateTransitions(config);
    const auto& rows = result.records;

    // Ceramides only form the intact precursor in negative mode
    REQUIRE(rows.size() == 6);
    REQUIRE(rows[0].precursor_charge == 1);
    REQUIRE(rows[1].precursor_adduct == "[M-H]1-");
    REQUIRE(rows[1].product_name == "precursor");
    REQUIRE(rows[1].product_charge == -1);
    for (const auto& row : rows) {
        REQUIRE((row.precursor_charge > 0) == (row.product_charge > 0));
    }
}

TEST_CASE("Multiply charged gangliosides", "[engine]") {
    SECTION("GD1a at charges 2 and 3") {
        GenerationResult result = generateTransitions(singleGanglioside("GD1a", {2, 3}));
        const auto& rows = result.records;

        REQUIRE(rows.size() >= 2);
        REQUIRE(rows[0].molecule_formula == "C84H148N4O39");
        REQUIRE(rows[0].product_name == "precursor");
        REQUIRE(rows[0].precursor_adduct == "[M-2H]2-");
        REQUIRE(rows[0].precursor_charge == -2);
        REQUIRE(rows[0].precursor_mz == Approx(917.478759062658).margin(1e-8));
        REQUIRE(rows[0].product_charge == -2);

        REQUIRE(rows[1].product_name == "precursor");
        REQUIRE(rows[1].precursor_adduct == "[M-3H]3-");
        REQUIRE(rows[1].precursor_mz == Approx(611.3167472195013).margin(1e-8));

        for (const auto& row : rows) {
            REQUIRE(row.precursor_charge < 0);
            REQUIRE(row.product_charge < 0);
            REQUIRE(std::abs(row.product_charge) <= std::abs(row.precursor_charge));
        }
    }

    SECTION("Charges beyond the ionizable sites produce nothing") {
        RunConfig config = singleGanglioside("GD1a", {4});
        REQUIRE_NOTHROW(validateConfig(config));

        GenerationResult result = generateTransitions(config);
        REQUIRE(result.records.empty());
        REQUIRE(result.status == GenerationStatus::COMPLETED);
    }

    SECTION("Doubly charged sialic-acid loss") {
        GenerationResult result = generateTransitions(singleGanglioside("GT1b", {3}));
        bool singly = false;
        bool doubly = false;
        for (const auto& row : result.records) {
            REQUIRE(row.product_name.find("[Z=3]") == std::string::npos);
            if (row.product_name == "HG(-Neu5Ac,309)") {
                singly = true;
                REQUIRE(row.product_charge == -1);
            }
            if (row.product_name == "HG(-Neu5Ac,309) [Z=2]") {
                doubly = true;
                REQUIRE(row.product_charge == -2);
            }
        }
        REQUIRE(singly);
        REQUIRE(doubly);
    }

    SECTION("Singly charged precursors give singly charged products") {
        GenerationResult result = generateTransitions(singleGanglioside("GT1b", {1}));
        for (const auto& row : result.records) {
            REQUIRE(row.product_charge == -1);
        }
    }
}

TEST_CASE("Adduct and charge cross-product", "[engine]") {
    RunConfig config = defaultRunConfig("GM1");
    config.lcb.explicit_bases = {BuildingBlock::parse("18:1;2", BlockKind::LONG_CHAIN_BASE)};
    config.fa.explicit_chains = {BuildingBlock::parse("18:0", BlockKind::FATTY_ACID)};
    config.charges = {1, 2};
    config.precursor_adducts = {"[M+H]+", "[M+Na]+"};
    config.product_adducts = {"[M+H]+", "[M+Na]+"};

    GenerationResult result = generateTransitions(config);
    const auto& rows = result.records;

    REQUIRE(result.stats.species == 1);
    REQUIRE(rows.size() == 160);

    auto count = [&rows](const std::string& product_name) {
        return std::count_if(rows.begin(), rows.end(), [&](const TransitionRecord& row) {
            return row.product_name == product_name;
        });
    };

    SECTION("Intact rules follow the precursor ion only") {
        REQUIRE(count("precursor") == 4);
        REQUIRE(count("precursor-(H2O,18)") == 4);
    }

    SECTION("Singly charged fragments pair every precursor ion with every product adduct") {
        REQUIRE(count("HG(-Neu5Ac,309)") == 8);
        REQUIRE(count("LCB 18:1;2(-HO)") == 8);
    }

    SECTION("Precursor charge first, then adduct declaration order") {
        REQUIRE(rows[0].precursor_adduct == "[M+H]1+");
        REQUIRE(rows[1].precursor_adduct == "[M+Na]1+");
        REQUIRE(rows[2].precursor_adduct == "[M+2H]2+");
        REQUIRE(rows[3].precursor_adduct == "[M+H+Na]2+");
        for (int i = 0; i < 4; ++i) {
            REQUIRE(rows[i].product_name == "precursor");
            REQUIRE(rows[i].product_mz == Approx(rows[i].precursor_mz).margin(1e-12));
        }
    }

    SECTION("Product adducts in declaration order within each precursor ion") {
        auto first = std::find_if(rows.begin(), rows.end(), [](const TransitionRecord& row) {
            return row.product_name == "LCB 18:1;2(-HO)";
        });
        REQUIRE(std::distance(first, rows.end()) >= 8);

        const std::vector<std::string> precursors = {
            "[M+H]1+", "[M+H]1+", "[M+Na]1+", "[M+Na]1+",
            "[M+2H]2+", "[M+2H]2+", "[M+H+Na]2+", "[M+H+Na]2+"};
        const Mass na_minus_h = ElementTable::mass("Na") - ELECTRON_MASS - PROTON_MASS;

        for (std::size_t i = 0; i < precursors.size(); ++i) {
            const auto& row = first[static_cast<std::ptrdiff_t>(i)];
            REQUIRE(row.product_name == "LCB 18:1;2(-HO)");
            REQUIRE(row.precursor_adduct == precursors[i]);
            REQUIRE(row.product_charge == 1);
        }
        for (std::size_t i = 0; i < precursors.size(); i += 2) {
            const auto& protonated = first[static_cast<std::ptrdiff_t>(i)];
            const auto& sodiated = first[static_cast<std::ptrdiff_t>(i + 1)];
            REQUIRE(protonated.product_mz == Approx(282.279141221962).margin(1e-9));
            REQUIRE(sodiated.product_mz - protonated.product_mz ==
                    Approx(na_minus_h).margin(1e-9));
        }
    }
}

TEST_CASE("Heavy rows of doubly charged products", "[engine]") {
    RunConfig config = singleGanglioside("GT1b", {2});
    config.labels = makeLabelSpec("M2DN15", "Neu5Ac");

    GenerationResult result = generateTransitions(config);
    const auto& rows = result.records;
    const Mass shift = IsotopeLabeler(*config.labels).massShift();

    auto light = std::find_if(rows.begin(), rows.end(), [](const TransitionRecord& row) {
        return row.product_name == "HG(-Neu5Ac,309) [Z=2]";
    });
    REQUIRE(light != rows.end());
    REQUIRE(std::next(light) != rows.end());
    const auto& heavy = *std::next(light);

    REQUIRE(light->label == LabelStatus::LIGHT);
    REQUIRE(heavy.label == LabelStatus::HEAVY);
    REQUIRE(heavy.product_name == light->product_name);
    REQUIRE(light->product_charge == -2);
    REQUIRE(heavy.product_charge == -2);
    REQUIRE(heavy.precursor_adduct == "[M2DN15-2H]2-");
    REQUIRE(heavy.product_mz - light->product_mz == Approx(shift / 2).margin(1e-9));
    REQUIRE(heavy.precursor_mz - light->precursor_mz == Approx(shift / 2).margin(1e-9));
}

TEST_CASE("Species enumeration", "[engine]") {
    RunConfig config = singleCeramide();
    config.lcb.explicit_bases.clear();
    config.lcb.carbons = CarbonRange(18, 18);
    config.lcb.unsaturations = {0, 1, 2};
    config.fa.explicit_chains.clear();
    config.fa.carbons = CarbonRange(16, 18);
    config.fa.max_unsaturation = 0;

    GenerationResult result = generateTransitions(config);

    SECTION("Every LCB x FA combination") {
        REQUIRE(result.stats.species == 9);
        REQUIRE(result.records.size() == 9 * 5);
    }

    SECTION("LCB outer, FA inner") {
        const auto& rows = result.records;
        REQUIRE(rows[0].molecule == "Cer 18:0;2/16:0");
        REQUIRE(rows[5].molecule == "Cer 18:0;2/17:0");
        REQUIRE(rows[10].molecule == "Cer 18:0;2/18:0");
        REQUIRE(rows[15].molecule == "Cer 18:1;2/16:0");
        REQUIRE(rows.back().molecule == "Cer 18:2;2/18:0");
    }

    SECTION("Even chains only") {
        config.fa.parity = Parity::EVEN;
        REQUIRE(generateTransitions(config).stats.species == 6);
    }

    SECTION("Deterministic output") {
        GenerationResult again = generateTransitions(config);
        REQUIRE(again.records == result.records);
    }
}

TEST_CASE("Impossible combinations are skipped", "[engine]") {
    SECTION("Fatty acid without hydrogen budget") {
        RunConfig config = singleCeramide();
        config.fa.explicit_chains.clear();
        config.fa.carbons = CarbonRange(2, 2);
        config.fa.max_unsaturation = 3;

        GenerationResult result = generateTransitions(config);
        REQUIRE(result.stats.skipped_formulas == 1);
        REQUIRE(result.stats.species == 3);
        for (const auto& row : result.records) {
            REQUIRE(row.molecule != "Cer 18:1;2/2:3");
        }
    }

    SECTION("Losses larger than the headgroup") {
        RunConfig config = defaultRunConfig("GA1");
        config.lcb.explicit_bases = {BuildingBlock::parse("18:1;2", BlockKind::LONG_CHAIN_BASE)};
        config.fa.explicit_chains = {BuildingBlock::parse("16:0", BlockKind::FATTY_ACID),
                                     BuildingBlock::parse("18:0", BlockKind::FATTY_ACID)};

        GenerationResult result = generateTransitions(config);
        REQUIRE(result.stats.species == 2);
        REQUIRE(result.stats.skipped_rules == 4);
        REQUIRE_FALSE(result.records.empty());
    }
}

TEST_CASE("Isotope labeling", "[engine]") {
    RunConfig config = singleCeramide();

    SECTION("Eligible products come as light and heavy pairs") {
        config.labels = makeLabelSpec("M2DN15", "LCB");
        GenerationResult result = generateTransitions(config);
        const auto& rows = result.records;

        REQUIRE(rows.size() == 8);
        REQUIRE(rows[0].label == LabelStatus::NONE);
        REQUIRE(rows[1].label == LabelStatus::NONE);

        const auto& light = rows[2];
        const auto& heavy = rows[3];
        REQUIRE(light.label == LabelStatus::LIGHT);
        REQUIRE(heavy.label == LabelStatus::HEAVY);
        REQUIRE(light.product_name == heavy.product_name);
        REQUIRE(light.precursor_adduct == "[M+H]1+");
        REQUIRE(heavy.precursor_adduct == "[M2DN15+H]1+");
        REQUIRE(heavy.precursor_mz ==
                Approx(538.519371497922 + 3.0095883851800007).margin(1e-9));
        REQUIRE(heavy.product_mz == Approx(282.279141221962 + 3.0095883851800007).margin(1e-9));
        REQUIRE(heavy.molecule_formula == light.molecule_formula);
        REQUIRE(heavy.product_formula == light.product_formula);

        REQUIRE(rows[4].label == LabelStatus::LIGHT);
        REQUIRE(rows[5].label == LabelStatus::HEAVY);
        REQUIRE(rows[7].label == LabelStatus::HEAVY);
    }

    SECTION("Default keywords label the precursor too") {
        config.labels = makeLabelSpec("M2DN15");
        GenerationResult result = generateTransitions(config);
        REQUIRE(result.records.size() == 10);
        REQUIRE(result.records[1].product_name == "precursor");
        REQUIRE(result.records[1].label == LabelStatus::HEAVY);
    }

    SECTION("Heavy rows are dropped when the label does not fit") {
        config.labels = makeLabelSpec("M2N15", "LCB");
        GenerationResult result = generateTransitions(config);
        REQUIRE(result.records.size() == 5);
        REQUIRE(result.stats.skipped_labels == 3);
        // No pair was formed, so no row claims to be light
        for (const auto& row : result.records) {
            REQUIRE(row.label == LabelStatus::NONE);
        }
    }

    SECTION("Label strings") {
        REQUIRE(toString(LabelStatus::LIGHT) == "light");
        REQUIRE(toString(LabelStatus::HEAVY) == "heavy");
        REQUIRE(toString(LabelStatus::NONE).empty());
    }
}

TEST_CASE("Cancellation", "[engine]") {
    RunConfig config = defaultRunConfig("Cer");

    SECTION("Token cancelled before the first row") {
        CancellationToken token;
        token.cancel();
        GenerationResult result = generateTransitions(config, ClassRegistry::standard(), &token);
        REQUIRE(result.records.empty());
        REQUIRE(result.status == GenerationStatus::CANCELLED);
    }

    SECTION("Token cancelled mid-stream") {
        CancellationToken token;
        TransitionStream stream(config, ClassRegistry::standard(), &token);
        REQUIRE(stream.next().has_value());
        REQUIRE(stream.next().has_value());
        token.cancel();
        REQUIRE_FALSE(stream.next().has_value());
        REQUIRE(stream.finished());
        REQUIRE(stream.status() == GenerationStatus::CANCELLED);
        REQUIRE(stream.stats().rows == 2);
    }

    SECTION("Progress callback returning false") {
        int calls = 0;
        config.options.progress_interval = 3;
        config.options.progress_callback = [&calls](int current, int total) {
            ++calls;
            REQUIRE(current == 3);
            REQUIRE(total == -1);
            return false;
        };
        GenerationResult result = generateTransitions(config);
        REQUIRE(calls == 1);
        REQUIRE(result.records.size() == 3);
        REQUIRE(result.status == GenerationStatus::CANCELLED);
    }

    SECTION("Progress callback returning true") {
        int calls = 0;
        config = singleCeramide();
        config.options.progress_interval = 2;
        config.options.progress_callback = [&calls](int, int) {
            ++calls;
            return true;
        };
        GenerationResult result = generateTransitions(config);
        REQUIRE(calls == 2);
        REQUIRE(result.status == GenerationStatus::COMPLETED);
    }
}

TEST_CASE("Row limit", "[engine]") {
    RunConfig config = singleCeramide();

    SECTION("Limit below the row count") {
        config.options.max_rows = 3;
        GenerationResult result = generateTransitions(config);
        REQUIRE(result.records.size() == 3);
        REQUIRE(result.status == GenerationStatus::ROW_LIMIT_REACHED);
    }

    SECTION("Limit equal to the row count") {
        config.options.max_rows = 5;
        GenerationResult result = generateTransitions(config);
        REQUIRE(result.records.size() == 5);
        REQUIRE(result.status == GenerationStatus::COMPLETED);
    }

    SECTION("Limit above the row count") {
        config.options.max_rows = 100;
        REQUIRE(generateTransitions(config).status == GenerationStatus::COMPLETED);
    }

    SECTION("Status strings") {
        REQUIRE(toString(GenerationStatus::ROW_LIMIT_REACHED) == "row limit reached");
        REQUIRE(toString(GenerationStatus::CANCELLED) == "cancelled");
    }
}

TEST_CASE("Stream behavior", "[engine]") {
    SECTION("Empty ranges yield an empty stream") {
        RunConfig config = singleCeramide();
        config.fa.explicit_chains.clear();
        config.fa.carbons = CarbonRange(20, 18);

        TransitionStream stream(config);
        REQUIRE_FALSE(stream.next().has_value());
        REQUIRE(stream.status() == GenerationStatus::COMPLETED);
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
    }

    SECTION("Reset restarts from the first row") {
        RunConfig config = singleCeramide();
        TransitionStream stream(config);
        auto first = stream.next();
        REQUIRE(stream.next().has_value());

        stream.reset();
        REQUIRE_FALSE(stream.finished());
        REQUIRE(stream.stats().rows == 0);

        auto records = drain(stream);
        REQUIRE(records.size() == 5);
        REQUIRE(records.front() == *first);
        REQUIRE(stream.stats().rows == 5);
    }

    SECTION("Finished streams stay finished") {
        TransitionStream stream(singleCeramide());
        drain(stream);
        REQUIRE(stream.finished());
        REQUIRE_FALSE(stream.next().has_value());
    }

    SECTION("Unknown class") {
        RunConfig config = singleCeramide();
        config.lipid_class = "GZ9";
        REQUIRE_THROWS_AS(TransitionStream(config), ConfigurationError);
    }
}

TEST_CASE("Configuration validation", "[engine]") {
    RunConfig config = singleCeramide();
    REQUIRE_NOTHROW(validateConfig(config));

    SECTION("Class") {
        config.lipid_class = "";
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
        config.lipid_class = "GZ9";
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
    }

    SECTION("Charges") {
        config.charges.clear();
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
        config.charges = {0};
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
        config.charges = {MAX_CHARGE + 1};
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
    }

    SECTION("Adducts") {
        config.precursor_adducts.clear();
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
        config.precursor_adducts = {"[M+K]+"};
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
    }

    SECTION("Fatty acid parity with no matching chain") {
        config.fa.explicit_chains.clear();
        config.fa.carbons = CarbonRange(17, 17);
        config.fa.parity = Parity::EVEN;
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
    }

    SECTION("Long-chain base degrees") {
        config.lcb.explicit_bases.clear();
        config.lcb.unsaturations.clear();
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
    }

    SECTION("Label without substitution") {
        config.labels = IsotopeLabelSpec{"M", {}, {"LCB"}};
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
    }

    SECTION("Label with an unknown isotope") {
        config.labels = IsotopeLabelSpec{"M3T", {{"3H", 1}}, {"LCB"}};
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
        config.labels = IsotopeLabelSpec{"M2D", {{"2H", 0}}, {"LCB"}};
        REQUIRE_THROWS_AS(validateConfig(config), ConfigurationError);
    }

    SECTION("Class defaults") {
        RunConfig dox = defaultRunConfig("doxCer");
        REQUIRE(dox.lcb.base_hydroxyls == 1);
        REQUIRE(dox.lcb.explicit_bases.size() == 2);
        REQUIRE(dox.lcb.explicit_bases[0].name() == "18:0;1");
        REQUIRE_THROWS_AS(defaultRunConfig("GZ9"), ConfigurationError);
    }
}
