/**
 * Example usage of the gslgen C++ library.
 *
 * Usage:
 *   cpp_example [run.xml]
 *
 * Without an argument a few built-in runs are shown; with one, the first run
 * of the XML configuration is generated and written as CSV to stdout.
 */

#include <iostream>
#include <iomanip>
#include <string>

#include "gslgen/gslgen.hpp"

using namespace gslgen;

void exampleCatalog() {
    std::cout << "========================================\n";
    std::cout << "Lipid Class Catalog\n";
    std::cout << "========================================\n";

    const auto& registry = ClassRegistry::standard();
    for (const auto& name : registry.names()) {
        const auto& def = registry.get(name);
        std::cout << "  " << std::left << std::setw(7) << name
                  << " " << std::setw(17) << toString(def.family)
                  << " sialic=" << def.sialic_acids
                  << " rules=" << std::setw(3) << def.rules.size()
                  << " charges 1.." << def.charge_range.max_value
                  << "  " << def.description << "\n";
    }
}

void exampleCeramide() {
    std::cout << "\n========================================\n";
    std::cout << "Cer 18:1;2/16:0 [M+H]+\n";
    std::cout << "========================================\n";

    RunConfig config = defaultRunConfig("Cer");
    config.lcb.explicit_bases = {BuildingBlock::parse("18:1;2", BlockKind::LONG_CHAIN_BASE)};
    config.fa.carbons = CarbonRange(16, 16);
    config.fa.max_unsaturation = 0;
    config.precursor_adducts = {"[M+H]+"};
    config.product_adducts = {"[M+H]+"};

    GenerationResult result = generateTransitions(config);
    io::TransitionWriter writer(std::cout);
    writer.write(result.records);
}

void exampleLabeledGanglioside() {
    std::cout << "\n========================================\n";
    std::cout << "GD1a, negative mode, labeled, first 12 rows\n";
    std::cout << "========================================\n";

    RunConfig config = defaultRunConfig("GD1a");
    config.lcb.explicit_bases = {BuildingBlock::parse("18:1;2", BlockKind::LONG_CHAIN_BASE)};
    config.fa.explicit_chains = {BuildingBlock::parse("18:0", BlockKind::FATTY_ACID)};
    config.charges = {2, 3};
    config.precursor_adducts = {"[M-H]-"};
    config.product_adducts = {"[M-H]-"};
    config.labels = makeLabelSpec("M2DN15");
    config.options.max_rows = 12;

    GenerationResult result = generateTransitions(config);
    io::TransitionWriter writer(std::cout);
    writer.write(result.records);

    std::cout << "Status: " << toString(result.status)
              << ", species: " << result.stats.species << "\n";
}

void exampleCancellation() {
    std::cout << "\n========================================\n";
    std::cout << "Streaming with progress and cancellation\n";
    std::cout << "========================================\n";

    RunConfig config = defaultRunConfig("GM1");
    config.charges = {1, 2};
    config.options.progress_interval = 500;
    config.options.progress_callback = [](int current, int /*total*/) {
        std::cout << "  " << current << " rows...\n";
        return current < 2000;
    };

    CancellationToken token;
    TransitionStream stream(config, ClassRegistry::standard(), &token);
    std::size_t rows = 0;
    while (auto record = stream.next()) {
        ++rows;
    }
    std::cout << "Stopped after " << rows << " rows (" << toString(stream.status()) << ")\n";
}

int runFromFile(const std::string& path) {
    RunConfig config = io::loadRunConfig(path);
    validateConfig(config);

    TransitionStream stream(config);
    io::TransitionWriter writer(std::cout);
    writer.write(stream);
    return stream.status() == GenerationStatus::CANCELLED ? 2 : 0;
}

int main(int argc, char* argv[]) {
    log::initFromEnvironment();

    try {
        if (argc > 1) {
            return runFromFile(argv[1]);
        }

        std::cout << "gslgen C++ Library Examples\n\n";
        exampleCatalog();
        exampleCeramide();
        exampleLabeledGanglioside();
        exampleCancellation();

        std::cout << "\n========================================\n";
        std::cout << "Examples completed successfully!\n";
        std::cout << "========================================\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
