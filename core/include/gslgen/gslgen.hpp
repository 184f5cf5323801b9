#pragma once

/**
 * @file gslgen.hpp
 * @brief Main header for the gslgen transition generator library.
 *
 * Include this header to get access to all gslgen functionality.
 *
 * @example
 * @code
 * #include <gslgen/gslgen.hpp>
 *
 * int main() {
 *     auto config = gslgen::defaultRunConfig("GM1");
 *     config.charges = {1, 2};
 *
 *     auto result = gslgen::generateTransitions(config);
 *     gslgen::io::TransitionWriter writer(std::cout);
 *     writer.write(result.records);
 *     return 0;
 * }
 * @endcode
 */

// Core types
#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"

// Chemistry
#include "elements.hpp"
#include "formula.hpp"
#include "mass_calculator.hpp"
#include "building_blocks.hpp"
#include "adduct.hpp"

// Classes and fragmentation
#include "lipid_class.hpp"
#include "species.hpp"
#include "fragmentation.hpp"
#include "isotope_label.hpp"

// Generation
#include "transition.hpp"
#include "engine.hpp"

// I/O
#include "io/config_reader.hpp"
#include "io/transition_writer.hpp"

/**
 * @namespace gslgen
 * @brief Root namespace for the glycosphingolipid transition generator.
 */

/**
 * @namespace gslgen::io
 * @brief Reading run configurations and writing transition lists.
 */
