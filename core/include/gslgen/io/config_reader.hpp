#pragma once

#include "../engine.hpp"
#include "../errors.hpp"
#include <memory>
#include <string>
#include <vector>

namespace gslgen {
namespace io {

/**
 * @brief Exception thrown when a run configuration document is malformed.
 */
class ConfigParseError : public Error {
public:
    explicit ConfigParseError(const std::string& msg)
        : Error("config parse error: " + msg) {}
};

/**
 * @brief Reader for XML run configurations.
 *
 * A document holds one or more runs:
 * @code{.xml}
 * <gslgen>
 *   <run class="GD1a">
 *     <lcb min="18" max="18" unsaturation="1" hydroxylation="0"/>
 *     <fa min="16" max="24" max_unsaturation="1" parity="even"/>
 *     <charges>2 3</charges>
 *     <adducts>[M-H]-</adducts>
 *     <labels token="M2DN15" keywords="LCB,precursor,HG(-Hex"/>
 *     <options max_rows="0" progress_interval="1000"/>
 *   </run>
 * </gslgen>
 * @endcode
 *
 * Omitted elements keep the class defaults of defaultRunConfig().
 * `<lcb bases="18:1;2,18:0;2"/>` and `<fa chains="16:0,24:1"/>` select
 * explicit building blocks; `<charges>auto</charges>` selects the class'
 * recommended charges; `<precursor_adducts>` and `<product_adducts>` set
 * the two adduct lists separately.
 *
 * Usage:
 * @code
 * ConfigReader reader;
 * RunConfig config = reader.read("run.xml");
 * @endcode
 */
class ConfigReader {
public:
    explicit ConfigReader(const ClassRegistry& registry = ClassRegistry::standard());
    ~ConfigReader();

    // Non-copyable
    ConfigReader(const ConfigReader&) = delete;
    ConfigReader& operator=(const ConfigReader&) = delete;

    // Movable
    ConfigReader(ConfigReader&&) noexcept;
    ConfigReader& operator=(ConfigReader&&) noexcept;

    /**
     * @brief Read the first run of a configuration file.
     *
     * @throws ConfigParseError if the file cannot be parsed
     * @throws ConfigurationError if a value is semantically invalid
     */
    RunConfig read(const std::string& filename);

    /**
     * @brief Read every run of a configuration file.
     *
     * @throws ConfigParseError if the file cannot be parsed
     * @throws ConfigurationError if a value is semantically invalid
     */
    std::vector<RunConfig> readAll(const std::string& filename);

    /**
     * @brief Parse the first run of configuration content.
     *
     * @throws ConfigParseError if the content cannot be parsed
     * @throws ConfigurationError if a value is semantically invalid
     */
    RunConfig parseString(const std::string& content);

    /**
     * @brief Parse every run of configuration content.
     *
     * @throws ConfigParseError if the content cannot be parsed
     * @throws ConfigurationError if a value is semantically invalid
     */
    std::vector<RunConfig> parseStringAll(const std::string& content);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Convenience function to load the first run of a configuration file.
 */
inline RunConfig loadRunConfig(const std::string& filename) {
    ConfigReader reader;
    return reader.read(filename);
}

} // namespace io
} // namespace gslgen
