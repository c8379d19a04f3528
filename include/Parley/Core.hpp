// =================================================================
// include/Parley/Core.hpp
// =================================================================
// Wires configuration, model table and services behind the CLI commands.

#pragma once

#include "Parley/CliParser.hpp"
#include <memory>
#include <string>

namespace Parley {

class ModelRegistry;
struct ParleyConfig;

/**
 * @brief Runs one `parley` subcommand
 *
 * `segment` works without a configuration file; every other command
 * loads the YAML file first.
 */
class Core {
public:
    /**
     * @param commands Parsed command line; must outlive the Core
     */
    explicit Core(const Commands& commands);

    // Defined in Core.cpp where ParleyConfig and ModelRegistry are complete
    ~Core();

    /**
     * @brief Dispatch the active subcommand
     * @return Process exit code
     */
    int run();

private:
    int handleRoute();
    int handleSegment();
    int handleModels();
    int handleTurn();

    /**
     * @brief Load configuration and model table from the config file
     * @return False if either could not be loaded
     */
    bool loadConfiguration();

    const Commands& m_commands;
    std::unique_ptr<ParleyConfig> m_config;
    std::unique_ptr<ModelRegistry> m_registry;
};

} // namespace Parley
