// =================================================================
// include/Parley/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Parley {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path = "config/parley.yml";
    bool verbose = false;

    // Options for 'route', 'segment' and 'turn'
    std::string utterance;
    int latency_budget_ms = 800;
    bool cost_sensitive = false;
    bool needs_tools = false;
    std::string region;
    size_t history_turns = 0;

    // Options for 'segment'
    size_t chunk_size = 8;

    // Options for 'turn'
    std::string output_path;
    std::string call_id = "cli";

    // Options for 'models' command
    std::string models_subcommand;  // list, info
    std::string model_name;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupRouteCommand(CLI::App& app);
    void setupSegmentCommand(CLI::App& app);
    void setupModelsCommand(CLI::App& app);
    void setupTurnCommand(CLI::App& app);
    void addRoutingOptions(CLI::App& sub);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Parley
