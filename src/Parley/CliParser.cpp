// =================================================================
// src/Parley/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Parley/CliParser.hpp"

namespace Parley {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Parley: real-time voice turn streaming pipeline.");
    m_app->require_subcommand(0, 1);

    m_app->add_option("-c,--config", m_commands.config_path, "Configuration file (default: config/parley.yml)");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Log debug output to the console");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupRouteCommand(*m_app);
    setupSegmentCommand(*m_app);
    setupModelsCommand(*m_app);
    setupTurnCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::addRoutingOptions(CLI::App& sub) {
    sub.add_option("--latency-budget", m_commands.latency_budget_ms, "Latency budget in milliseconds (default: 800)")
        ->check(CLI::NonNegativeNumber);
    sub.add_flag("--cost-sensitive", m_commands.cost_sensitive, "Prefer cheaper models for simple turns");
    sub.add_flag("--tools", m_commands.needs_tools, "The turn needs tool use");
    sub.add_option("--region", m_commands.region, "Preferred serving region");
    sub.add_option("--history", m_commands.history_turns, "Number of prior turns to simulate");
}

void CliParser::setupRouteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("route", "Scores an utterance and prints the routing decision.");
    sub->add_option("utterance", m_commands.utterance, "Caller transcript.")->required();
    addRoutingOptions(*sub);
}

void CliParser::setupSegmentCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("segment", "Feeds text through the sentence segmenter and prints the segments.");
    sub->add_option("text", m_commands.utterance, "Text to segment.")->required();
    sub->add_option("--chunk-size", m_commands.chunk_size, "Characters per simulated stream fragment (default: 8)")
        ->check(CLI::PositiveNumber);
}

void CliParser::setupModelsCommand(CLI::App& app) {
    auto* models_cmd = app.add_subcommand("models", "Inspect the configured model table");
    models_cmd->require_subcommand(1);

    auto* list_cmd = models_cmd->add_subcommand("list", "List all configured models");
    list_cmd->callback([this]() { m_commands.models_subcommand = "list"; });

    auto* info_cmd = models_cmd->add_subcommand("info", "Show detailed information about a model");
    info_cmd->add_option("model", m_commands.model_name, "Model identifier")->required();
    info_cmd->callback([this]() { m_commands.models_subcommand = "info"; });
}

void CliParser::setupTurnCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("turn", "Runs one full turn against the configured services.");
    sub->add_option("utterance", m_commands.utterance, "Caller transcript.")->required();
    sub->add_option("-o,--out", m_commands.output_path, "File receiving the raw audio.")->required();
    sub->add_option("--call-id", m_commands.call_id, "Call identifier used in logs (default: cli)");
    addRoutingOptions(*sub);
}

} // namespace Parley
