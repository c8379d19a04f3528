// =================================================================
// include/Parley/ParleyConfig.hpp
// =================================================================
// Application configuration loaded from config/parley.yml.

#pragma once

#include "Parley/CircuitBreaker.hpp"
#include "Parley/ComplexityScorer.hpp"
#include "Parley/HttpClients.hpp"
#include "Parley/Logger.hpp"
#include "Parley/ModelSelector.hpp"
#include "Parley/ResilienceLayer.hpp"
#include "Parley/SynthesisDispatcher.hpp"
#include <string>
#include <vector>

namespace Parley {

/**
 * @brief What to do when no configured region serves the selected model
 */
enum class DegradedMode {
    ATTEMPT,   ///< Proceed and let the resilience layer fall back
    REJECT     ///< Skip generation and speak the apology phrase
};

std::string degradedModeToString(DegradedMode mode);

/**
 * @brief Settings for one turn of the pipeline
 */
struct PipelineSettings {
    DegradedMode degraded_mode = DegradedMode::ATTEMPT;
    std::string system_prompt = "You are a helpful voice assistant answering phone calls.";
    size_t max_tokens = 300;
    double temperature = 0.3;
    size_t max_history_turns = 20;
    size_t channel_capacity = 16;          ///< Segments buffered between segmenter and dispatcher
    std::string apology_phrase = "I'm sorry, I'm having trouble right now. Could you say that again?";
};

/**
 * @brief Logger settings
 */
struct LoggingSettings {
    std::string directory = ".parley/logs";
    LogLevel console_level = LogLevel::WARNING;
    LogLevel file_level = LogLevel::DEBUG;
    bool console_enabled = true;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

/**
 * @brief Result of loading a configuration file
 */
struct ConfigLoadResult {
    bool success = false;
    std::string error_message;
    std::vector<std::string> warnings;    ///< Invalid values that kept their defaults
};

/**
 * @brief Complete application configuration
 *
 * The `models` section is read separately by ModelRegistry; every other
 * section is read here. Missing keys keep compiled defaults.
 */
struct ParleyConfig {
    ScorerConfig scorer;
    ModelSelectorConfig selector;
    PipelineSettings pipeline;
    HttpEndpointConfig generation_endpoint;
    HttpEndpointConfig synthesis_endpoint;
    DispatcherConfig synthesis;
    BreakerConfig breaker;
    RetryPolicy retry;
    LoggingSettings logging;

    ParleyConfig();

    /**
     * @brief Load settings from a YAML file
     * @param path File path
     * @return Failure if the file cannot be read or parsed
     */
    ConfigLoadResult loadFromFile(const std::string& path);

    /**
     * @brief Load settings from YAML text
     */
    ConfigLoadResult loadFromString(const std::string& yaml_text);

    /**
     * @brief Initialize the logger from the logging section
     */
    void applyLoggingSettings() const;

    static std::string getDefaultConfigPath() { return "config/parley.yml"; }

private:
    ConfigLoadResult loadDocument(const std::string& source, bool is_file);
};

} // namespace Parley
