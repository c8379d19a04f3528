// =================================================================
// src/Parley/Core.cpp
// =================================================================
// Implementation of the core application logic.

#include "Parley/Core.hpp"
#include "Parley/CallSession.hpp"
#include "Parley/CircuitBreaker.hpp"
#include "Parley/ComplexityScorer.hpp"
#include "Parley/ConversationContext.hpp"
#include "Parley/FileAudioSink.hpp"
#include "Parley/HttpClients.hpp"
#include "Parley/Logger.hpp"
#include "Parley/MetricsReporter.hpp"
#include "Parley/ModelRegistry.hpp"
#include "Parley/ModelSelector.hpp"
#include "Parley/ParleyConfig.hpp"
#include "Parley/SentenceSegmenter.hpp"
#include "Parley/TurnPipeline.hpp"
#include <iomanip>
#include <iostream>

namespace Parley {

namespace {

ConversationContext simulatedContext(const Commands& commands) {
    ConversationContext context;
    context.region_hint = commands.region;
    context.tools_anticipated = commands.needs_tools;
    for (size_t i = 0; i < commands.history_turns; ++i) {
        SpeakerRole role = (i % 2 == 0) ? SpeakerRole::CALLER : SpeakerRole::AGENT;
        context.appendTurn(role, role == SpeakerRole::CALLER ? "Earlier question." : "Earlier answer.");
    }
    return context;
}

void printRouting(const RoutingDecision& decision) {
    std::cout << "Model:            " << (decision.model_id.empty() ? "(none)" : decision.model_id) << std::endl;
    std::cout << "Region:           " << (decision.region.empty() ? "(none)" : decision.region) << std::endl;
    std::cout << "Reasoning budget: " << decision.reasoning_budget << std::endl;
    std::cout << "Rule:             " << decision.rule_name << std::endl;
    if (decision.degraded) {
        std::cout << "[WARNING] Degraded routing: model not served in any requested region" << std::endl;
    }
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(std::make_unique<ParleyConfig>()),
      m_registry(std::make_unique<ModelRegistry>())
{
}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command == "segment") {
        // Needs no configuration
        return handleSegment();
    }

    if (m_commands.active_command.empty()) {
        return 0;
    }

    if (!loadConfiguration()) {
        return 1;
    }

    if (m_commands.active_command == "route") {
        return handleRoute();
    } else if (m_commands.active_command == "models") {
        return handleModels();
    } else if (m_commands.active_command == "turn") {
        return handleTurn();
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

bool Core::loadConfiguration() {
    ConfigLoadResult config_result = m_config->loadFromFile(m_commands.config_path);
    if (!config_result.success) {
        std::cerr << "[ERROR] " << config_result.error_message << std::endl;
        return false;
    }

    m_config->applyLoggingSettings();
    if (m_commands.verbose) {
        Logger::getInstance().setConsoleLogLevel(LogLevel::DEBUG);
    }

    RegistryStatus status = m_registry->loadFromConfig(m_commands.config_path);
    if (!status.success) {
        std::cerr << "[ERROR] Failed to load model table: " << status.error_message << std::endl;
        return false;
    }
    if (status.failed_to_load > 0) {
        std::cerr << "[WARNING] " << status.failed_to_load << " model profile(s) rejected, see log" << std::endl;
    }
    return true;
}

int Core::handleRoute() {
    ComplexityScorer scorer(m_config->scorer);
    ModelSelector selector(*m_registry, m_config->selector);

    ConversationContext context = simulatedContext(m_commands);
    ComplexityBreakdown breakdown = scorer.scoreWithBreakdown(m_commands.utterance, context);

    SelectionInputs inputs;
    inputs.score = breakdown.score;
    inputs.latency_budget_ms = m_commands.latency_budget_ms;
    inputs.cost_sensitive = m_commands.cost_sensitive;
    inputs.needs_tools = m_commands.needs_tools;
    inputs.preferred_region = m_commands.region;

    RoutingDecision decision = selector.select(inputs);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Complexity:       " << breakdown.score << std::endl;
    std::cout << "  words:          " << breakdown.word_count << " (factor " << breakdown.word_factor << ")" << std::endl;
    std::cout << "  patterns:       " << breakdown.matched_patterns.size()
              << " (factor " << breakdown.pattern_factor << ")" << std::endl;
    for (const auto& pattern : breakdown.matched_patterns) {
        std::cout << "    - " << pattern << std::endl;
    }
    std::cout << "  context factor: " << breakdown.context_factor << std::endl;
    printRouting(decision);

    return decision.model_id.empty() ? 1 : 0;
}

int Core::handleSegment() {
    const std::string& text = m_commands.utterance;
    const size_t chunk = m_commands.chunk_size == 0 ? 1 : m_commands.chunk_size;

    SentenceSegmenter segmenter([](const SegmentEvent& event) {
        std::cout << "[" << event.sequence << "] " << segmentKindToString(event.kind);
        if (event.isSegment()) {
            std::cout << ": \"" << event.text << "\"";
        } else if (event.kind == SegmentKind::ERROR) {
            std::cout << ": " << event.error_message;
        }
        std::cout << std::endl;
    });

    for (size_t pos = 0; pos < text.size(); pos += chunk) {
        segmenter.onContent(text.substr(pos, chunk));
    }
    segmenter.onEnd();

    return segmenter.hasFailed() ? 1 : 0;
}

int Core::handleModels() {
    if (m_commands.models_subcommand == "list") {
        std::cout << m_registry->getAllModelsInfo() << std::endl;
        return 0;
    } else if (m_commands.models_subcommand == "info") {
        if (!m_registry->findProfile(m_commands.model_name)) {
            std::cerr << "Error: Unknown model '" << m_commands.model_name << "'." << std::endl;
            return 1;
        }
        std::cout << m_registry->getModelInfo(m_commands.model_name) << std::endl;
        return 0;
    }

    std::cerr << "Error: Unknown models subcommand." << std::endl;
    return 1;
}

int Core::handleTurn() {
    std::unique_ptr<FileAudioSink> sink;
    try {
        sink = std::make_unique<FileAudioSink>(m_commands.output_path);
    } catch (const std::exception& e) {
        std::cerr << "Error opening output: " << e.what() << std::endl;
        return 1;
    }

    HttpGenerationService generation(m_config->generation_endpoint);
    HttpSynthesisService synthesis(m_config->synthesis_endpoint);
    CircuitBreakerRegistry breakers(m_config->breaker);
    AsyncMetricsReporter metrics(std::make_shared<LogMetricsSink>());

    TurnPipeline pipeline(*m_registry, generation, synthesis, *sink, breakers, *m_config, &metrics);

    TurnResult result;
    {
        CallSession session(m_commands.call_id, pipeline, "", m_commands.region);
        session.setToolsAnticipated(m_commands.needs_tools);
        session.setTerminalFailureHandler([](const std::string& call_id, const TurnResult& failed) {
            std::cerr << "[ERROR] Call " << call_id << " could not be answered: "
                      << failed.error_message << std::endl;
        });

        TurnOptions options;
        options.latency_budget_ms = m_commands.latency_budget_ms;
        options.cost_sensitive = m_commands.cost_sensitive;
        options.needs_tools = m_commands.needs_tools;
        options.preferred_region = m_commands.region;

        std::cout << "Running turn..." << std::endl;
        result = session.handleUtterance(m_commands.utterance, options);
    }
    metrics.flush();

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Outcome:          " << turnOutcomeToString(result.outcome) << std::endl;
    std::cout << "Complexity:       " << result.complexity << std::endl;
    printRouting(result.routing);
    if (!result.execution.target_used.model_id.empty()) {
        std::cout << "Answered by:      " << result.execution.target_used.model_id
                  << " @ " << result.execution.target_used.region << std::endl;
    }
    std::cout << "Segments:         " << result.dispatch.delivered << "/" << result.dispatch.received
              << " delivered" << std::endl;
    if (result.first_token_latency) {
        std::cout << "First token:      " << result.first_token_latency->count() << "ms" << std::endl;
    }
    if (result.time_to_first_audio) {
        std::cout << "First audio:      " << result.time_to_first_audio->count() << "ms" << std::endl;
    }
    std::cout << "Duration:         " << result.duration.count() << "ms" << std::endl;
    std::cout << "Audio written:    " << sink->bytesWritten() << " bytes to " << m_commands.output_path << std::endl;

    if (!result.response_text.empty()) {
        std::cout << "\n" << result.response_text << std::endl;
    }
    if (!result.answered()) {
        std::cerr << "[ERROR] " << errorKindToString(result.error_kind) << ": " << result.error_message << std::endl;
    }

    return result.answered() ? 0 : 1;
}

} // namespace Parley
