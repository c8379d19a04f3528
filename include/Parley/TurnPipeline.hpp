// =================================================================
// include/Parley/TurnPipeline.hpp
// =================================================================
// One caller turn from transcript to ordered audio.

#pragma once

#include "Parley/CancellationToken.hpp"
#include "Parley/CircuitBreaker.hpp"
#include "Parley/ComplexityScorer.hpp"
#include "Parley/ConversationContext.hpp"
#include "Parley/GenerationService.hpp"
#include "Parley/MetricsReporter.hpp"
#include "Parley/ModelRegistry.hpp"
#include "Parley/ModelSelector.hpp"
#include "Parley/ParleyConfig.hpp"
#include "Parley/ResilienceLayer.hpp"
#include "Parley/SynthesisDispatcher.hpp"
#include "Parley/SynthesisService.hpp"
#include "Parley/TurnRequestBuilder.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Parley {

/**
 * @brief How a turn resolved
 */
enum class TurnOutcome {
    COMPLETED,   ///< Answered by the selected model
    DEGRADED,    ///< Answered by a fallback model or region
    APOLOGY,     ///< No model answered; the apology phrase was spoken
    FAILED,      ///< Nothing could be spoken, not even the apology
    CANCELLED    ///< The call hung up during the turn
};

std::string turnOutcomeToString(TurnOutcome outcome);

/**
 * @brief Per-turn routing inputs
 */
struct TurnOptions {
    std::string call_id;
    int latency_budget_ms = 800;
    bool cost_sensitive = false;
    bool needs_tools = false;
    std::string preferred_region;          ///< Defaults to the context's region hint
    std::vector<ToolSpec> tools;
};

/**
 * @brief Everything known about a finished turn
 */
struct TurnResult {
    TurnOutcome outcome = TurnOutcome::FAILED;
    double complexity = 0.0;
    RoutingDecision routing;
    ExecutionResult execution;
    DispatchReport dispatch;
    std::string response_text;             ///< Text of every segment emitted
    std::string spoken_apology;            ///< Apology phrase if one was spoken
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;
    size_t estimated_tokens = 0;
    std::optional<std::chrono::milliseconds> first_token_latency;
    std::optional<std::chrono::milliseconds> time_to_first_audio;
    std::chrono::milliseconds duration{0};

    bool answered() const { return outcome == TurnOutcome::COMPLETED || outcome == TurnOutcome::DEGRADED; }
};

/**
 * @brief Runs score, select, build, stream, segment and dispatch for a turn
 *
 * The generation stream is consumed on the calling thread while the
 * dispatcher runs on its own task; the two are joined by a bounded
 * channel. A pipeline holds no per-call state and may serve many calls at
 * once.
 */
class TurnPipeline {
public:
    /**
     * @brief Constructor
     *
     * Every reference must outlive the pipeline.
     *
     * @param registry Model table
     * @param generation Generation service
     * @param synthesis Synthesis service
     * @param sink Audio destination
     * @param breakers Shared breaker table
     * @param config Application configuration
     * @param metrics Optional metrics reporter
     */
    TurnPipeline(const ModelRegistry& registry,
                 GenerationService& generation,
                 SynthesisService& synthesis,
                 AudioSink& sink,
                 CircuitBreakerRegistry& breakers,
                 const ParleyConfig& config,
                 AsyncMetricsReporter* metrics = nullptr);

    virtual ~TurnPipeline() = default;

    TurnPipeline(const TurnPipeline&) = delete;
    TurnPipeline& operator=(const TurnPipeline&) = delete;

    /**
     * @brief Run one turn
     * @param utterance Final caller transcript for the turn
     * @param context Conversation so far
     * @param options Routing inputs
     * @param token Call cancellation
     * @return Turn result; never throws for service failures
     */
    virtual TurnResult runTurn(const std::string& utterance,
                               const ConversationContext& context,
                               const TurnOptions& options,
                               CancellationToken& token);

    const ComplexityScorer& getScorer() const { return m_scorer; }
    const ModelSelector& getSelector() const { return m_selector; }
    const PipelineSettings& getSettings() const { return m_settings; }

private:
    const ModelRegistry& m_registry;
    GenerationService& m_generation;
    PipelineSettings m_settings;
    AsyncMetricsReporter* m_metrics;

    ComplexityScorer m_scorer;
    ModelSelector m_selector;
    TurnRequestBuilder m_builder;
    ResilienceLayer m_resilience;
    SynthesisDispatcher m_dispatcher;

    /**
     * @brief Stream the answer and dispatch its segments
     */
    void streamAndDispatch(const std::string& utterance,
                           const ConversationContext& context,
                           const TurnOptions& options,
                           CancellationToken& token,
                           std::chrono::steady_clock::time_point turn_start,
                           TurnResult& result);

    /**
     * @brief Speak the apology phrase and set the outcome accordingly
     */
    void speakApology(size_t sequence, CancellationToken& token, TurnResult& result);

    void reportMetrics(const TurnOptions& options, const TurnResult& result);
};

} // namespace Parley
