// =================================================================
// src/Parley/TurnPipeline.cpp
// =================================================================
// Implementation of the per-turn streaming pipeline.

#include "Parley/TurnPipeline.hpp"
#include "Parley/BoundedChannel.hpp"
#include "Parley/Logger.hpp"
#include "Parley/SentenceSegmenter.hpp"
#include <algorithm>
#include <future>

namespace Parley {

std::string turnOutcomeToString(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::COMPLETED: return "completed";
        case TurnOutcome::DEGRADED: return "degraded";
        case TurnOutcome::APOLOGY: return "apology";
        case TurnOutcome::FAILED: return "failed";
        case TurnOutcome::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

TurnPipeline::TurnPipeline(const ModelRegistry& registry,
                           GenerationService& generation,
                           SynthesisService& synthesis,
                           AudioSink& sink,
                           CircuitBreakerRegistry& breakers,
                           const ParleyConfig& config,
                           AsyncMetricsReporter* metrics)
    : m_registry(registry),
      m_generation(generation),
      m_settings(config.pipeline),
      m_metrics(metrics),
      m_scorer(config.scorer),
      m_selector(registry, config.selector),
      m_builder(registry),
      m_resilience(breakers, registry, config.retry),
      m_dispatcher(synthesis, sink, config.synthesis, &m_resilience) {
}

TurnResult TurnPipeline::runTurn(const std::string& utterance,
                                 const ConversationContext& context,
                                 const TurnOptions& options,
                                 CancellationToken& token) {
    auto& logger = Logger::getInstance();
    const auto turn_start = std::chrono::steady_clock::now();

    TurnResult result;

    // Step 1: Score complexity
    result.complexity = m_scorer.score(utterance, context);

    // Step 2: Select model and region
    SelectionInputs inputs;
    inputs.score = result.complexity;
    inputs.latency_budget_ms = options.latency_budget_ms;
    inputs.cost_sensitive = options.cost_sensitive;
    inputs.needs_tools = options.needs_tools;
    inputs.preferred_region = options.preferred_region.empty() ? context.region_hint : options.preferred_region;

    result.routing = m_selector.select(inputs);
    logger.logRoutingDecision(options.call_id, result.routing);

    // Step 3: Generate and speak, or apologize straight away
    if (result.routing.model_id.empty()) {
        result.error_kind = ErrorKind::REQUEST_INVALID;
        result.error_message = "No model configured for routing";
        logger.error("TurnPipeline", result.error_message, options.call_id);
        speakApology(1, token, result);
    } else if (result.routing.degraded && m_settings.degraded_mode == DegradedMode::REJECT) {
        result.error_kind = ErrorKind::SERVICE_UNAVAILABLE;
        result.error_message = "Model " + result.routing.model_id + " unavailable in region " +
                               result.routing.region;
        logger.warning("TurnPipeline", "Rejecting degraded routing: " + result.error_message, options.call_id);
        speakApology(1, token, result);
    } else {
        streamAndDispatch(utterance, context, options, token, turn_start, result);
    }

    if (token.isCancelled()) {
        result.outcome = TurnOutcome::CANCELLED;
    }

    result.time_to_first_audio = result.dispatch.time_to_first_audio;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - turn_start);

    logger.logTurnCompleted(options.call_id, turnOutcomeToString(result.outcome),
                            result.dispatch.delivered + (result.spoken_apology.empty() ? 0 : 1),
                            result.first_token_latency ? static_cast<long>(result.first_token_latency->count()) : -1,
                            static_cast<long>(result.duration.count()));
    reportMetrics(options, result);

    return result;
}

void TurnPipeline::streamAndDispatch(const std::string& utterance,
                                     const ConversationContext& context,
                                     const TurnOptions& options,
                                     CancellationToken& token,
                                     std::chrono::steady_clock::time_point turn_start,
                                     TurnResult& result) {
    auto& logger = Logger::getInstance();

    BoundedChannel<SegmentEvent> channel(m_settings.channel_capacity);

    // The dispatcher closes the channel when it stops so a blocked producer
    // is released after a hangup
    auto dispatch_task = std::async(std::launch::async, [this, &channel, &token, turn_start]() {
        DispatchReport report = m_dispatcher.dispatch(channel, token, turn_start);
        channel.close();
        return report;
    });

    SentenceSegmenter segmenter([&channel, &result](const SegmentEvent& event) {
        if (event.isSegment()) {
            result.response_text += event.text;
        }
        channel.push(event);
    }, turn_start);

    BuildOptions build_options;
    build_options.requested_max_tokens = m_settings.max_tokens;
    build_options.temperature = m_settings.temperature;
    build_options.system_prompt = m_settings.system_prompt;
    build_options.tools = options.tools;
    build_options.max_history_turns = m_settings.max_history_turns;

    size_t request_max_tokens = 0;

    auto call = [&](const RouteTarget& target) {
        RoutingDecision attempt = result.routing;
        attempt.model_id = target.model_id;
        attempt.region = target.region;
        // The reasoning budget was granted for the selected model only
        if (target.model_id != result.routing.model_id) {
            attempt.reasoning_budget = 0;
        }

        BuildResult built = m_builder.build(utterance, context, attempt, build_options);
        if (!built.success) {
            throw ServiceError(built.error_kind, built.error_message);
        }
        request_max_tokens = built.request.max_tokens;

        bool forwarded = false;
        try {
            m_generation.streamGeneration(built.request, [&](const StreamDelta& delta) {
                if (delta.type == DeltaType::ERROR) {
                    throw ServiceError(delta.error_kind, delta.error_message, forwarded);
                }
                if (delta.type == DeltaType::CONTENT) {
                    forwarded = true;
                }
                segmenter.onDelta(delta);
            }, token);
        } catch (const ServiceError& e) {
            if (forwarded && !e.partialOutput()) {
                throw ServiceError(e.kind(), e.what(), true);
            }
            throw;
        }

        // The segmenter has already closed this turn's synthesis, so no other
        // model can continue it
        if (segmenter.hasFailed()) {
            throw ServiceError(ErrorKind::SEGMENTATION_ERROR, "Malformed generation stream", true);
        }
        if (!segmenter.isFinished()) {
            segmenter.onEnd();
        }
    };

    RouteTarget primary;
    primary.model_id = result.routing.model_id;
    primary.region = result.routing.region;

    result.execution = m_resilience.execute(primary, m_registry.getDegradationChain(), call, token);

    if (!result.execution.success) {
        result.error_kind = result.execution.last_error;
        result.error_message = result.execution.error_message;
        if (!segmenter.isFinished()) {
            segmenter.onError(result.execution.last_error, result.execution.error_message);
        }
    }
    channel.close();

    result.dispatch = dispatch_task.get();
    result.first_token_latency = segmenter.firstTokenLatency();
    result.estimated_tokens = std::min(request_max_tokens, (result.response_text.size() + 3) / 4);

    if (token.isCancelled()) {
        return;
    }

    if (result.execution.success) {
        const bool fell_back = result.execution.fallback_used || result.routing.degraded;
        result.outcome = fell_back ? TurnOutcome::DEGRADED : TurnOutcome::COMPLETED;

        if (result.dispatch.received > 0 && result.dispatch.delivered == 0) {
            logger.error("TurnPipeline", "Answer produced no audio", options.call_id);
            speakApology(result.dispatch.received + 1, token, result);
        }
        return;
    }

    logger.error("TurnPipeline", "Generation failed: " + errorKindToString(result.error_kind),
                 result.error_message);
    speakApology(result.dispatch.received + 1, token, result);
}

void TurnPipeline::speakApology(size_t sequence, CancellationToken& token, TurnResult& result) {
    if (m_dispatcher.speak(m_settings.apology_phrase, sequence, token)) {
        result.outcome = TurnOutcome::APOLOGY;
        result.spoken_apology = m_settings.apology_phrase;
    } else {
        result.outcome = TurnOutcome::FAILED;
        Logger::getInstance().critical("TurnPipeline", "Could not speak apology phrase", result.error_message);
    }
}

void TurnPipeline::reportMetrics(const TurnOptions& options, const TurnResult& result) {
    if (!m_metrics) {
        return;
    }

    auto point = [&](const std::string& name, double value) {
        MetricPoint metric;
        metric.name = name;
        metric.value = value;
        metric.call_id = options.call_id;
        metric.model_id = result.execution.target_used.model_id;
        metric.region = result.execution.target_used.region;
        metric.estimated_tokens = result.estimated_tokens;
        m_metrics->report(metric);
    };

    point("turn_duration_ms", static_cast<double>(result.duration.count()));
    if (result.first_token_latency) {
        point("first_token_ms", static_cast<double>(result.first_token_latency->count()));
    }
    if (result.time_to_first_audio) {
        point("time_to_first_audio_ms", static_cast<double>(result.time_to_first_audio->count()));
    }
}

} // namespace Parley
