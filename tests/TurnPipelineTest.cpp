// =================================================================
// tests/TurnPipelineTest.cpp
// =================================================================
// Unit tests for TurnPipeline component.

#include "Parley/TurnPipeline.hpp"
#include "Parley/Errors.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace {

const char* kModelTable = R"(
models:
  fast-small:
    tier: fast
    intelligence_rank: 1
    speed_rank: 4
    cost_rank: 1
    max_output_tokens: 1024
    regions: [us-east, us-west]

  balanced-medium:
    tier: balanced
    intelligence_rank: 2
    speed_rank: 3
    cost_rank: 2
    max_output_tokens: 4096
    capabilities: [TOOL_USE]
    regions: [us-east, us-west]

  capable-large:
    tier: capable
    intelligence_rank: 3
    speed_rank: 2
    cost_rank: 3
    max_output_tokens: 8192
    max_reasoning_tokens: 16000
    capabilities: [TOOL_USE, EXTENDED_REASONING]
    regions: [us-east]

routing:
  fallback_regions: [us-east, us-west]
  degradation_chain: [capable-large, balanced-medium, fast-small]
)";

const std::string kAnswer = "Sure. Your appointment is confirmed for Friday at ten. Anything else?";

} // namespace

// Generation fake: streams kAnswer in small chunks unless the model is
// scripted to fail
class MockGenerationService : public Parley::GenerationService {
public:
    std::map<std::string, Parley::ErrorKind> failing_models;
    std::set<std::string> partial_failures;     ///< Fail after one sentence of output
    std::set<std::string> malformed_models;     ///< Send an unrecognized event, then a normal answer
    bool hang_after_first_sentence = false;

    void streamGeneration(const Parley::GenerationRequest& request,
                          const Parley::DeltaCallback& on_delta,
                          Parley::CancellationToken& token) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(request);
        }

        auto failure = failing_models.find(request.model_id);
        if (failure != failing_models.end()) {
            throw Parley::ServiceError(failure->second, request.model_id + " failed");
        }

        if (partial_failures.count(request.model_id) > 0) {
            on_delta(Parley::StreamDelta::content("Let me check. One"));
            on_delta(Parley::StreamDelta::content(" moment"));
            throw Parley::ServiceError(Parley::ErrorKind::SERVICE_UNAVAILABLE, "connection reset");
        }

        if (malformed_models.count(request.model_id) > 0) {
            Parley::StreamDelta unknown;
            unknown.type = Parley::DeltaType::UNKNOWN;
            on_delta(unknown);
        }

        if (hang_after_first_sentence) {
            on_delta(Parley::StreamDelta::content("Let me look. That"));
            if (token.waitFor(std::chrono::seconds(5))) {
                throw Parley::ServiceError(Parley::ErrorKind::CANCELLED, "hung up");
            }
        }

        for (size_t pos = 0; pos < kAnswer.size(); pos += 7) {
            on_delta(Parley::StreamDelta::content(kAnswer.substr(pos, 7)));
        }
        on_delta(Parley::StreamDelta::end());
    }

    std::string getName() const override { return "mock-generation"; }

    std::vector<Parley::GenerationRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Parley::GenerationRequest> m_requests;
};

class MockSynthesisService : public Parley::SynthesisService {
public:
    bool fail_all = false;

    Parley::AudioBuffer synthesize(const Parley::SynthesisRequest& request, Parley::CancellationToken&) override {
        if (fail_all) {
            throw Parley::ServiceError(Parley::ErrorKind::SERVICE_UNAVAILABLE, "voice unavailable");
        }
        return Parley::AudioBuffer(request.text.begin(), request.text.end());
    }

    std::string getName() const override { return "mock-synthesis"; }
};

class RecordingSink : public Parley::AudioSink {
public:
    void writeAudio(size_t sequence, const Parley::AudioBuffer& audio) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_writes.emplace_back(sequence, std::string(audio.begin(), audio.end()));
    }

    std::vector<std::pair<size_t, std::string>> writes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_writes;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<size_t, std::string>> m_writes;
};

class RecordingMetricsSink : public Parley::MetricsSink {
public:
    void record(const Parley::MetricPoint& point) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_points.push_back(point);
    }

    std::vector<Parley::MetricPoint> points() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_points;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Parley::MetricPoint> m_points;
};

class TurnPipelineTest {
private:
    Parley::ModelRegistry m_registry;
    Parley::ParleyConfig m_config;

    Parley::TurnOptions options(int latency_budget_ms) {
        Parley::TurnOptions turn_options;
        turn_options.call_id = "test-call";
        turn_options.latency_budget_ms = latency_budget_ms;
        turn_options.preferred_region = "us-east";
        return turn_options;
    }

public:
    TurnPipelineTest() {
        auto status = m_registry.loadFromString(kModelTable);
        if (!status.success || m_registry.size() != 3) {
            throw std::runtime_error("Failed to load test model table: " + status.error_message);
        }

        m_config.retry.base_delay = std::chrono::milliseconds(1);
        m_config.retry.max_delay = std::chrono::milliseconds(2);
        m_config.breaker.failure_threshold = 100;
    }

    void testSimpleTurnEndToEnd() {
        std::cout << "Testing simple turn end to end..." << std::endl;

        MockGenerationService generation;
        MockSynthesisService synthesis;
        RecordingSink sink;
        Parley::CircuitBreakerRegistry breakers(m_config.breaker);
        Parley::TurnPipeline pipeline(m_registry, generation, synthesis, sink, breakers, m_config);

        Parley::ConversationContext context;
        Parley::CancellationToken token;
        auto result = pipeline.runTurn("Can you quickly confirm my appointment?", context, options(120), token);

        assert(result.outcome == Parley::TurnOutcome::COMPLETED && "Turn completes on the selected model");
        assert(result.complexity < 0.3 && "Short utterance scores low");
        assert(result.routing.model_id == "fast-small" && result.routing.rule_name == "fast_simple");
        assert(result.routing.reasoning_budget == 0 && "No reasoning budget on the fast tier");
        assert(result.routing.region == "us-east");
        assert(result.response_text == kAnswer && "Every streamed character reaches a segment");

        auto writes = sink.writes();
        assert(writes.size() == 3 && "Three sentences spoken");
        assert(writes[0].first == 1 && writes[1].first == 2 && writes[2].first == 3 && "Audio in sentence order");
        assert(writes[0].second == "Sure." && writes[2].second == " Anything else?");

        auto requests = generation.requests();
        assert(requests.size() == 1 && requests[0].model_id == "fast-small");
        assert(!requests[0].messages.empty() && requests[0].messages.back().role == "user" &&
               requests[0].messages.back().content == "Can you quickly confirm my appointment?" &&
               "Utterance is the last user message");

        assert(result.first_token_latency.has_value() && result.time_to_first_audio.has_value());
        assert(result.estimated_tokens > 0 && result.estimated_tokens <= requests[0].max_tokens);
        assert(result.execution.attempts == 1 && !result.execution.fallback_used);

        std::cout << "✓ Simple turn test passed" << std::endl;
    }

    void testFallbackModelIsDegraded() {
        std::cout << "Testing fallback to the next model..." << std::endl;

        MockGenerationService generation;
        generation.failing_models["balanced-medium"] = Parley::ErrorKind::TIMEOUT;
        MockSynthesisService synthesis;
        RecordingSink sink;
        Parley::CircuitBreakerRegistry breakers(m_config.breaker);
        Parley::TurnPipeline pipeline(m_registry, generation, synthesis, sink, breakers, m_config);

        Parley::ConversationContext context;
        Parley::CancellationToken token;
        auto result = pipeline.runTurn("Can you quickly confirm my appointment?", context, options(500), token);

        assert(result.routing.model_id == "balanced-medium" && "Relaxed budget routes to the balanced tier");
        assert(result.outcome == Parley::TurnOutcome::DEGRADED && "Answer from a fallback model is degraded");
        assert(result.execution.target_used.model_id == "fast-small");
        assert(sink.writes().size() == 3 && "Fallback answer is spoken in full");

        auto requests = generation.requests();
        assert(requests.size() == 2 && requests[1].model_id == "fast-small");
        assert(requests[1].reasoning_budget == 0 && "Fallback models never inherit a reasoning budget");

        std::cout << "✓ Fallback model test passed" << std::endl;
    }

    void testAllModelsFailSpeaksApology() {
        std::cout << "Testing apology when every model fails..." << std::endl;

        MockGenerationService generation;
        generation.failing_models["balanced-medium"] = Parley::ErrorKind::TIMEOUT;
        generation.failing_models["fast-small"] = Parley::ErrorKind::TIMEOUT;
        MockSynthesisService synthesis;
        RecordingSink sink;
        Parley::CircuitBreakerRegistry breakers(m_config.breaker);
        Parley::TurnPipeline pipeline(m_registry, generation, synthesis, sink, breakers, m_config);

        Parley::ConversationContext context;
        Parley::CancellationToken token;
        auto result = pipeline.runTurn("Can you quickly confirm my appointment?", context, options(500), token);

        assert(result.outcome == Parley::TurnOutcome::APOLOGY && "Exhausted chain ends in the apology");
        assert(result.error_kind == Parley::ErrorKind::TIMEOUT && "Last error is reported");
        assert(result.spoken_apology == m_config.pipeline.apology_phrase);

        auto writes = sink.writes();
        assert(writes.size() == 1 && writes[0].first == 1 && writes[0].second == m_config.pipeline.apology_phrase &&
               "The caller never hears silence");

        std::cout << "✓ Apology test passed" << std::endl;
    }

    void testPartialOutputNotRetried() {
        std::cout << "Testing failure after partial output..." << std::endl;

        MockGenerationService generation;
        generation.partial_failures.insert("balanced-medium");
        MockSynthesisService synthesis;
        RecordingSink sink;
        Parley::CircuitBreakerRegistry breakers(m_config.breaker);
        Parley::TurnPipeline pipeline(m_registry, generation, synthesis, sink, breakers, m_config);

        Parley::ConversationContext context;
        Parley::CancellationToken token;
        auto result = pipeline.runTurn("Can you quickly confirm my appointment?", context, options(500), token);

        assert(generation.requests().size() == 1 && "Spoken output is never regenerated");
        assert(result.outcome == Parley::TurnOutcome::APOLOGY);
        assert(result.dispatch.stream_error);

        auto writes = sink.writes();
        assert(writes.size() == 2 && "Completed sentence then the apology");
        assert(writes[0].first == 1 && writes[0].second == "Let me check.");
        assert(writes[1].first == 2 && writes[1].second == m_config.pipeline.apology_phrase &&
               "Apology follows the last segment");

        std::cout << "✓ Partial output test passed" << std::endl;
    }

    void testMalformedStreamAbortsTurn() {
        std::cout << "Testing malformed stream aborts the turn..." << std::endl;

        MockGenerationService generation;
        generation.malformed_models.insert("balanced-medium");
        MockSynthesisService synthesis;
        RecordingSink sink;
        Parley::CircuitBreakerRegistry breakers(m_config.breaker);
        Parley::TurnPipeline pipeline(m_registry, generation, synthesis, sink, breakers, m_config);

        Parley::ConversationContext context;
        Parley::CancellationToken token;
        auto result = pipeline.runTurn("Can you quickly confirm my appointment?", context, options(500), token);

        auto requests = generation.requests();
        assert(requests.size() == 1 && requests[0].model_id == "balanced-medium" &&
               "A segmentation failure is not handed to the next model");
        assert(result.outcome == Parley::TurnOutcome::APOLOGY);
        assert(result.error_kind == Parley::ErrorKind::SEGMENTATION_ERROR);
        assert(result.dispatch.stream_error && "Synthesis stops on the segmentation error");

        auto writes = sink.writes();
        assert(writes.size() == 1 && writes[0].first == 1 &&
               writes[0].second == m_config.pipeline.apology_phrase && "Only the apology is spoken");

        auto fallback = breakers.getBreaker("fast-small")->getSnapshot();
        assert(fallback.consecutive_failures == 0 && "Untried models are not charged a failure");

        std::cout << "✓ Malformed stream test passed" << std::endl;
    }

    void testApologyFailureIsTerminal() {
        std::cout << "Testing terminal failure when the apology cannot be spoken..." << std::endl;

        MockGenerationService generation;
        generation.failing_models["fast-small"] = Parley::ErrorKind::REQUEST_INVALID;
        MockSynthesisService synthesis;
        synthesis.fail_all = true;
        RecordingSink sink;
        Parley::CircuitBreakerRegistry breakers(m_config.breaker);
        Parley::TurnPipeline pipeline(m_registry, generation, synthesis, sink, breakers, m_config);

        Parley::ConversationContext context;
        Parley::CancellationToken token;
        auto result = pipeline.runTurn("Can you quickly confirm my appointment?", context, options(120), token);

        assert(result.outcome == Parley::TurnOutcome::FAILED && "Nothing could be spoken");
        assert(result.error_kind == Parley::ErrorKind::REQUEST_INVALID);
        assert(generation.requests().size() == 1 && "Invalid requests are not retried");
        assert(sink.writes().empty());

        std::cout << "✓ Terminal failure test passed" << std::endl;
    }

    void testRejectDegradedRouting() {
        std::cout << "Testing reject mode for degraded routing..." << std::endl;

        Parley::ModelRegistry registry;
        registry.loadFromString(kModelTable);
        registry.setFallbackRegions({});

        Parley::ParleyConfig config = m_config;
        config.pipeline.degraded_mode = Parley::DegradedMode::REJECT;

        MockGenerationService generation;
        MockSynthesisService synthesis;
        RecordingSink sink;
        Parley::CircuitBreakerRegistry breakers(config.breaker);
        Parley::TurnPipeline pipeline(registry, generation, synthesis, sink, breakers, config);

        Parley::ConversationContext context;
        Parley::CancellationToken token;
        auto turn_options = options(120);
        turn_options.preferred_region = "ap-south";
        auto result = pipeline.runTurn("Can you quickly confirm my appointment?", context, turn_options, token);

        assert(result.routing.degraded && "No configured region serves the model");
        assert(result.outcome == Parley::TurnOutcome::APOLOGY && "Reject mode apologizes");
        assert(result.error_kind == Parley::ErrorKind::SERVICE_UNAVAILABLE);
        assert(generation.requests().empty() && "No generation call in reject mode");

        // Attempt mode goes ahead with the preferred region
        Parley::ParleyConfig attempt_config = m_config;
        Parley::TurnPipeline attempt_pipeline(registry, generation, synthesis, sink, breakers, attempt_config);
        auto attempted = attempt_pipeline.runTurn("Can you quickly confirm my appointment?", context,
                                                  turn_options, token);
        assert(attempted.outcome == Parley::TurnOutcome::DEGRADED && "Degraded routing still answers");
        assert(generation.requests().size() == 1);

        std::cout << "✓ Reject mode test passed" << std::endl;
    }

    void testHangupCancelsTurn() {
        std::cout << "Testing hangup during a turn..." << std::endl;

        MockGenerationService generation;
        generation.hang_after_first_sentence = true;
        MockSynthesisService synthesis;
        RecordingSink sink;
        Parley::CircuitBreakerRegistry breakers(m_config.breaker);
        Parley::TurnPipeline pipeline(m_registry, generation, synthesis, sink, breakers, m_config);

        Parley::ConversationContext context;
        Parley::CancellationToken token;

        std::thread hangup([&token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            token.cancel();
        });

        auto start = std::chrono::steady_clock::now();
        auto result = pipeline.runTurn("Can you quickly confirm my appointment?", context, options(120), token);
        auto elapsed = std::chrono::steady_clock::now() - start;
        hangup.join();

        assert(result.outcome == Parley::TurnOutcome::CANCELLED && "Hangup cancels the turn");
        assert(generation.requests().size() == 1 && "Cancelled turns are not retried");
        assert(result.spoken_apology.empty() && "No apology after hangup");
        assert(elapsed < std::chrono::seconds(2) && "Turn stops promptly");

        size_t written = sink.writes().size();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(sink.writes().size() == written && "No audio after the turn returns");

        std::cout << "✓ Hangup test passed" << std::endl;
    }

    void testMetricsReported() {
        std::cout << "Testing metrics reporting..." << std::endl;

        auto metrics_sink = std::make_shared<RecordingMetricsSink>();
        Parley::AsyncMetricsReporter reporter(metrics_sink);

        MockGenerationService generation;
        MockSynthesisService synthesis;
        RecordingSink sink;
        Parley::CircuitBreakerRegistry breakers(m_config.breaker);
        Parley::TurnPipeline pipeline(m_registry, generation, synthesis, sink, breakers, m_config, &reporter);

        Parley::ConversationContext context;
        Parley::CancellationToken token;
        pipeline.runTurn("Can you quickly confirm my appointment?", context, options(120), token);
        reporter.flush();

        auto points = metrics_sink->points();
        auto has = [&points](const std::string& name) {
            return std::any_of(points.begin(), points.end(),
                               [&name](const Parley::MetricPoint& p) { return p.name == name; });
        };
        assert(has("turn_duration_ms") && has("first_token_ms") && has("time_to_first_audio_ms"));
        assert(points[0].call_id == "test-call" && points[0].model_id == "fast-small" && points[0].region == "us-east");
        assert(points[0].estimated_tokens > 0 && "Cost estimate travels with each point");

        std::cout << "✓ Metrics test passed" << std::endl;
    }

    void testOutcomeNames() {
        std::cout << "Testing outcome names..." << std::endl;

        assert(Parley::turnOutcomeToString(Parley::TurnOutcome::COMPLETED) == "completed");
        assert(Parley::turnOutcomeToString(Parley::TurnOutcome::DEGRADED) == "degraded");
        assert(Parley::turnOutcomeToString(Parley::TurnOutcome::CANCELLED) == "cancelled");

        std::cout << "✓ Outcome names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TurnPipeline Tests..." << std::endl;
        std::cout << "=============================" << std::endl;

        testSimpleTurnEndToEnd();
        std::cout << std::endl;

        testFallbackModelIsDegraded();
        std::cout << std::endl;

        testAllModelsFailSpeaksApology();
        std::cout << std::endl;

        testPartialOutputNotRetried();
        std::cout << std::endl;

        testMalformedStreamAbortsTurn();
        std::cout << std::endl;

        testApologyFailureIsTerminal();
        std::cout << std::endl;

        testRejectDegradedRouting();
        std::cout << std::endl;

        testHangupCancelsTurn();
        std::cout << std::endl;

        testMetricsReported();
        std::cout << std::endl;

        testOutcomeNames();
        std::cout << std::endl;

        std::cout << "All TurnPipeline tests passed!" << std::endl;
    }
};

int main() {
    try {
        TurnPipelineTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
