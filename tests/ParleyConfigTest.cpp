// =================================================================
// tests/ParleyConfigTest.cpp
// =================================================================
// Unit tests for ParleyConfig loading.

#include "Parley/ParleyConfig.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <string>

class ParleyConfigTest {
private:
    static bool hasWarningFor(const Parley::ConfigLoadResult& result, const std::string& key) {
        return std::any_of(result.warnings.begin(), result.warnings.end(),
                           [&key](const std::string& w) { return w.find(key) != std::string::npos; });
    }

public:
    void testDefaults() {
        std::cout << "Testing defaults for an empty document..." << std::endl;

        Parley::ParleyConfig config;
        auto result = config.loadFromString("");
        assert(result.success && "Empty document is valid");
        assert(result.warnings.empty());

        assert(config.pipeline.degraded_mode == Parley::DegradedMode::ATTEMPT);
        assert(config.breaker.failure_threshold == 5);
        assert(config.breaker.recovery_window == std::chrono::milliseconds(30000));
        assert(config.synthesis.max_concurrent == 3);
        assert(config.retry.max_attempts == 4);
        assert(config.scorer.context_policy == Parley::ContextPolicy::FIRST_MATCH);
        assert(config.generation_endpoint.path == "/v1/messages");
        assert(config.synthesis_endpoint.path == "/v1/speak");

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testValidValues() {
        std::cout << "Testing valid values..." << std::endl;

        Parley::ParleyConfig config;
        auto result = config.loadFromString(R"(
routing:
  reasoning_budget_tokens: 4000
  degraded_mode: reject
scorer:
  context_policy: additive
  long_history_turns: 8
  patterns: ["cancel my plan", "why"]
generation:
  base_url: "https://{region}.gen.internal"
  timeout_ms: 3000
  temperature: 0.7
  max_tokens: 200
  channel_capacity: 4
synthesis:
  voice: warm
  sample_rate: 16000
  max_concurrent: 2
  fallback_phrase: "One moment."
  apology_phrase: "Sorry about that."
resilience:
  failure_threshold: 3
  recovery_window_ms: 1500
  max_attempts: 6
  base_delay_ms: 50
  jitter_ratio: 0.1
logging:
  directory: /tmp/parley-logs
  console_level: error
  console_enabled: false
)");

        assert(result.success && result.warnings.empty() && "Every value is accepted");
        assert(config.selector.reasoning_budget_tokens == 4000);
        assert(config.pipeline.degraded_mode == Parley::DegradedMode::REJECT);
        assert(config.scorer.context_policy == Parley::ContextPolicy::ADDITIVE);
        assert(config.scorer.long_history_turns == 8 && config.scorer.patterns.size() == 2);
        assert(config.generation_endpoint.base_url == "https://{region}.gen.internal");
        assert(config.generation_endpoint.timeout_ms == 3000);
        assert(config.pipeline.temperature == 0.7 && config.pipeline.max_tokens == 200);
        assert(config.pipeline.channel_capacity == 4);
        assert(config.synthesis.voice == "warm" && config.synthesis.sample_rate == 16000);
        assert(config.synthesis.max_concurrent == 2 && config.synthesis.fallback_phrase == "One moment.");
        assert(config.pipeline.apology_phrase == "Sorry about that.");
        assert(config.breaker.failure_threshold == 3);
        assert(config.breaker.recovery_window == std::chrono::milliseconds(1500));
        assert(config.retry.max_attempts == 6 && config.retry.base_delay == std::chrono::milliseconds(50));
        assert(config.retry.jitter_ratio == 0.1);
        assert(config.logging.console_level == Parley::LogLevel::ERROR && !config.logging.console_enabled);

        std::cout << "✓ Valid values test passed" << std::endl;
    }

    void testInvalidValuesKeepDefaults() {
        std::cout << "Testing invalid values keep defaults..." << std::endl;

        Parley::ParleyConfig config;
        auto result = config.loadFromString(R"(
routing:
  degraded_mode: sometimes
scorer:
  context_policy: weighted
generation:
  timeout_ms: soon
  temperature: 2.5
synthesis:
  max_concurrent: 0
resilience:
  jitter_ratio: 3
logging:
  file_level: verbose
)");

        assert(result.success && "Invalid values are warnings, not errors");
        assert(hasWarningFor(result, "routing.degraded_mode"));
        assert(hasWarningFor(result, "scorer.context_policy"));
        assert(hasWarningFor(result, "generation.timeout_ms"));
        assert(hasWarningFor(result, "generation.temperature"));
        assert(hasWarningFor(result, "synthesis.max_concurrent"));
        assert(hasWarningFor(result, "resilience.jitter_ratio"));
        assert(hasWarningFor(result, "logging.file_level"));

        assert(config.pipeline.degraded_mode == Parley::DegradedMode::ATTEMPT && "Defaults survive");
        assert(config.scorer.context_policy == Parley::ContextPolicy::FIRST_MATCH);
        assert(config.generation_endpoint.timeout_ms == 10000);
        assert(config.pipeline.temperature == 0.3);
        assert(config.synthesis.max_concurrent == 3);
        assert(config.retry.jitter_ratio == 0.2);
        assert(config.logging.file_level == Parley::LogLevel::DEBUG);

        std::cout << "✓ Invalid values test passed" << std::endl;
    }

    void testMalformedDocuments() {
        std::cout << "Testing malformed documents..." << std::endl;

        Parley::ParleyConfig config;
        auto list_root = config.loadFromString("- just\n- a list\n");
        assert(!list_root.success && "Root must be a map");
        assert(!list_root.error_message.empty());

        auto broken = config.loadFromString("routing: [unclosed");
        assert(!broken.success && "Parse errors are reported");

        auto scalar_section = config.loadFromString("synthesis: 42\n");
        assert(scalar_section.success && hasWarningFor(scalar_section, "synthesis") &&
               "Non-map section is skipped with a warning");

        auto missing = config.loadFromFile("/nonexistent/parley.yml");
        assert(!missing.success && "Missing file fails to load");

        std::cout << "✓ Malformed documents test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing load from file..." << std::endl;

        const std::string path = "parley_config_test.yml";
        {
            std::ofstream file(path);
            file << "resilience:\n  failure_threshold: 7\nsynthesis:\n  voice: calm\n";
        }

        Parley::ParleyConfig config;
        auto result = config.loadFromFile(path);
        std::remove(path.c_str());

        assert(result.success);
        assert(config.breaker.failure_threshold == 7 && config.synthesis.voice == "calm");
        assert(Parley::degradedModeToString(Parley::DegradedMode::REJECT) == "reject");
        assert(Parley::ParleyConfig::getDefaultConfigPath() == "config/parley.yml");

        std::cout << "✓ Load from file test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ParleyConfig Tests..." << std::endl;
        std::cout << "=============================" << std::endl;

        testDefaults();
        std::cout << std::endl;

        testValidValues();
        std::cout << std::endl;

        testInvalidValuesKeepDefaults();
        std::cout << std::endl;

        testMalformedDocuments();
        std::cout << std::endl;

        testLoadFromFile();
        std::cout << std::endl;

        std::cout << "All ParleyConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        ParleyConfigTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
