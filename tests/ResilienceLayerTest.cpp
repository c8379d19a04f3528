// =================================================================
// tests/ResilienceLayerTest.cpp
// =================================================================
// Unit tests for ResilienceLayer component.

#include "Parley/ResilienceLayer.hpp"
#include "Parley/CircuitBreaker.hpp"
#include "Parley/ModelRegistry.hpp"
#include <iostream>
#include <cassert>
#include <chrono>
#include <utility>
#include <vector>

namespace {

const char* kModelTable = R"(
models:
  flagship:
    tier: flagship
    intelligence_rank: 3
    max_output_tokens: 4096
    regions: [us-east]
  capable:
    tier: capable
    intelligence_rank: 2
    max_output_tokens: 4096
    regions: [us-east, us-west]
  fast:
    tier: fast
    intelligence_rank: 1
    max_output_tokens: 1024
    regions: [us-east, eu-west]

routing:
  fallback_regions: [us-east, us-west, eu-west]
  degradation_chain: [flagship, capable, fast]
)";

using Call = std::pair<std::string, std::string>;

} // namespace

class ResilienceLayerTest {
private:
    Parley::ModelRegistry m_registry;

    Parley::RetryPolicy quickPolicy() {
        Parley::RetryPolicy policy;
        policy.max_attempts = 4;
        policy.base_delay = std::chrono::milliseconds(1);
        policy.max_delay = std::chrono::milliseconds(5);
        policy.jitter_ratio = 0.0;
        return policy;
    }

    static Parley::RouteTarget target(const std::string& model, const std::string& region) {
        Parley::RouteTarget t;
        t.model_id = model;
        t.region = region;
        return t;
    }

public:
    ResilienceLayerTest() {
        auto status = m_registry.loadFromString(kModelTable);
        assert(status.success && status.successfully_loaded == 3 && "Test model table should load");
    }

    void testSuccessFirstTry() {
        std::cout << "Testing success on first try..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::ResilienceLayer layer(breakers, m_registry, quickPolicy());
        Parley::CancellationToken token;

        std::vector<Call> calls;
        auto result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget& t) { calls.emplace_back(t.model_id, t.region); }, token);

        assert(result.success && result.attempts == 1 && !result.fallback_used);
        assert(calls.size() == 1 && calls[0].first == "flagship");
        assert(breakers.getBreaker("flagship")->getSnapshot().success_count == 1 && "Success is recorded");

        std::cout << "✓ Success on first try test passed" << std::endl;
    }

    void testTimeoutFallsBackToNextModel() {
        std::cout << "Testing timeout fallback..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::RetryPolicy policy = quickPolicy();
        policy.base_delay = std::chrono::milliseconds(500);
        policy.max_delay = std::chrono::milliseconds(500);
        Parley::ResilienceLayer layer(breakers, m_registry, policy);
        Parley::CancellationToken token;

        std::vector<Call> calls;
        auto start = std::chrono::steady_clock::now();
        auto result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget& t) {
                calls.emplace_back(t.model_id, t.region);
                if (t.model_id == "flagship") {
                    throw Parley::ServiceError(Parley::ErrorKind::TIMEOUT, "deadline exceeded");
                }
            }, token);
        auto elapsed = std::chrono::steady_clock::now() - start;

        assert(result.success && result.fallback_used && "Next model answers");
        assert(calls.size() == 2 && calls[1].first == "capable" && "Timeout moves down the chain");
        assert(result.target_used.model_id == "capable");
        assert(elapsed < std::chrono::milliseconds(400) && "No backoff before a timeout fallback");
        assert(breakers.getBreaker("flagship")->getSnapshot().consecutive_failures == 1 &&
               "Timeout counts as a breaker failure");

        std::cout << "✓ Timeout fallback test passed" << std::endl;
    }

    void testServiceUnavailableTriesRegions() {
        std::cout << "Testing region fallback on service unavailable..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::ResilienceLayer layer(breakers, m_registry, quickPolicy());
        Parley::CancellationToken token;

        std::vector<Call> calls;
        auto result = layer.execute(target("capable", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget& t) {
                calls.emplace_back(t.model_id, t.region);
                if (t.region == "us-east") {
                    throw Parley::ServiceError(Parley::ErrorKind::SERVICE_UNAVAILABLE, "503");
                }
            }, token);

        assert(result.success && "Fallback region answers");
        assert(calls.size() == 2 && calls[1] == Call("capable", "us-west") && "Same model, next region");
        assert(result.fallback_used && "A different region is a fallback");

        // flagship is only served in us-east, so the next model is tried
        calls.clear();
        result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget& t) {
                calls.emplace_back(t.model_id, t.region);
                if (t.model_id == "flagship") {
                    throw Parley::ServiceError(Parley::ErrorKind::SERVICE_UNAVAILABLE, "overloaded");
                }
            }, token);
        assert(result.success && calls.size() == 2 && calls[1] == Call("capable", "us-east") &&
               "No other region for the model, next model in the preferred region");

        std::cout << "✓ Region fallback test passed" << std::endl;
    }

    void testRateLimitBacksOff() {
        std::cout << "Testing rate limit backoff..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::RetryPolicy policy = quickPolicy();
        policy.base_delay = std::chrono::milliseconds(40);
        policy.max_delay = std::chrono::milliseconds(40);
        Parley::ResilienceLayer layer(breakers, m_registry, policy);
        Parley::CancellationToken token;

        std::vector<Call> calls;
        auto start = std::chrono::steady_clock::now();
        auto result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget& t) {
                calls.emplace_back(t.model_id, t.region);
                if (t.model_id == "flagship") {
                    throw Parley::ServiceError(Parley::ErrorKind::RATE_LIMITED, "429");
                }
            }, token);
        auto elapsed = std::chrono::steady_clock::now() - start;

        assert(result.success && calls.size() == 2 && calls[1].first == "capable" && "Next model after backoff");
        assert(elapsed >= std::chrono::milliseconds(35) && "Backoff delay before the fallback call");

        std::cout << "✓ Rate limit backoff test passed" << std::endl;
    }

    void testRequestInvalidNotRetried() {
        std::cout << "Testing request invalid is surfaced..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::ResilienceLayer layer(breakers, m_registry, quickPolicy());
        Parley::CancellationToken token;

        int calls = 0;
        auto result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget&) {
                calls++;
                throw Parley::ServiceError(Parley::ErrorKind::REQUEST_INVALID, "bad schema");
            }, token);

        assert(!result.success && calls == 1 && "Invalid requests are never retried");
        assert(result.last_error == Parley::ErrorKind::REQUEST_INVALID);
        assert(result.error_message == "bad schema");
        assert(breakers.getBreaker("flagship")->getSnapshot().consecutive_failures == 0 &&
               "Invalid requests do not count against the breaker");

        std::cout << "✓ Request invalid test passed" << std::endl;
    }

    void testOpenCircuitSkipsTarget() {
        std::cout << "Testing open circuit skips target..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        auto flagship = breakers.getBreaker("flagship");
        for (int i = 0; i < 5; ++i) {
            flagship->recordFailure();
        }

        Parley::ResilienceLayer layer(breakers, m_registry, quickPolicy());
        Parley::CancellationToken token;

        std::vector<Call> calls;
        auto result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget& t) { calls.emplace_back(t.model_id, t.region); }, token);

        assert(result.success && "Next model answers");
        assert(calls.size() == 1 && calls[0].first == "capable" && "Open target gets no network call");
        assert(result.attempts == 1 && "Skipping an open circuit is not an attempt");

        // Every model open: CircuitOpen is surfaced
        for (const auto& id : {"capable", "fast"}) {
            auto breaker = breakers.getBreaker(id);
            for (int i = 0; i < 5; ++i) {
                breaker->recordFailure();
            }
        }
        calls.clear();
        result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget& t) { calls.emplace_back(t.model_id, t.region); }, token);
        assert(!result.success && calls.empty() && result.attempts == 0);
        assert(result.last_error == Parley::ErrorKind::CIRCUIT_OPEN);

        std::cout << "✓ Open circuit test passed" << std::endl;
    }

    void testCancellation() {
        std::cout << "Testing cancellation..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::RetryPolicy policy = quickPolicy();
        policy.base_delay = std::chrono::seconds(10);
        policy.max_delay = std::chrono::seconds(10);
        Parley::ResilienceLayer layer(breakers, m_registry, policy);

        Parley::CancellationToken already;
        already.cancel();
        int calls = 0;
        auto result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget&) { calls++; }, already);
        assert(!result.success && calls == 0 && result.last_error == Parley::ErrorKind::CANCELLED);

        // Hangup while waiting out a backoff
        Parley::CancellationToken token;
        auto start = std::chrono::steady_clock::now();
        result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget&) {
                token.cancel();
                throw Parley::ServiceError(Parley::ErrorKind::RATE_LIMITED, "429");
            }, token);
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(result.last_error == Parley::ErrorKind::CANCELLED && "Cancellation ends the backoff");
        assert(elapsed < std::chrono::seconds(1) && "Backoff does not outlive the call");

        std::cout << "✓ Cancellation test passed" << std::endl;
    }

    void testPartialOutputNotRetried() {
        std::cout << "Testing failure after partial output..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::ResilienceLayer layer(breakers, m_registry, quickPolicy());
        Parley::CancellationToken token;

        int calls = 0;
        auto result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget&) {
                calls++;
                throw Parley::ServiceError(Parley::ErrorKind::TIMEOUT, "stream stalled", true);
            }, token);

        assert(!result.success && calls == 1 && "Spoken text cannot be taken back, no retry");
        assert(result.last_error == Parley::ErrorKind::TIMEOUT);

        std::cout << "✓ Partial output test passed" << std::endl;
    }

    void testAttemptLimit() {
        std::cout << "Testing attempt limit..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::RetryPolicy policy = quickPolicy();
        policy.max_attempts = 2;
        Parley::ResilienceLayer layer(breakers, m_registry, policy);
        Parley::CancellationToken token;

        int calls = 0;
        auto result = layer.execute(target("flagship", "us-east"), m_registry.getDegradationChain(),
            [&](const Parley::RouteTarget&) {
                calls++;
                throw Parley::ServiceError(Parley::ErrorKind::TIMEOUT, "slow");
            }, token);

        assert(!result.success && calls == 2 && result.attempts == 2 && "Bounded number of calls");

        std::cout << "✓ Attempt limit test passed" << std::endl;
    }

    void testSameTargetRetry() {
        std::cout << "Testing same-target retry..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::ResilienceLayer layer(breakers, m_registry, quickPolicy());
        Parley::CancellationToken token;

        int calls = 0;
        auto flaky = [&](const Parley::RouteTarget& t) {
            assert(t.model_id == "synthesis" && "Single-target execution stays on its target");
            if (++calls < 3) {
                throw Parley::ServiceError(Parley::ErrorKind::SERVICE_UNAVAILABLE, "busy");
            }
        };

        Parley::ExecutionOptions options;
        options.allow_same_target_retry = true;
        auto result = layer.execute(target("synthesis", ""), {}, flaky, token, options);
        assert(result.success && calls == 3 && "Retried on the same target");

        calls = 0;
        result = layer.execute(target("synthesis", ""), {}, flaky, token);
        assert(!result.success && calls == 1 && "Without the option the chain simply ends");

        std::cout << "✓ Same-target retry test passed" << std::endl;
    }

    void testModelChain() {
        std::cout << "Testing model chain construction..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::ResilienceLayer layer(breakers, m_registry, quickPolicy());

        auto mid = layer.buildModelChain("capable", {"flagship", "capable", "fast"});
        assert(mid.size() == 2 && mid[0] == "capable" && mid[1] == "fast" && "Only cheaper models follow");

        auto absent = layer.buildModelChain("other", {"flagship", "ghost", "capable", "flagship"});
        assert(absent.size() == 3 && absent[0] == "other" && absent[1] == "flagship" && absent[2] == "capable" &&
               "Unknown and repeated entries are skipped");

        std::cout << "✓ Model chain test passed" << std::endl;
    }

    void testBackoffDelay() {
        std::cout << "Testing backoff delay..." << std::endl;

        Parley::CircuitBreakerRegistry breakers;
        Parley::RetryPolicy policy;
        policy.base_delay = std::chrono::milliseconds(100);
        policy.max_delay = std::chrono::milliseconds(1000);
        policy.jitter_ratio = 0.0;
        Parley::ResilienceLayer exact(breakers, m_registry, policy);

        assert(exact.backoffDelay(0).count() == 100);
        assert(exact.backoffDelay(1).count() == 200);
        assert(exact.backoffDelay(3).count() == 800);
        assert(exact.backoffDelay(4).count() == 1000 && "Delay is capped");

        policy.jitter_ratio = 0.2;
        Parley::ResilienceLayer jittered(breakers, m_registry, policy);
        for (int i = 0; i < 50; ++i) {
            auto delay = jittered.backoffDelay(1).count();
            assert(delay >= 160 && delay <= 240 && "Jitter stays within the ratio");
        }

        std::cout << "✓ Backoff delay test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ResilienceLayer Tests..." << std::endl;
        std::cout << "================================" << std::endl;

        testSuccessFirstTry();
        std::cout << std::endl;

        testTimeoutFallsBackToNextModel();
        std::cout << std::endl;

        testServiceUnavailableTriesRegions();
        std::cout << std::endl;

        testRateLimitBacksOff();
        std::cout << std::endl;

        testRequestInvalidNotRetried();
        std::cout << std::endl;

        testOpenCircuitSkipsTarget();
        std::cout << std::endl;

        testCancellation();
        std::cout << std::endl;

        testPartialOutputNotRetried();
        std::cout << std::endl;

        testAttemptLimit();
        std::cout << std::endl;

        testSameTargetRetry();
        std::cout << std::endl;

        testModelChain();
        std::cout << std::endl;

        testBackoffDelay();
        std::cout << std::endl;

        std::cout << "All ResilienceLayer tests passed!" << std::endl;
    }
};

int main() {
    try {
        ResilienceLayerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
