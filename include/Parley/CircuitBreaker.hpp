// =================================================================
// include/Parley/CircuitBreaker.hpp
// =================================================================
// Per-target circuit breakers shared by every call in the process.

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Parley {

/**
 * @brief Breaker state
 */
enum class CircuitState {
    CLOSED,     ///< Calls pass through
    OPEN,       ///< Calls fail locally without a network attempt
    HALF_OPEN   ///< One trial call is permitted
};

std::string circuitStateToString(CircuitState state);

/**
 * @brief Breaker thresholds
 */
struct BreakerConfig {
    size_t failure_threshold = 5;                          ///< Consecutive failures that open the circuit
    std::chrono::milliseconds recovery_window{30000};      ///< Time open before a trial is allowed
};

/**
 * @brief Point-in-time copy of a breaker's state
 */
struct BreakerSnapshot {
    CircuitState state = CircuitState::CLOSED;
    size_t consecutive_failures = 0;
    size_t success_count = 0;
    std::optional<std::chrono::steady_clock::time_point> last_failure;
    bool trial_in_flight = false;
};

/**
 * @brief Closed/Open/HalfOpen state machine for one call target
 *
 * Every method locks the breaker's mutex, so concurrent failures from
 * different calls are never lost.
 */
class CircuitBreaker {
public:
    /**
     * @brief Constructor
     * @param target Target name (model id or endpoint)
     * @param config Thresholds
     */
    CircuitBreaker(const std::string& target, const BreakerConfig& config = BreakerConfig());

    /**
     * @brief Ask permission for a call
     *
     * Open transitions to HalfOpen once the recovery window has elapsed
     * since the last failure; the caller that triggers the transition gets
     * the single trial slot.
     *
     * @return False if the call must fail with CircuitOpen
     */
    bool allowRequest();

    /**
     * @brief Record a successful call; closes a half-open circuit
     */
    void recordSuccess();

    /**
     * @brief Record a failed call; may open the circuit
     */
    void recordFailure();

    /**
     * @brief Give back a trial slot after a call that neither succeeded nor failed
     */
    void releaseTrial();

    CircuitState getState() const;
    BreakerSnapshot getSnapshot() const;
    const std::string& getTarget() const { return m_target; }

    /**
     * @brief Force the breaker back to Closed with zero failures
     */
    void reset();

private:
    const std::string m_target;
    const BreakerConfig m_config;

    mutable std::mutex m_mutex;
    CircuitState m_state = CircuitState::CLOSED;
    size_t m_consecutive_failures = 0;
    size_t m_success_count = 0;
    std::optional<std::chrono::steady_clock::time_point> m_last_failure;
    bool m_trial_in_flight = false;

    void transitionTo(CircuitState next);
};

/**
 * @brief Table of breakers keyed by target, created on first use
 *
 * Owned by the application and injected where needed; breakers live as
 * long as the registry.
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(const BreakerConfig& config = BreakerConfig());

    /**
     * @brief Breaker for a target, creating it if needed
     */
    std::shared_ptr<CircuitBreaker> getBreaker(const std::string& target);

    std::vector<std::string> getTargets() const;
    size_t size() const;
    void resetAll();

    const BreakerConfig& getConfig() const { return m_config; }

private:
    BreakerConfig m_config;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> m_breakers;
};

} // namespace Parley
