// =================================================================
// src/Parley/CircuitBreaker.cpp
// =================================================================
// Implementation of circuit breakers and their registry.

#include "Parley/CircuitBreaker.hpp"
#include "Parley/Logger.hpp"

namespace Parley {

std::string circuitStateToString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "closed";
        case CircuitState::OPEN: return "open";
        case CircuitState::HALF_OPEN: return "half_open";
        default: return "unknown";
    }
}

CircuitBreaker::CircuitBreaker(const std::string& target, const BreakerConfig& config)
    : m_target(target), m_config(config) {
}

bool CircuitBreaker::allowRequest() {
    std::lock_guard<std::mutex> lock(m_mutex);

    switch (m_state) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN: {
            auto now = std::chrono::steady_clock::now();
            if (m_last_failure && now - *m_last_failure > m_config.recovery_window) {
                transitionTo(CircuitState::HALF_OPEN);
                m_trial_in_flight = true;
                return true;
            }
            return false;
        }

        case CircuitState::HALF_OPEN:
            if (m_trial_in_flight) {
                return false;
            }
            m_trial_in_flight = true;
            return true;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_success_count++;
    m_consecutive_failures = 0;
    m_trial_in_flight = false;
    if (m_state != CircuitState::CLOSED) {
        transitionTo(CircuitState::CLOSED);
    }
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_consecutive_failures++;
    m_last_failure = std::chrono::steady_clock::now();
    m_trial_in_flight = false;

    if (m_state == CircuitState::HALF_OPEN) {
        transitionTo(CircuitState::OPEN);
    } else if (m_state == CircuitState::CLOSED &&
               m_consecutive_failures >= m_config.failure_threshold) {
        transitionTo(CircuitState::OPEN);
    }
}

void CircuitBreaker::releaseTrial() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_trial_in_flight = false;
}

CircuitState CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

BreakerSnapshot CircuitBreaker::getSnapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    BreakerSnapshot snapshot;
    snapshot.state = m_state;
    snapshot.consecutive_failures = m_consecutive_failures;
    snapshot.success_count = m_success_count;
    snapshot.last_failure = m_last_failure;
    snapshot.trial_in_flight = m_trial_in_flight;
    return snapshot;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_consecutive_failures = 0;
    m_trial_in_flight = false;
    m_last_failure.reset();
    if (m_state != CircuitState::CLOSED) {
        transitionTo(CircuitState::CLOSED);
    }
}

// Caller holds m_mutex
void CircuitBreaker::transitionTo(CircuitState next) {
    CircuitState previous = m_state;
    m_state = next;
    Logger::getInstance().logBreakerTransition(m_target, circuitStateToString(previous),
                                               circuitStateToString(next));
}

CircuitBreakerRegistry::CircuitBreakerRegistry(const BreakerConfig& config)
    : m_config(config) {
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::getBreaker(const std::string& target) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_breakers.find(target);
    if (it != m_breakers.end()) {
        return it->second;
    }
    auto breaker = std::make_shared<CircuitBreaker>(target, m_config);
    m_breakers.emplace(target, breaker);
    return breaker;
}

std::vector<std::string> CircuitBreakerRegistry::getTargets() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> targets;
    for (const auto& [target, breaker] : m_breakers) {
        targets.push_back(target);
    }
    return targets;
}

size_t CircuitBreakerRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_breakers.size();
}

void CircuitBreakerRegistry::resetAll() {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [target, breaker] : m_breakers) {
            breakers.push_back(breaker);
        }
    }
    for (auto& breaker : breakers) {
        breaker->reset();
    }
}

} // namespace Parley
