// =================================================================
// src/Parley/ResilienceLayer.cpp
// =================================================================
// Implementation of resilient execution over a fallback chain.

#include "Parley/ResilienceLayer.hpp"
#include "Parley/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Parley {

ResilienceLayer::ResilienceLayer(CircuitBreakerRegistry& breakers, const ModelRegistry& registry,
                                 const RetryPolicy& policy)
    : m_breakers(breakers), m_registry(registry), m_policy(policy),
      m_rng(std::random_device{}()) {
    if (m_policy.max_attempts == 0) {
        m_policy.max_attempts = 1;
    }
}

std::vector<std::string> ResilienceLayer::buildModelChain(const std::string& primary_model,
                                                          const std::vector<std::string>& degradation_chain) const {
    std::vector<std::string> models = {primary_model};

    auto start = std::find(degradation_chain.begin(), degradation_chain.end(), primary_model);
    start = (start == degradation_chain.end()) ? degradation_chain.begin() : start + 1;

    for (auto it = start; it != degradation_chain.end(); ++it) {
        if (std::find(models.begin(), models.end(), *it) != models.end()) {
            continue;
        }
        if (!m_registry.findProfile(*it)) {
            continue;
        }
        models.push_back(*it);
    }
    return models;
}

std::chrono::milliseconds ResilienceLayer::backoffDelay(size_t retry_index) {
    double delay = static_cast<double>(m_policy.base_delay.count()) * std::pow(2.0, static_cast<double>(retry_index));
    delay = std::min(delay, static_cast<double>(m_policy.max_delay.count()));

    double jitter = 0.0;
    if (m_policy.jitter_ratio > 0.0) {
        std::lock_guard<std::mutex> lock(m_rng_mutex);
        std::uniform_real_distribution<double> distribution(-m_policy.jitter_ratio, m_policy.jitter_ratio);
        jitter = distribution(m_rng);
    }

    delay = std::max(0.0, delay * (1.0 + jitter));
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

std::string ResilienceLayer::resolveRegion(const std::string& model_id, const std::string& preferred_region) const {
    auto profile = m_registry.findProfile(model_id);
    if (!profile) {
        return preferred_region;
    }
    if (profile->isAvailableIn(preferred_region)) {
        return preferred_region;
    }
    for (const auto& region : m_registry.getFallbackRegions()) {
        if (profile->isAvailableIn(region)) {
            return region;
        }
    }
    return profile->regions.empty() ? preferred_region : profile->regions.front();
}

std::string ResilienceLayer::nextRegion(const std::string& model_id, const std::vector<std::string>& tried) const {
    for (const auto& region : m_registry.getFallbackRegions()) {
        if (std::find(tried.begin(), tried.end(), region) != tried.end()) {
            continue;
        }
        if (m_registry.isAvailable(model_id, region)) {
            return region;
        }
    }
    return "";
}

ExecutionResult ResilienceLayer::execute(const RouteTarget& primary,
                                         const std::vector<std::string>& degradation_chain,
                                         const TargetCall& call,
                                         CancellationToken& token,
                                         const ExecutionOptions& options) {
    auto& logger = Logger::getInstance();

    ExecutionResult result;
    result.target_used = primary;

    const auto models = buildModelChain(primary.model_id, degradation_chain);
    size_t model_index = 0;
    RouteTarget target = primary;
    std::vector<std::string> tried_regions = {primary.region};
    size_t retry_index = 0;

    auto advance = [&]() {
        if (model_index + 1 >= models.size()) {
            return false;
        }
        model_index++;
        target.model_id = models[model_index];
        target.region = resolveRegion(target.model_id, primary.region);
        tried_regions = {target.region};
        logger.info("ResilienceLayer", "Falling back to " + target.model_id + " in " + target.region);
        return true;
    };

    // False if the call was cancelled while waiting
    auto backoff = [&]() {
        auto delay = backoffDelay(retry_index++);
        logger.debug("ResilienceLayer", "Backing off " + std::to_string(delay.count()) + "ms");
        return !token.waitFor(delay);
    };

    auto cancelled = [&result]() {
        result.last_error = ErrorKind::CANCELLED;
        result.error_message = "Call cancelled";
        return result;
    };

    while (result.attempts < m_policy.max_attempts) {
        if (token.isCancelled()) {
            return cancelled();
        }

        auto breaker = m_breakers.getBreaker(target.model_id);
        if (!breaker->allowRequest()) {
            result.last_error = ErrorKind::CIRCUIT_OPEN;
            result.error_message = "Circuit open for " + target.model_id;
            logger.warning("ResilienceLayer", result.error_message);
            if (!advance()) {
                break;
            }
            continue;
        }

        result.attempts++;
        result.target_used = target;

        ErrorKind kind = ErrorKind::UNKNOWN;
        std::string message;
        bool partial_output = false;

        try {
            call(target);

            breaker->recordSuccess();
            logger.logGenerationAttempt(target.model_id, target.region, result.attempts, true);

            result.success = true;
            result.last_error = ErrorKind::NONE;
            result.error_message.clear();
            result.fallback_used = target.model_id != primary.model_id || target.region != primary.region;
            return result;

        } catch (const ServiceError& e) {
            kind = e.kind();
            message = e.what();
            partial_output = e.partialOutput();
        } catch (const std::exception& e) {
            kind = ErrorKind::UNKNOWN;
            message = e.what();
        }

        if (countsAsBreakerFailure(kind)) {
            breaker->recordFailure();
        } else {
            breaker->releaseTrial();
        }

        logger.logGenerationAttempt(target.model_id, target.region, result.attempts, false,
                                    errorKindToString(kind) + ": " + message);
        result.last_error = kind;
        result.error_message = message;

        if (kind == ErrorKind::CANCELLED) {
            return result;
        }
        if (kind == ErrorKind::REQUEST_INVALID) {
            logger.error("ResilienceLayer", "Request rejected as invalid by " + target.model_id, message);
            return result;
        }
        if (partial_output) {
            logger.warning("ResilienceLayer", "Failure after partial output, not retrying", message);
            return result;
        }

        bool moved = false;
        bool backed_off = false;
        switch (kind) {
            case ErrorKind::SERVICE_UNAVAILABLE: {
                std::string region = nextRegion(target.model_id, tried_regions);
                if (!region.empty()) {
                    logger.info("ResilienceLayer", "Trying " + target.model_id + " in fallback region " + region);
                    target.region = region;
                    tried_regions.push_back(region);
                    moved = true;
                } else {
                    moved = advance();
                }
                break;
            }
            case ErrorKind::TIMEOUT:
            case ErrorKind::CIRCUIT_OPEN:
                moved = advance();
                break;
            default:
                if (!backoff()) {
                    return cancelled();
                }
                backed_off = true;
                moved = advance();
                break;
        }

        if (!moved) {
            if (!options.allow_same_target_retry) {
                break;
            }
            if (!backed_off && !backoff()) {
                return cancelled();
            }
        }
    }

    logger.error("ResilienceLayer", "All attempts failed for " + primary.model_id +
                 " after " + std::to_string(result.attempts) + " calls", result.error_message);
    return result;
}

} // namespace Parley
