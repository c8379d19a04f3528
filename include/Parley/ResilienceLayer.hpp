// =================================================================
// include/Parley/ResilienceLayer.hpp
// =================================================================
// Retry, backoff and fallback-chain execution around external calls.

#pragma once

#include "Parley/CircuitBreaker.hpp"
#include "Parley/CancellationToken.hpp"
#include "Parley/Errors.hpp"
#include "Parley/ModelRegistry.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace Parley {

/**
 * @brief Backoff and attempt limits
 */
struct RetryPolicy {
    size_t max_attempts = 4;                          ///< Calls made before giving up
    std::chrono::milliseconds base_delay{100};        ///< First backoff delay
    std::chrono::milliseconds max_delay{2000};        ///< Backoff ceiling
    double jitter_ratio = 0.2;                        ///< +/- fraction applied to each delay
};

/**
 * @brief Concrete call target
 */
struct RouteTarget {
    std::string model_id;   ///< Model id, or endpoint name for synthesis
    std::string region;
};

/**
 * @brief Per-execution switches
 */
struct ExecutionOptions {
    bool allow_same_target_retry = false;   ///< Retry the same target once the chain is exhausted
};

/**
 * @brief Outcome of a resilient execution
 */
struct ExecutionResult {
    bool success = false;
    RouteTarget target_used;               ///< Target of the last call made
    size_t attempts = 0;                   ///< Network calls made
    bool fallback_used = false;            ///< Succeeded on a target other than the primary
    ErrorKind last_error = ErrorKind::NONE;
    std::string error_message;
};

/**
 * @brief A call against one target; throws ServiceError on failure
 */
using TargetCall = std::function<void(const RouteTarget&)>;

/**
 * @brief Runs calls through breakers and a static fallback chain
 *
 * Error handling by kind:
 * - CircuitOpen: next model, no call made
 * - Timeout: next model immediately
 * - RateLimited: backoff, then next model
 * - ServiceUnavailable: next fallback region of the same model, then next model
 * - RequestInvalid, Cancelled: surfaced without retry
 * Failures after partial output are never retried.
 */
class ResilienceLayer {
public:
    /**
     * @brief Constructor
     * @param breakers Shared breaker table; must outlive the layer
     * @param registry Model table for region availability; must outlive the layer
     * @param policy Backoff and attempt limits
     */
    ResilienceLayer(CircuitBreakerRegistry& breakers, const ModelRegistry& registry,
                    const RetryPolicy& policy = RetryPolicy());

    virtual ~ResilienceLayer() = default;

    /**
     * @brief Execute a call with fallback
     * @param primary First target to try
     * @param degradation_chain Ordered fallback model ids
     * @param call Operation to run against each target
     * @param token Call cancellation
     * @param options Execution switches
     * @return Execution result; never throws for service failures
     */
    virtual ExecutionResult execute(const RouteTarget& primary,
                                    const std::vector<std::string>& degradation_chain,
                                    const TargetCall& call,
                                    CancellationToken& token,
                                    const ExecutionOptions& options = ExecutionOptions());

    /**
     * @brief Models to try in order: the primary, then the chain entries
     *        that follow it (the whole chain if the primary is not in it)
     *
     * Chain entries missing from the model table are skipped.
     */
    std::vector<std::string> buildModelChain(const std::string& primary_model,
                                             const std::vector<std::string>& degradation_chain) const;

    /**
     * @brief Jittered exponential delay for the n-th backoff (0-based)
     */
    std::chrono::milliseconds backoffDelay(size_t retry_index);

    const RetryPolicy& getPolicy() const { return m_policy; }

private:
    CircuitBreakerRegistry& m_breakers;
    const ModelRegistry& m_registry;
    RetryPolicy m_policy;

    std::mt19937 m_rng;
    std::mutex m_rng_mutex;

    /**
     * @brief Region to use for a fallback model
     */
    std::string resolveRegion(const std::string& model_id, const std::string& preferred_region) const;

    /**
     * @brief Next untried fallback region serving the model, or empty
     */
    std::string nextRegion(const std::string& model_id, const std::vector<std::string>& tried) const;
};

} // namespace Parley
