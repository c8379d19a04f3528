// =================================================================
// include/Parley/Errors.hpp
// =================================================================
// Error taxonomy shared by the generation and synthesis paths.

#pragma once

#include <stdexcept>
#include <string>

namespace Parley {

/**
 * @brief Classification of failures from external services
 */
enum class ErrorKind {
    NONE,                ///< No error
    RATE_LIMITED,        ///< Provider throttled the request
    SERVICE_UNAVAILABLE, ///< Provider or region is down or overloaded
    REQUEST_INVALID,     ///< Request rejected as malformed, never retried
    TIMEOUT,             ///< Call exceeded its deadline
    CIRCUIT_OPEN,        ///< Rejected locally by an open circuit breaker
    SEGMENTATION_ERROR,  ///< Malformed stream data
    CANCELLED,           ///< Call session ended while the call was outstanding
    UNKNOWN              ///< Anything else
};

/**
 * @brief Exception raised by service clients
 *
 * `partial_output` is set when the failure happened after content had
 * already been forwarded downstream; such failures cannot be replayed on
 * another model without repeating speech.
 */
class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorKind kind, const std::string& message, bool partial_output = false)
        : std::runtime_error(message), m_kind(kind), m_partial_output(partial_output) {}

    ErrorKind kind() const { return m_kind; }
    bool partialOutput() const { return m_partial_output; }

private:
    ErrorKind m_kind;
    bool m_partial_output;
};

/**
 * @brief Human-readable name of an error kind
 */
std::string errorKindToString(ErrorKind kind);

/**
 * @brief Map an HTTP status code to the taxonomy
 * @param status HTTP status code
 * @return ErrorKind::NONE for 2xx, UNKNOWN for unmapped codes
 */
ErrorKind classifyHttpStatus(int status);

/**
 * @brief Map a provider error type string (e.g. "rate_limit_error")
 */
ErrorKind classifyProviderError(const std::string& error_type);

/**
 * @brief Whether a failure of this kind should count against a circuit breaker
 */
bool countsAsBreakerFailure(ErrorKind kind);

} // namespace Parley
