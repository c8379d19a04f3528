// =================================================================
// src/Parley/Errors.cpp
// =================================================================
// Implementation of the error taxonomy helpers.

#include "Parley/Errors.hpp"

namespace Parley {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::RATE_LIMITED: return "RATE_LIMITED";
        case ErrorKind::SERVICE_UNAVAILABLE: return "SERVICE_UNAVAILABLE";
        case ErrorKind::REQUEST_INVALID: return "REQUEST_INVALID";
        case ErrorKind::TIMEOUT: return "TIMEOUT";
        case ErrorKind::CIRCUIT_OPEN: return "CIRCUIT_OPEN";
        case ErrorKind::SEGMENTATION_ERROR: return "SEGMENTATION_ERROR";
        case ErrorKind::CANCELLED: return "CANCELLED";
        case ErrorKind::UNKNOWN: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

ErrorKind classifyHttpStatus(int status) {
    if (status >= 200 && status < 300) {
        return ErrorKind::NONE;
    }

    switch (status) {
        case 429:
            return ErrorKind::RATE_LIMITED;
        case 500:
        case 502:
        case 503:
        case 529: // provider "overloaded"
            return ErrorKind::SERVICE_UNAVAILABLE;
        case 400:
        case 404:
        case 413:
        case 422:
            return ErrorKind::REQUEST_INVALID;
        case 408:
        case 504:
            return ErrorKind::TIMEOUT;
        default:
            return ErrorKind::UNKNOWN;
    }
}

ErrorKind classifyProviderError(const std::string& error_type) {
    if (error_type == "rate_limit_error") return ErrorKind::RATE_LIMITED;
    if (error_type == "overloaded_error" || error_type == "api_error") return ErrorKind::SERVICE_UNAVAILABLE;
    if (error_type == "invalid_request_error") return ErrorKind::REQUEST_INVALID;
    if (error_type == "timeout_error") return ErrorKind::TIMEOUT;
    return ErrorKind::UNKNOWN;
}

bool countsAsBreakerFailure(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RATE_LIMITED:
        case ErrorKind::SERVICE_UNAVAILABLE:
        case ErrorKind::TIMEOUT:
        case ErrorKind::SEGMENTATION_ERROR:
        case ErrorKind::UNKNOWN:
            return true;
        default:
            return false;
    }
}

} // namespace Parley
