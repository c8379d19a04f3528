// =================================================================
// src/Parley/HttpClients.cpp
// =================================================================
// HTTP generation and synthesis clients built on cpp-httplib.

#include "Parley/HttpClients.hpp"
#include "Parley/Errors.hpp"
#include "Parley/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <exception>

namespace Parley {

namespace {

ErrorKind classifyTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
        case httplib::Error::SSLConnection:
            return ErrorKind::SERVICE_UNAVAILABLE;
        case httplib::Error::Read:
        case httplib::Error::Write:
            return ErrorKind::TIMEOUT;
        case httplib::Error::Canceled:
            return ErrorKind::CANCELLED;
        default:
            return ErrorKind::UNKNOWN;
    }
}

void applyTimeouts(httplib::Client& client, const HttpEndpointConfig& config) {
    client.set_connection_timeout(config.connect_timeout_ms / 1000, (config.connect_timeout_ms % 1000) * 1000);
    client.set_read_timeout(config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000);
    client.set_write_timeout(config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000);
}

// Maps a non-2xx response to an error, using the provider's error type
// when the status code alone does not classify it.
ServiceError errorFromResponse(int status, const std::string& body, const std::string& service) {
    ErrorKind kind = classifyHttpStatus(status);
    std::string message = service + " returned status " + std::to_string(status);

    try {
        auto json_body = nlohmann::json::parse(body);
        if (json_body.contains("error") && json_body["error"].is_object()) {
            const auto& error = json_body["error"];
            if (kind == ErrorKind::UNKNOWN && error.contains("type")) {
                kind = classifyProviderError(error["type"].get<std::string>());
            }
            if (error.contains("message")) {
                message += ": " + error["message"].get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception&) {
        if (!body.empty()) {
            message += ": " + body.substr(0, 200);
        }
    }

    return ServiceError(kind, message);
}

} // namespace

// =================================================================
// SseStreamParser
// =================================================================

SseStreamParser::SseStreamParser(const DeltaCallback& on_delta)
    : m_on_delta(on_delta) {
}

void SseStreamParser::feed(const std::string& chunk) {
    m_pending += chunk;

    size_t newline = m_pending.find('\n');
    while (newline != std::string::npos) {
        std::string line = m_pending.substr(0, newline);
        m_pending.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        handleLine(line);
        newline = m_pending.find('\n');
    }
}

void SseStreamParser::handleLine(const std::string& line) {
    // Only data lines carry payloads; "event:" names are repeated in the JSON
    const std::string prefix = "data:";
    if (line.compare(0, prefix.size(), prefix) != 0 || m_saw_end) {
        return;
    }

    std::string payload = line.substr(prefix.size());
    if (!payload.empty() && payload.front() == ' ') {
        payload.erase(0, 1);
    }
    if (payload.empty() || payload == "[DONE]") {
        return;
    }

    nlohmann::json event;
    try {
        event = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& e) {
        throw ServiceError(ErrorKind::SEGMENTATION_ERROR,
                           "Malformed stream event: " + std::string(e.what()), m_saw_content);
    }

    const std::string type = event.value("type", "");

    if (type == "content_block_delta") {
        const auto& delta = event["delta"];
        if (delta.is_object() && delta.value("type", "") == "text_delta") {
            m_saw_content = true;
            m_on_delta(StreamDelta::content(delta.value("text", "")));
        }
    } else if (type == "message_stop") {
        m_saw_end = true;
        m_on_delta(StreamDelta::end());
    } else if (type == "error") {
        std::string error_type = "api_error";
        std::string message = "Provider stream error";
        if (event.contains("error") && event["error"].is_object()) {
            error_type = event["error"].value("type", error_type);
            message = event["error"].value("message", message);
        }
        throw ServiceError(classifyProviderError(error_type), message, m_saw_content);
    }
}

// =================================================================
// HttpGenerationService
// =================================================================

HttpGenerationService::HttpGenerationService(const HttpEndpointConfig& config)
    : m_config(config) {
}

std::string HttpGenerationService::resolveBaseUrl(const std::string& region) const {
    std::string url = m_config.base_url;
    const std::string placeholder = "{region}";
    size_t pos = url.find(placeholder);
    if (pos != std::string::npos) {
        url.replace(pos, placeholder.size(), region);
    }
    return url;
}

void HttpGenerationService::streamGeneration(const GenerationRequest& request,
                                             const DeltaCallback& on_delta,
                                             CancellationToken& token) {
    const std::string base_url = resolveBaseUrl(request.region);
    httplib::Client client(base_url);
    applyTimeouts(client, m_config);

    Logger::getInstance().debug("HttpGenerationService",
        "Streaming from " + base_url + m_config.path, request.model_id);

    SseStreamParser parser(on_delta);
    int status = 0;
    std::string error_body;
    std::exception_ptr failure;

    httplib::Request http_request;
    http_request.method = "POST";
    http_request.path = m_config.path;
    http_request.headers = {{"Accept", "text/event-stream"}};
    http_request.set_header("Content-Type", "application/json");
    http_request.body = request.toJson().dump();

    http_request.response_handler = [&status](const httplib::Response& response) {
        status = response.status;
        return true;
    };

    // Exceptions must not cross httplib; park them and abort the transfer
    http_request.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (token.isCancelled()) {
            return false;
        }
        if (status != 200) {
            error_body.append(data, length);
            return true;
        }
        try {
            parser.feed(std::string(data, length));
        } catch (...) {
            failure = std::current_exception();
            return false;
        }
        return true;
    };

    auto result = client.send(http_request);

    if (failure) {
        std::rethrow_exception(failure);
    }
    if (token.isCancelled()) {
        throw ServiceError(ErrorKind::CANCELLED, "Generation cancelled", parser.sawContent());
    }
    if (!result) {
        throw ServiceError(classifyTransportError(result.error()),
                           "Generation transport error: " + httplib::to_string(result.error()),
                           parser.sawContent());
    }
    if (status != 200) {
        throw errorFromResponse(status, error_body, "Generation service");
    }
    if (!parser.sawEnd()) {
        throw ServiceError(ErrorKind::SERVICE_UNAVAILABLE,
                           "Generation stream closed before message_stop", parser.sawContent());
    }
}

// =================================================================
// HttpSynthesisService
// =================================================================

HttpSynthesisService::HttpSynthesisService(const HttpEndpointConfig& config)
    : m_config(config) {
}

AudioBuffer HttpSynthesisService::synthesize(const SynthesisRequest& request, CancellationToken& token) {
    httplib::Client client(m_config.base_url);
    applyTimeouts(client, m_config);

    nlohmann::json body = {
        {"text", request.text},
        {"voice", request.voice},
        {"encoding", request.encoding},
        {"sample_rate", request.sample_rate}
    };

    AudioBuffer audio;
    std::string error_body;
    int status = 0;

    httplib::Request http_request;
    http_request.method = "POST";
    http_request.path = m_config.path;
    http_request.set_header("Content-Type", "application/json");
    http_request.body = body.dump();

    http_request.response_handler = [&status](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    http_request.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (token.isCancelled()) {
            return false;
        }
        if (status != 200) {
            error_body.append(data, length);
        } else {
            audio.insert(audio.end(), data, data + length);
        }
        return true;
    };

    auto result = client.send(http_request);

    if (token.isCancelled()) {
        throw ServiceError(ErrorKind::CANCELLED, "Synthesis cancelled");
    }
    if (!result) {
        throw ServiceError(classifyTransportError(result.error()),
                           "Synthesis transport error: " + httplib::to_string(result.error()));
    }
    if (status != 200) {
        throw errorFromResponse(status, error_body, "Synthesis service");
    }
    if (audio.empty()) {
        throw ServiceError(ErrorKind::SERVICE_UNAVAILABLE, "Synthesis service returned no audio");
    }
    return audio;
}

} // namespace Parley
