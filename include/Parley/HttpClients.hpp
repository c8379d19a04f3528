// =================================================================
// include/Parley/HttpClients.hpp
// =================================================================
// HTTP implementations of the generation and synthesis services.

#pragma once

#include "Parley/GenerationService.hpp"
#include "Parley/SynthesisService.hpp"
#include <string>

namespace Parley {

/**
 * @brief Endpoint settings shared by the HTTP clients
 *
 * `{region}` in base_url is replaced with the target region, e.g.
 * "https://{region}.generation.internal".
 */
struct HttpEndpointConfig {
    std::string base_url = "http://localhost:8080";
    std::string path = "/v1/messages";
    int timeout_ms = 10000;             ///< Read timeout
    int connect_timeout_ms = 2000;
};

/**
 * @brief Generation over a server-sent-events messages API
 *
 * Consumes `content_block_delta` text deltas, `message_stop` and `error`
 * events; other events are ignored.
 */
class HttpGenerationService : public GenerationService {
public:
    explicit HttpGenerationService(const HttpEndpointConfig& config);

    void streamGeneration(const GenerationRequest& request,
                          const DeltaCallback& on_delta,
                          CancellationToken& token) override;

    std::string getName() const override { return "http-generation"; }

    /**
     * @brief Resolve the base URL for a region
     */
    std::string resolveBaseUrl(const std::string& region) const;

private:
    HttpEndpointConfig m_config;
};

/**
 * @brief Synthesis over a JSON request / raw audio response API
 */
class HttpSynthesisService : public SynthesisService {
public:
    explicit HttpSynthesisService(const HttpEndpointConfig& config);

    AudioBuffer synthesize(const SynthesisRequest& request, CancellationToken& token) override;

    std::string getName() const override { return "http-synthesis"; }

private:
    HttpEndpointConfig m_config;
};

/**
 * @brief Parser for one server-sent-events generation stream
 *
 * Fed raw body chunks; forwards deltas as complete `data:` lines arrive.
 */
class SseStreamParser {
public:
    explicit SseStreamParser(const DeltaCallback& on_delta);

    /**
     * @brief Consume a chunk of the response body
     * @throws ServiceError for provider error events or malformed data
     */
    void feed(const std::string& chunk);

    bool sawContent() const { return m_saw_content; }
    bool sawEnd() const { return m_saw_end; }

private:
    DeltaCallback m_on_delta;
    std::string m_pending;
    bool m_saw_content = false;
    bool m_saw_end = false;

    void handleLine(const std::string& line);
};

} // namespace Parley
