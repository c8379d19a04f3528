// =================================================================
// include/Parley/GenerationService.hpp
// =================================================================
// Interface for streaming text generation providers.

#pragma once

#include "Parley/TurnRequestBuilder.hpp"
#include "Parley/SentenceSegmenter.hpp"
#include "Parley/CancellationToken.hpp"
#include <functional>
#include <string>

namespace Parley {

using DeltaCallback = std::function<void(const StreamDelta&)>;

/**
 * @brief Abstract streaming generation service
 */
class GenerationService {
public:
    virtual ~GenerationService() = default;

    /**
     * @brief Stream a response for the request
     *
     * Calls `on_delta` with CONTENT deltas as text arrives and one END delta
     * when the stream completes. Returns after END.
     *
     * @param request Request to send (model and region already resolved)
     * @param on_delta Receives deltas in order on the calling thread
     * @param token Cancelled when the call hangs up
     * @throws ServiceError on any failure; `partialOutput()` is set when
     *         content had already been delivered to `on_delta`
     */
    virtual void streamGeneration(const GenerationRequest& request,
                                  const DeltaCallback& on_delta,
                                  CancellationToken& token) = 0;

    /**
     * @brief Service name for logs
     */
    virtual std::string getName() const = 0;
};

} // namespace Parley
