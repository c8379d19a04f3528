// =================================================================
// include/Parley/SynthesisService.hpp
// =================================================================
// Interfaces for speech synthesis and audio output.

#pragma once

#include "Parley/CancellationToken.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Parley {

using AudioBuffer = std::vector<uint8_t>;

/**
 * @brief Text segment plus voice parameters
 */
struct SynthesisRequest {
    std::string text;
    std::string voice = "default";
    std::string encoding = "linear16";
    int sample_rate = 8000;
};

/**
 * @brief Abstract text-to-speech service
 */
class SynthesisService {
public:
    virtual ~SynthesisService() = default;

    /**
     * @brief Synthesize one segment
     * @return Raw audio bytes in the requested encoding
     * @throws ServiceError on failure
     */
    virtual AudioBuffer synthesize(const SynthesisRequest& request, CancellationToken& token) = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Destination for ordered audio chunks
 *
 * Implementations are called from one thread at a time, always in
 * increasing sequence order.
 */
class AudioSink {
public:
    virtual ~AudioSink() = default;

    /**
     * @brief Write one segment's audio
     * @param sequence Segment sequence number
     * @param audio Raw audio bytes
     */
    virtual void writeAudio(size_t sequence, const AudioBuffer& audio) = 0;
};

} // namespace Parley
