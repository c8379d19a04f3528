// =================================================================
// include/Parley/SynthesisDispatcher.hpp
// =================================================================
// Concurrent per-segment synthesis with in-order audio release.

#pragma once

#include "Parley/BoundedChannel.hpp"
#include "Parley/CancellationToken.hpp"
#include "Parley/ResilienceLayer.hpp"
#include "Parley/SentenceSegmenter.hpp"
#include "Parley/SynthesisService.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Parley {

/**
 * @brief Configuration for the synthesis dispatcher
 */
struct DispatcherConfig {
    size_t max_concurrent = 3;                       ///< Synthesis calls in flight at once
    std::string voice = "default";
    std::string encoding = "linear16";
    int sample_rate = 8000;
    std::string fallback_phrase = "Sorry, let me say that another way in a moment.";
    std::string endpoint_name = "synthesis";         ///< Breaker target for synthesis calls
};

/**
 * @brief What happened while dispatching one turn
 */
struct DispatchReport {
    size_t received = 0;                  ///< Segments received from the channel
    size_t delivered = 0;                 ///< Audio chunks written to the sink
    size_t failed = 0;                    ///< Segments whose synthesis failed
    std::vector<size_t> failed_sequences;
    bool fallback_used = false;           ///< Fallback phrase replaced the terminal segment
    bool stream_error = false;            ///< Segment stream ended with an error
    bool cancelled = false;
    std::optional<std::chrono::milliseconds> time_to_first_audio;
};

/**
 * @brief Synthesizes segments concurrently and releases audio in order
 *
 * Each segment is launched as soon as it is received, up to
 * `max_concurrent` at a time. Completed audio waits in a buffer until
 * every lower sequence number has been released. A failed segment is
 * skipped once a later segment exists; if the failed segment turns out to
 * be the last one of a completed stream, the fallback phrase is spoken in
 * its place.
 */
class SynthesisDispatcher {
public:
    /**
     * @brief Constructor
     * @param service Synthesis service
     * @param sink Audio destination
     * @param config Dispatcher configuration
     * @param resilience Optional resilience layer wrapping synthesis calls
     */
    SynthesisDispatcher(SynthesisService& service, AudioSink& sink,
                        const DispatcherConfig& config = DispatcherConfig(),
                        ResilienceLayer* resilience = nullptr);

    virtual ~SynthesisDispatcher() = default;

    /**
     * @brief Consume segment events until a terminal event or channel close
     * @param segments Channel fed by the segmenter
     * @param token Call cancellation; suppresses further launches and writes
     * @param turn_start Reference point for time to first audio
     * @return Dispatch report
     */
    virtual DispatchReport dispatch(BoundedChannel<SegmentEvent>& segments,
                                    CancellationToken& token,
                                    std::chrono::steady_clock::time_point turn_start = std::chrono::steady_clock::now());

    /**
     * @brief Synthesize a phrase and write it straight to the sink
     * @param text Phrase to speak
     * @param sequence Sequence number passed to the sink
     * @param token Call cancellation
     * @return True if the audio reached the sink
     */
    virtual bool speak(const std::string& text, size_t sequence, CancellationToken& token);

    const DispatcherConfig& getConfig() const { return m_config; }

private:
    struct DispatchState;

    SynthesisService& m_service;
    AudioSink& m_sink;
    DispatcherConfig m_config;
    ResilienceLayer* m_resilience;

    /**
     * @brief Synthesize through the resilience layer if present
     * @return Audio, or std::nullopt on failure
     */
    std::optional<AudioBuffer> synthesizeText(const std::string& text, CancellationToken& token,
                                              std::string& error_message);

    /**
     * @brief Release every buffered chunk that is next in order
     * @return Sequence of a terminal failed segment needing the fallback phrase, or 0
     *
     * Caller holds the state mutex.
     */
    size_t releaseReady(DispatchState& state, CancellationToken& token);

    /**
     * @brief Write one chunk unless the call was cancelled
     */
    void writeToSink(DispatchState& state, size_t sequence, const AudioBuffer& audio, CancellationToken& token);
};

} // namespace Parley
