// =================================================================
// src/Parley/SynthesisDispatcher.cpp
// =================================================================
// Implementation of the synthesis dispatcher.

#include "Parley/SynthesisDispatcher.hpp"
#include "Parley/Logger.hpp"
#include <algorithm>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>

namespace Parley {

/**
 * @brief Mutable state of one dispatch, shared with its synthesis tasks
 */
struct SynthesisDispatcher::DispatchState {
    std::mutex mutex;
    std::condition_variable slot_cv;
    size_t in_flight = 0;

    std::map<size_t, std::optional<AudioBuffer>> completed;   ///< nullopt marks a failed segment
    size_t next_release = 1;
    size_t highest_received = 0;
    bool stream_done = false;      ///< END_OF_STREAM received
    bool stream_closed = false;    ///< No further segments will arrive

    std::chrono::steady_clock::time_point turn_start;
    DispatchReport report;
};

SynthesisDispatcher::SynthesisDispatcher(SynthesisService& service, AudioSink& sink,
                                         const DispatcherConfig& config, ResilienceLayer* resilience)
    : m_service(service), m_sink(sink), m_config(config), m_resilience(resilience) {
    if (m_config.max_concurrent == 0) {
        m_config.max_concurrent = 1;
    }
}

DispatchReport SynthesisDispatcher::dispatch(BoundedChannel<SegmentEvent>& segments,
                                             CancellationToken& token,
                                             std::chrono::steady_clock::time_point turn_start) {
    auto& logger = Logger::getInstance();

    DispatchState state;
    state.turn_start = turn_start;
    std::vector<std::future<void>> tasks;

    while (!token.isCancelled()) {
        // Bounded wait so a hangup is noticed while the producer is silent
        auto event = segments.popFor(std::chrono::milliseconds(50));
        if (!event) {
            if (segments.isDrained()) {
                logger.warning("SynthesisDispatcher", "Segment channel closed before end of stream");
                break;
            }
            continue;
        }

        if (event->isTerminal()) {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.stream_done = event->kind == SegmentKind::END_OF_STREAM;
            state.report.stream_error = event->kind == SegmentKind::ERROR;
            break;
        }

        const size_t sequence = event->sequence;
        const std::string text = event->text;

        {
            std::unique_lock<std::mutex> lock(state.mutex);
            state.report.received++;
            state.highest_received = std::max(state.highest_received, sequence);

            // Wait for a free synthesis slot; poll so a hangup is noticed
            while (state.in_flight >= m_config.max_concurrent && !token.isCancelled()) {
                state.slot_cv.wait_for(lock, std::chrono::milliseconds(20));
            }
            if (token.isCancelled()) {
                break;
            }
            state.in_flight++;
        }

        tasks.push_back(std::async(std::launch::async, [this, &state, &token, sequence, text]() {
            std::string error_message;
            auto audio = synthesizeText(text, token, error_message);

            std::lock_guard<std::mutex> lock(state.mutex);
            if (!audio) {
                state.report.failed++;
                state.report.failed_sequences.push_back(sequence);
                Logger::getInstance().warning("SynthesisDispatcher",
                    "Synthesis failed for segment " + std::to_string(sequence), error_message);
            }
            state.completed[sequence] = std::move(audio);
            state.in_flight--;
            releaseReady(state, token);
            state.slot_cv.notify_all();
        }));
    }

    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.stream_closed = true;
    }

    for (auto& task : tasks) {
        task.wait();
    }

    size_t terminal_failed = 0;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        terminal_failed = releaseReady(state, token);
    }

    if (terminal_failed != 0 && !token.isCancelled()) {
        logger.info("SynthesisDispatcher",
            "Final segment " + std::to_string(terminal_failed) + " failed, speaking fallback phrase");

        std::string error_message;
        auto audio = synthesizeText(m_config.fallback_phrase, token, error_message);

        std::lock_guard<std::mutex> lock(state.mutex);
        if (audio) {
            writeToSink(state, terminal_failed, *audio, token);
            state.report.fallback_used = true;
        } else {
            logger.error("SynthesisDispatcher", "Fallback phrase synthesis failed", error_message);
        }
        state.completed.erase(terminal_failed);
        state.next_release++;
    }

    std::lock_guard<std::mutex> lock(state.mutex);
    state.report.cancelled = token.isCancelled();

    logger.debug("SynthesisDispatcher",
        "Dispatch finished: received " + std::to_string(state.report.received) +
        ", delivered " + std::to_string(state.report.delivered) +
        ", failed " + std::to_string(state.report.failed));

    return state.report;
}

size_t SynthesisDispatcher::releaseReady(DispatchState& state, CancellationToken& token) {
    while (true) {
        auto it = state.completed.find(state.next_release);
        if (it == state.completed.end()) {
            return 0;
        }

        if (it->second) {
            writeToSink(state, state.next_release, *it->second, token);
        } else if (state.highest_received <= state.next_release) {
            // A failed segment with nothing after it yet may be the last one
            if (!state.stream_closed) {
                return 0;
            }
            if (state.stream_done && !token.isCancelled()) {
                return state.next_release;
            }
        }

        state.completed.erase(it);
        state.next_release++;
    }
}

void SynthesisDispatcher::writeToSink(DispatchState& state, size_t sequence, const AudioBuffer& audio,
                                      CancellationToken& token) {
    if (token.isCancelled()) {
        return;
    }

    try {
        m_sink.writeAudio(sequence, audio);
    } catch (const std::exception& e) {
        Logger::getInstance().error("SynthesisDispatcher",
            "Audio sink rejected segment " + std::to_string(sequence), e.what());
        return;
    }

    state.report.delivered++;
    if (!state.report.time_to_first_audio) {
        state.report.time_to_first_audio = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - state.turn_start);
    }
}

bool SynthesisDispatcher::speak(const std::string& text, size_t sequence, CancellationToken& token) {
    std::string error_message;
    auto audio = synthesizeText(text, token, error_message);
    if (!audio) {
        Logger::getInstance().error("SynthesisDispatcher", "Could not synthesize phrase", error_message);
        return false;
    }
    if (token.isCancelled()) {
        return false;
    }

    try {
        m_sink.writeAudio(sequence, *audio);
    } catch (const std::exception& e) {
        Logger::getInstance().error("SynthesisDispatcher", "Audio sink rejected phrase", e.what());
        return false;
    }
    return true;
}

std::optional<AudioBuffer> SynthesisDispatcher::synthesizeText(const std::string& text, CancellationToken& token,
                                                               std::string& error_message) {
    SynthesisRequest request;
    request.text = text;
    request.voice = m_config.voice;
    request.encoding = m_config.encoding;
    request.sample_rate = m_config.sample_rate;

    if (m_resilience) {
        AudioBuffer audio;
        ExecutionOptions options;
        options.allow_same_target_retry = true;

        RouteTarget target;
        target.model_id = m_config.endpoint_name;

        auto result = m_resilience->execute(target, {}, [&](const RouteTarget&) {
            audio = m_service.synthesize(request, token);
        }, token, options);

        if (!result.success) {
            error_message = errorKindToString(result.last_error) + ": " + result.error_message;
            return std::nullopt;
        }
        return audio;
    }

    try {
        return m_service.synthesize(request, token);
    } catch (const std::exception& e) {
        error_message = e.what();
        return std::nullopt;
    }
}

} // namespace Parley
