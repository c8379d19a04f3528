// =================================================================
// include/Parley/SentenceSegmenter.hpp
// =================================================================
// Cuts a live text stream into sentences as soon as they are complete.

#pragma once

#include "Parley/Errors.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace Parley {

/**
 * @brief Type tag of an incremental stream delta
 */
enum class DeltaType {
    CONTENT,   ///< More response text
    END,       ///< Stream finished normally
    ERROR,     ///< Stream failed
    UNKNOWN    ///< Unrecognized event from the provider
};

/**
 * @brief One incremental delta of a generation stream
 */
struct StreamDelta {
    DeltaType type = DeltaType::CONTENT;
    std::string text;                           ///< Content text (CONTENT only)
    ErrorKind error_kind = ErrorKind::NONE;     ///< Failure kind (ERROR only)
    std::string error_message;                  ///< Failure detail (ERROR only)

    static StreamDelta content(const std::string& text);
    static StreamDelta end();
    static StreamDelta error(ErrorKind kind, const std::string& message);
};

/**
 * @brief Kind of event produced by the segmenter
 */
enum class SegmentKind {
    SENTENCE,          ///< Complete sentence
    FINAL_REMAINDER,   ///< Unterminated text left at stream end
    END_OF_STREAM,     ///< Terminal marker after a normal end
    ERROR              ///< Terminal marker after a failure
};

/**
 * @brief Event emitted by the segmenter
 *
 * SENTENCE and FINAL_REMAINDER events share one sequence counter starting
 * at 1. Terminal markers carry sequence 0.
 */
struct SegmentEvent {
    SegmentKind kind = SegmentKind::SENTENCE;
    size_t sequence = 0;
    std::string text;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;

    bool isSegment() const { return kind == SegmentKind::SENTENCE || kind == SegmentKind::FINAL_REMAINDER; }
    bool isTerminal() const { return kind == SegmentKind::END_OF_STREAM || kind == SegmentKind::ERROR; }
};

std::string segmentKindToString(SegmentKind kind);

using SegmentSink = std::function<void(const SegmentEvent&)>;

/**
 * @brief Single-pass sentence segmenter for one turn
 *
 * A boundary is `.`, `!` or `?`, optionally followed by closing quotes or
 * brackets, then whitespace and an uppercase letter, or the end of the
 * stream. A period after a known abbreviation is never a boundary.
 * Emitted text is not trimmed: whitespace between sentences stays at the
 * start of the following sentence.
 *
 * Not thread safe; one writer per instance.
 */
class SentenceSegmenter {
public:
    /**
     * @brief Constructor
     * @param sink Receives events in order
     * @param request_start Time the generation request was issued
     */
    explicit SentenceSegmenter(SegmentSink sink,
                               std::chrono::steady_clock::time_point request_start = std::chrono::steady_clock::now());

    /**
     * @brief Process one delta
     */
    void onDelta(const StreamDelta& delta);

    void onContent(const std::string& text);
    void onEnd();
    void onError(ErrorKind kind, const std::string& message);

    /**
     * @brief True once a terminal event has been emitted
     */
    bool isFinished() const { return m_finished; }

    bool hasFailed() const { return m_failed; }

    /**
     * @brief Number of SENTENCE and FINAL_REMAINDER events emitted
     */
    size_t emittedCount() const { return m_emitted; }

    /**
     * @brief Time from request start to the first content delta
     */
    std::optional<std::chrono::milliseconds> firstTokenLatency() const { return m_first_token_latency; }

    const std::string& buffer() const { return m_buffer; }

    static bool isAbbreviation(const std::string& word);

private:
    SegmentSink m_sink;
    std::chrono::steady_clock::time_point m_request_start;
    std::optional<std::chrono::milliseconds> m_first_token_latency;
    std::string m_buffer;
    size_t m_scan_from = 0;      ///< Resume offset of the boundary scan
    size_t m_emitted = 0;
    bool m_ended = false;
    bool m_finished = false;
    bool m_failed = false;

    void flushSentences(bool end_of_stream);

    /**
     * @brief Find the end (exclusive) of the first complete sentence
     * @return std::string::npos if no boundary is confirmed yet
     *
     * Resumes at the first terminator still waiting on more input, so each
     * delta only scans text that has not been settled.
     */
    size_t findBoundary(bool end_of_stream);

    bool precededByAbbreviation(size_t period_pos) const;
    void emitSegment(SegmentKind kind, const std::string& text);
    void fail(ErrorKind kind, const std::string& message);
};

} // namespace Parley
