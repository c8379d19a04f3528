// =================================================================
// src/Parley/SentenceSegmenter.cpp
// =================================================================
// Implementation of the streaming sentence segmenter.

#include "Parley/SentenceSegmenter.hpp"
#include "Parley/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace Parley {

namespace {

bool isTerminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool isCloser(char c) {
    return c == '"' || c == '\'' || c == ')' || c == ']';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isUpper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

} // namespace

StreamDelta StreamDelta::content(const std::string& text) {
    StreamDelta delta;
    delta.type = DeltaType::CONTENT;
    delta.text = text;
    return delta;
}

StreamDelta StreamDelta::end() {
    StreamDelta delta;
    delta.type = DeltaType::END;
    return delta;
}

StreamDelta StreamDelta::error(ErrorKind kind, const std::string& message) {
    StreamDelta delta;
    delta.type = DeltaType::ERROR;
    delta.error_kind = kind;
    delta.error_message = message;
    return delta;
}

std::string segmentKindToString(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::SENTENCE: return "sentence";
        case SegmentKind::FINAL_REMAINDER: return "final_remainder";
        case SegmentKind::END_OF_STREAM: return "end_of_stream";
        case SegmentKind::ERROR: return "error";
        default: return "unknown";
    }
}

SentenceSegmenter::SentenceSegmenter(SegmentSink sink, std::chrono::steady_clock::time_point request_start)
    : m_sink(std::move(sink)), m_request_start(request_start) {
}

bool SentenceSegmenter::isAbbreviation(const std::string& word) {
    static const std::set<std::string> abbreviations = {
        "mr.", "mrs.", "ms.", "dr.", "st.", "vs.", "e.g.", "i.e."
    };
    std::string lower = word;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return abbreviations.count(lower) > 0;
}

void SentenceSegmenter::onDelta(const StreamDelta& delta) {
    switch (delta.type) {
        case DeltaType::CONTENT:
            onContent(delta.text);
            break;
        case DeltaType::END:
            onEnd();
            break;
        case DeltaType::ERROR:
            onError(delta.error_kind, delta.error_message);
            break;
        default:
            if (!m_failed) {
                fail(ErrorKind::SEGMENTATION_ERROR, "Unknown stream delta type");
            }
            break;
    }
}

void SentenceSegmenter::onContent(const std::string& text) {
    if (m_failed) {
        return;
    }
    if (m_ended) {
        fail(ErrorKind::SEGMENTATION_ERROR, "Content received after end of stream");
        return;
    }

    if (!m_first_token_latency) {
        m_first_token_latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_request_start);
    }

    m_buffer += text;
    flushSentences(false);
}

void SentenceSegmenter::onEnd() {
    if (m_failed || m_ended) {
        return;
    }
    m_ended = true;

    flushSentences(true);

    bool has_text = std::any_of(m_buffer.begin(), m_buffer.end(), [](char c) { return !isSpace(c); });
    if (has_text) {
        emitSegment(SegmentKind::FINAL_REMAINDER, m_buffer);
    }
    m_buffer.clear();
    m_scan_from = 0;

    m_finished = true;
    SegmentEvent event;
    event.kind = SegmentKind::END_OF_STREAM;
    m_sink(event);
}

void SentenceSegmenter::onError(ErrorKind kind, const std::string& message) {
    if (m_failed || m_ended) {
        return;
    }
    fail(kind, message);
}

void SentenceSegmenter::flushSentences(bool end_of_stream) {
    size_t end = findBoundary(end_of_stream);
    while (end != std::string::npos) {
        emitSegment(SegmentKind::SENTENCE, m_buffer.substr(0, end));
        m_buffer.erase(0, end);
        m_scan_from = 0;
        end = findBoundary(end_of_stream);
    }
}

size_t SentenceSegmenter::findBoundary(bool end_of_stream) {
    const size_t size = m_buffer.size();

    // Terminators before m_scan_from were already rejected for good
    for (size_t i = m_scan_from; i < size; ++i) {
        if (!isTerminator(m_buffer[i])) {
            continue;
        }

        size_t end = i + 1;
        while (end < size && isCloser(m_buffer[end])) {
            end++;
        }

        if (end == size) {
            // Punctuation at the very end: only the stream end confirms it
            if (end_of_stream) {
                return end;
            }
            m_scan_from = i;
            return std::string::npos;
        }

        if (!isSpace(m_buffer[end])) {
            continue;
        }

        size_t next = end;
        while (next < size && isSpace(m_buffer[next])) {
            next++;
        }

        if (next == size) {
            if (end_of_stream) {
                return end;
            }
            // The next word has not arrived yet
            m_scan_from = i;
            return std::string::npos;
        }

        if (!isUpper(m_buffer[next])) {
            continue;
        }

        if (m_buffer[i] == '.' && precededByAbbreviation(i)) {
            continue;
        }

        return end;
    }

    m_scan_from = size;
    return std::string::npos;
}

bool SentenceSegmenter::precededByAbbreviation(size_t period_pos) const {
    size_t start = period_pos;
    while (start > 0 && !isSpace(m_buffer[start - 1])) {
        start--;
    }
    return isAbbreviation(m_buffer.substr(start, period_pos - start + 1));
}

void SentenceSegmenter::emitSegment(SegmentKind kind, const std::string& text) {
    SegmentEvent event;
    event.kind = kind;
    event.sequence = ++m_emitted;
    event.text = text;
    m_sink(event);
}

void SentenceSegmenter::fail(ErrorKind kind, const std::string& message) {
    m_failed = true;
    m_finished = true;
    m_buffer.clear();
    m_scan_from = 0;

    Logger::getInstance().warning("SentenceSegmenter",
        "Stream terminated: " + errorKindToString(kind), message);

    SegmentEvent event;
    event.kind = SegmentKind::ERROR;
    event.error_kind = kind;
    event.error_message = message;
    m_sink(event);
}

} // namespace Parley
