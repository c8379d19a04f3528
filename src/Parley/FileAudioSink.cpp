// =================================================================
// src/Parley/FileAudioSink.cpp
// =================================================================
// Audio sink writing raw chunks to a file.

#include "Parley/FileAudioSink.hpp"
#include "Parley/Logger.hpp"
#include <stdexcept>

namespace Parley {

FileAudioSink::FileAudioSink(const std::string& path)
    : m_path(path), m_out(path, std::ios::binary | std::ios::trunc) {
    if (!m_out.is_open()) {
        throw std::runtime_error("Cannot open audio output file: " + path);
    }
}

void FileAudioSink::writeAudio(size_t sequence, const AudioBuffer& audio) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out.write(reinterpret_cast<const char*>(audio.data()), static_cast<std::streamsize>(audio.size()));
    if (!m_out) {
        throw std::runtime_error("Failed writing audio to " + m_path);
    }
    m_out.flush();
    m_chunks++;
    m_bytes += audio.size();

    Logger::getInstance().debug("FileAudioSink",
        "Wrote segment " + std::to_string(sequence) + " (" + std::to_string(audio.size()) + " bytes)");
}

size_t FileAudioSink::chunksWritten() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_chunks;
}

size_t FileAudioSink::bytesWritten() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bytes;
}

} // namespace Parley
