// =================================================================
// include/Parley/FileAudioSink.hpp
// =================================================================
// Audio sink that appends raw audio to a file.

#pragma once

#include "Parley/SynthesisService.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace Parley {

class FileAudioSink : public AudioSink {
public:
    /**
     * @brief Open (and truncate) the output file
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit FileAudioSink(const std::string& path);

    void writeAudio(size_t sequence, const AudioBuffer& audio) override;

    size_t chunksWritten() const;
    size_t bytesWritten() const;

private:
    std::string m_path;
    std::ofstream m_out;
    size_t m_chunks = 0;
    size_t m_bytes = 0;
    mutable std::mutex m_mutex;
};

} // namespace Parley
