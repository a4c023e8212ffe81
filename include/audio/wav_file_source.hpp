#ifndef WAV_FILE_SOURCE_HPP
#define WAV_FILE_SOURCE_HPP

#include "audio/frame_source.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Replays a WAV file as if it came from the microphone. Each open() rewinds
// to the start. Past the end of the file frames are digital silence.
class WavFileSource : public FrameSource {
public:
    WavFileSource(std::string path, int sampleRate, int samplesPerFrame);

    void open() override;
    AudioFrame read() override;
    void close() override;

    bool isOpen() const { return open_; }

private:
    std::string path_;
    int sampleRate_;
    int samplesPerFrame_;

    bool open_ = false;
    std::vector<float> samples_;
    std::size_t position_ = 0;
};

#endif
