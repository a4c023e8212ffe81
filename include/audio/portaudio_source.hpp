#ifndef PORTAUDIO_SOURCE_HPP
#define PORTAUDIO_SOURCE_HPP

#include "audio/frame_source.hpp"

#include <portaudio.h>

// Default input device through the PortAudio blocking read API, float32.
// Multi-channel capture is downmixed so every frame is mono.
class PortAudioSource : public FrameSource {
public:
    PortAudioSource(int sampleRate, int channels, int samplesPerFrame);
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    void open() override;
    AudioFrame read() override;
    void close() override;

private:
    int sampleRate_;
    int channels_;
    int samplesPerFrame_;

    bool initialized_ = false;
    PaStream* stream_ = nullptr;
};

#endif
