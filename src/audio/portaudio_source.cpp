#include "audio/portaudio_source.hpp"
#include "audio/wav_codec.hpp"

#include <iostream>
#include <string>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw DeviceError(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Constructor
PortAudioSource::PortAudioSource(int sampleRate, int channels, int samplesPerFrame)
    : sampleRate_(sampleRate), channels_(channels), samplesPerFrame_(samplesPerFrame) {}

// Destructor
PortAudioSource::~PortAudioSource() { close(); }

// Initializes PortAudio and starts a capture stream on the default input device
void PortAudioSource::open() {
    if (stream_) return;

    pa_check(Pa_Initialize(), "Pa_Initialize");
    initialized_ = true;

    try {
        PaStreamParameters inParams{};
        inParams.device = Pa_GetDefaultInputDevice();
        if (inParams.device == paNoDevice) {
            throw DeviceError("No default input device");
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
        std::cout << "[Audio] Input device: " << (info ? info->name : "(unknown)") << std::endl;

        inParams.channelCount = channels_;
        inParams.sampleFormat = paFloat32;
        inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
        inParams.hostApiSpecificStreamInfo = nullptr;

        pa_check(
            Pa_OpenStream(&stream_, &inParams, nullptr,
                          sampleRate_, paFramesPerBufferUnspecified,
                          paNoFlag, nullptr, nullptr),
            "Pa_OpenStream"
        );

        pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    } catch (...) {
        close();
        throw;
    }
}

// Blocks until one full frame has been captured
AudioFrame PortAudioSource::read() {
    if (!stream_) throw DeviceError("read() on a closed input stream");

    std::vector<float> interleaved((size_t)samplesPerFrame_ * channels_);

    AudioFrame frame;
    const PaError e = Pa_ReadStream(stream_, interleaved.data(), samplesPerFrame_);
    if (e == paInputOverflowed) {
        frame.overflowed = true;
    } else {
        pa_check(e, "Pa_ReadStream");
    }
    frame.samples = downmixToMono(interleaved, channels_);
    return frame;
}

// Stops and releases the stream; safe to call more than once
void PortAudioSource::close() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}
