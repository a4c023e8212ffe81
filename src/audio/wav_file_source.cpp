#include "audio/wav_file_source.hpp"
#include "audio/wav_codec.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

// Constructor
WavFileSource::WavFileSource(std::string path, int sampleRate, int samplesPerFrame)
    : path_(std::move(path)), sampleRate_(sampleRate), samplesPerFrame_(samplesPerFrame) {}

void WavFileSource::open() {
    WavClip clip;
    try {
        clip = readWavFile(path_);
    } catch (const WavFormatError& e) {
        throw DeviceError(e.what());
    }

    if (clip.sampleRate != sampleRate_) {
        throw DeviceError("'" + path_ + "' is " + std::to_string(clip.sampleRate) +
                          " Hz, expected " + std::to_string(sampleRate_) + " Hz");
    }

    std::cout << "[Audio] Replaying " << path_ << " (" << clip.samples.size() << " samples)" << std::endl;

    samples_ = std::move(clip.samples);
    position_ = 0;
    open_ = true;
}

AudioFrame WavFileSource::read() {
    if (!open_) throw DeviceError("read() on a closed file source");

    AudioFrame frame;
    frame.samples.assign(samplesPerFrame_, 0.0f);

    const std::size_t available = samples_.size() - std::min(position_, samples_.size());
    const std::size_t n = std::min(available, (std::size_t)samplesPerFrame_);
    std::copy(samples_.begin() + position_, samples_.begin() + position_ + n, frame.samples.begin());
    position_ += n;
    return frame;
}

void WavFileSource::close() {
    open_ = false;
    samples_.clear();
    position_ = 0;
}
