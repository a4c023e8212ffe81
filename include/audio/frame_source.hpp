#ifndef FRAME_SOURCE_HPP
#define FRAME_SOURCE_HPP

#include "audio/audio_frame.hpp"

#include <stdexcept>
#include <string>

// Microphone unavailable or broken. Aborts the current recording attempt.
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

// Pull-based source of fixed-size PCM frames.
//
// open() acquires the device and close() releases it; close() must not throw.
// read() blocks until one full frame is available and throws DeviceError on a
// hard failure.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual void open() = 0;
    virtual AudioFrame read() = 0;
    virtual void close() = 0;
};

#endif
