#ifndef UTTERANCE_RECORDER_HPP
#define UTTERANCE_RECORDER_HPP

#include "audio/frame_source.hpp"
#include "audio/silence_gate.hpp"

#include <vector>

class UtteranceRecorder {
public:
    enum class Outcome {
        Completed,
        MaxDurationReached,
        NoSpeech
    };

    struct Result {
        Outcome outcome = Outcome::NoSpeech;
        std::vector<float> samples;
        int durationMs = 0;

        bool hasUtterance() const { return outcome != Outcome::NoSpeech; }
    };

    UtteranceRecorder(FrameSource& source, SilenceGate::Config config);

    // Blocks until the gate ends the attempt. The source is open only for the
    // duration of this call. Throws DeviceError if the device fails.
    Result record();

    const SilenceGate::Config& config() const { return config_; }

private:
    FrameSource& source_;
    SilenceGate::Config config_;
};

#endif
