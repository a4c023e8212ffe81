#ifndef SILENCE_GATE_HPP
#define SILENCE_GATE_HPP

#include "audio/audio_frame.hpp"

// Energy-threshold utterance gate.
//
// evaluate() is a pure function of (frame, state, config): it folds one frame
// into the running state and says whether the recording attempt goes on.
class SilenceGate {
public:
    struct Config {
        float silenceThreshold = 0.003f;   // RMS below this is silence

        int frameMs = 500;
        int silenceTimeoutMs = 3500;
        int maxRecordMs = 120000;
        int initialTimeoutMs = 15000;
    };

    enum class Decision {
        Continue,
        UtteranceComplete,
        NoSpeechTimeout,
        MaxDurationReached
    };

    struct State {
        int accumulatedMs = 0;
        int silenceRunMs = 0;
        bool speechDetected = false;
    };

    struct Step {
        Decision decision;
        State state;
    };

    static Step evaluate(const AudioFrame& frame, const State& state, const Config& config);

    static float rms(const float* x, int n);

    static const char* toString(Decision decision);
};

#endif
