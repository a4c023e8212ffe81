#include "audio/silence_gate.hpp"

#include <algorithm>
#include <cmath>

float SilenceGate::rms(const float* x, int n) {
    double acc = 0.0;
    for (int i = 0; i < n; ++i) acc += (double)x[i] * (double)x[i];
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

SilenceGate::Step SilenceGate::evaluate(const AudioFrame& frame, const State& state, const Config& config) {
    State next = state;
    next.accumulatedMs += config.frameMs;

    const float energy = rms(frame.samples.data(), (int)frame.samples.size());
    if (energy >= config.silenceThreshold) {
        next.speechDetected = true;
        next.silenceRunMs = 0;
    } else {
        next.silenceRunMs += config.frameMs;
    }

    // First match wins.
    if (!next.speechDetected && next.accumulatedMs >= config.initialTimeoutMs) {
        return {Decision::NoSpeechTimeout, next};
    }
    if (next.speechDetected && next.silenceRunMs >= config.silenceTimeoutMs) {
        return {Decision::UtteranceComplete, next};
    }
    if (next.accumulatedMs >= config.maxRecordMs) {
        return {Decision::MaxDurationReached, next};
    }
    return {Decision::Continue, next};
}

const char* SilenceGate::toString(Decision decision) {
    switch (decision) {
        case Decision::Continue: return "continue";
        case Decision::UtteranceComplete: return "utterance complete";
        case Decision::NoSpeechTimeout: return "no speech timeout";
        case Decision::MaxDurationReached: return "max duration reached";
    }
    return "unknown";
}
