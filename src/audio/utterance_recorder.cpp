#include "audio/utterance_recorder.hpp"

#include <iostream>
#include <utility>

namespace {

// Keeps the source open for one record() call and closes it on every exit path.
class SourceSession {
public:
    explicit SourceSession(FrameSource& source) : source_(source) { source_.open(); }
    ~SourceSession() { source_.close(); }

    SourceSession(const SourceSession&) = delete;
    SourceSession& operator=(const SourceSession&) = delete;

private:
    FrameSource& source_;
};

} // namespace

// Constructor
UtteranceRecorder::UtteranceRecorder(FrameSource& source, SilenceGate::Config config)
    : source_(source), config_(config) {}

UtteranceRecorder::Result UtteranceRecorder::record() {
    SourceSession session(source_);

    std::vector<float> utterance;
    SilenceGate::State state;

    std::cout << "[Audio] Recording started... Speak now!" << std::endl;

    while (true) {
        AudioFrame frame = source_.read();
        if (frame.overflowed) {
            std::cerr << "[Audio] [WARN] Buffer overflow" << std::endl;
        }

        utterance.insert(utterance.end(), frame.samples.begin(), frame.samples.end());

        const SilenceGate::Step step = SilenceGate::evaluate(frame, state, config_);
        state = step.state;

        Result result;
        result.durationMs = state.accumulatedMs;

        switch (step.decision) {
            case SilenceGate::Decision::Continue:
                continue;

            case SilenceGate::Decision::NoSpeechTimeout:
                std::cout << "[Audio] No speech detected (timeout)." << std::endl;
                result.outcome = Outcome::NoSpeech;
                return result;

            case SilenceGate::Decision::UtteranceComplete:
                std::cout << "[Audio] Silence detected. Recorded "
                          << state.accumulatedMs / 1000.0 << "s." << std::endl;
                result.outcome = Outcome::Completed;
                result.samples = std::move(utterance);
                return result;

            case SilenceGate::Decision::MaxDurationReached:
                std::cout << "[Audio] Max duration reached ("
                          << config_.maxRecordMs / 1000 << "s)." << std::endl;
                result.outcome = Outcome::MaxDurationReached;
                result.samples = std::move(utterance);
                return result;
        }
    }
}
