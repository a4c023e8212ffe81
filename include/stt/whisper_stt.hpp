#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/transcription_service.hpp"

#include <string>
#include <vector>

struct whisper_context;

class WhisperSTT : public TranscriptionService {
public:
    struct Config {
        std::string modelPath = "models/ggml-medium.bin";
        int threads = 4;
        bool useGpu = false;
        float noSpeechThreshold = 0.6f;
        int beamSize = 1;                // 1 selects greedy decoding
        std::string vadModelPath;        // empty leaves voice activity filtering off
        int vadMinSilenceMs = 2000;
    };

    // Loads the model; throws TranscriptionError if it cannot be read.
    explicit WhisperSTT(Config config);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::vector<TranscriptSegment> transcribe(const std::vector<uint8_t>& wav,
                                              const std::string& languageCode,
                                              const std::string& dialectHint) override;

private:
    Config config_;
    whisper_context* context_ = nullptr;
};

#endif
