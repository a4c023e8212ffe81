#include "stt/whisper_stt.hpp"
#include "audio/wav_codec.hpp"

#include <whisper.h>

#include <algorithm>
#include <cmath>
#include <utility>

static std::vector<float> resample_linear(const std::vector<float>& in, int srIn, int srOut) {
    if (srIn <= 0 || srOut <= 0 || in.empty() || srIn == srOut) return in;
    const double ratio = (double)srOut / (double)srIn;
    const size_t nOut = (size_t)std::max<long long>(1, std::llround((double)in.size() * ratio));
    std::vector<float> out(nOut);
    for (size_t i = 0; i < nOut; ++i) {
        const double pos = (double)i / ratio;
        const size_t i0 = std::min((size_t)std::floor(pos), in.size() - 1);
        const size_t i1 = std::min(i0 + 1, in.size() - 1);
        const double t = pos - (double)i0;
        out[i] = (float)((1.0 - t) * (double)in[i0] + t * (double)in[i1]);
    }
    return out;
}

// Constructor
WhisperSTT::WhisperSTT(Config config) : config_(std::move(config)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.useGpu;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!context_) throw TranscriptionError("whisper_init_from_file_with_params failed: " + config_.modelPath);
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

// Decodes the WAV blob and runs the decoder in the requested language
std::vector<TranscriptSegment> WhisperSTT::transcribe(const std::vector<uint8_t>& wav,
                                                      const std::string& languageCode,
                                                      const std::string& dialectHint) {
    const WavClip clip = decodeWav(wav);
    if (clip.samples.empty()) return {};

    const std::vector<float> pcm = resample_linear(clip.samples, clip.sampleRate, WHISPER_SAMPLE_RATE);

    whisper_full_params params = whisper_full_default_params(
        config_.beamSize > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);
    if (config_.beamSize > 1) params.beam_search.beam_size = config_.beamSize;

    params.n_threads = config_.threads;
    params.language = languageCode.c_str();
    params.translate = false;
    params.no_context = true;
    params.initial_prompt = dialectHint.empty() ? nullptr : dialectHint.c_str();

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    params.no_speech_thold = config_.noSpeechThreshold;

    if (!config_.vadModelPath.empty()) {
        params.vad = true;
        params.vad_model_path = config_.vadModelPath.c_str();
        params.vad_params.min_silence_duration_ms = config_.vadMinSilenceMs;
    }

    const int rc = whisper_full(context_, params, pcm.data(), (int)pcm.size());
    if (rc != 0) throw TranscriptionError("whisper_full failed (" + std::to_string(rc) + ")");

    std::vector<TranscriptSegment> segments;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(context_, i);
        segments.push_back({text ? text : ""});
    }
    return segments;
}
